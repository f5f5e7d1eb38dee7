#pragma once

#include <QString>
#include <memory>
#include <vector>

#include "icalendar/model/ComponentType.hpp"
#include "icalendar/model/Property.hpp"

namespace icalendar {
namespace model {

// A BEGIN/END block. Children are owned by their parent; the back reference
// to the parent is weak. Properties keep their file order, duplicates
// included.
class Component
{
public:
    explicit Component(const QString &typeName);

    ComponentType type() const;
    const QString &typeName() const;

    std::shared_ptr<const Component> parent() const;
    bool isRoot() const;

    const std::vector<Property> &properties() const;
    std::vector<const Property *> propertiesNamed(const QString &name) const;
    const Property *property(const QString &name, int index = 0) const;
    bool hasProperty(const QString &name) const;

    // Typed value of the index-th property called name, converted lazily.
    // nullptr when there is no such property; throws ConversionError when
    // the property does not convert.
    const PropertyValue *typedValue(const QString &name, int index = 0) const;

    std::vector<std::shared_ptr<const Component>> children() const;
    std::vector<std::shared_ptr<const Component>> childrenOfType(ComponentType type) const;
    std::vector<std::shared_ptr<const Component>> childrenNamed(const QString &typeName) const;

    QString uid() const;
    QString summary() const;

    void addProperty(Property property);
    static void appendChild(const std::shared_ptr<Component> &parent, std::shared_ptr<Component> child);

private:
    ComponentType m_type;
    QString m_typeName;
    std::vector<Property> m_properties;
    std::vector<std::shared_ptr<Component>> m_children;
    std::weak_ptr<Component> m_parent;
};

} // namespace model
} // namespace icalendar
