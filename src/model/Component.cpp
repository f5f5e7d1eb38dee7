#include "icalendar/model/Component.hpp"

#include "icalendar/model/ValueParser.hpp"

namespace icalendar {
namespace model {

Component::Component(const QString &typeName)
    : m_type(componentTypeFromName(typeName))
    , m_typeName(typeName.trimmed().toUpper())
{
}

ComponentType Component::type() const
{
    return m_type;
}

const QString &Component::typeName() const
{
    return m_typeName;
}

std::shared_ptr<const Component> Component::parent() const
{
    return m_parent.lock();
}

bool Component::isRoot() const
{
    return m_parent.expired();
}

const std::vector<Property> &Component::properties() const
{
    return m_properties;
}

std::vector<const Property *> Component::propertiesNamed(const QString &name) const
{
    const QString key = name.toUpper();
    std::vector<const Property *> result;
    for (const Property &property : m_properties) {
        if (property.name() == key) {
            result.push_back(&property);
        }
    }
    return result;
}

const Property *Component::property(const QString &name, int index) const
{
    const QString key = name.toUpper();
    int seen = 0;
    for (const Property &property : m_properties) {
        if (property.name() != key) {
            continue;
        }
        if (seen == index) {
            return &property;
        }
        ++seen;
    }
    return nullptr;
}

bool Component::hasProperty(const QString &name) const
{
    return property(name) != nullptr;
}

const PropertyValue *Component::typedValue(const QString &name, int index) const
{
    const Property *found = property(name, index);
    if (!found) {
        return nullptr;
    }
    return &found->typedValue();
}

std::vector<std::shared_ptr<const Component>> Component::children() const
{
    return { m_children.begin(), m_children.end() };
}

std::vector<std::shared_ptr<const Component>> Component::childrenOfType(ComponentType type) const
{
    std::vector<std::shared_ptr<const Component>> result;
    for (const auto &child : m_children) {
        if (child->type() == type) {
            result.push_back(child);
        }
    }
    return result;
}

std::vector<std::shared_ptr<const Component>> Component::childrenNamed(const QString &typeName) const
{
    const QString key = typeName.trimmed().toUpper();
    std::vector<std::shared_ptr<const Component>> result;
    for (const auto &child : m_children) {
        if (child->typeName() == key) {
            result.push_back(child);
        }
    }
    return result;
}

QString Component::uid() const
{
    const Property *found = property(QStringLiteral("UID"));
    return found ? unescapeText(found->rawValue()) : QString();
}

QString Component::summary() const
{
    const Property *found = property(QStringLiteral("SUMMARY"));
    return found ? unescapeText(found->rawValue()) : QString();
}

void Component::addProperty(Property property)
{
    m_properties.push_back(std::move(property));
}

void Component::appendChild(const std::shared_ptr<Component> &parent, std::shared_ptr<Component> child)
{
    if (!parent || !child) {
        return;
    }
    child->m_parent = parent;
    parent->m_children.push_back(std::move(child));
}

} // namespace model
} // namespace icalendar
