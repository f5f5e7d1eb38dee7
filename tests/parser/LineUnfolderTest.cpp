#include <QtTest/QtTest>

#include "icalendar/parser/LineUnfolder.hpp"

using namespace icalendar;

class LineUnfolderTest : public QObject
{
    Q_OBJECT

private slots:
    void joinsContinuationLines();
    void handlesCrLfAndBom();
    void reportsStartingLineNumbers();
    void strayContinuationStartsNewLine();
};

void LineUnfolderTest::joinsContinuationLines()
{
    const QString text = QStringLiteral("DESCRIPTION:This is a lo\n ng description\n\tthat goes on\nSUMMARY:x\n");
    const QStringList lines = parser::LineUnfolder::unfold(text);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines.at(0), QStringLiteral("DESCRIPTION:This is a long descriptionthat goes on"));
    QCOMPARE(lines.at(1), QStringLiteral("SUMMARY:x"));
}

void LineUnfolderTest::handlesCrLfAndBom()
{
    QString text = QStringLiteral("BEGIN:VCALENDAR\r\nSUMMARY:a\r\n  b\r\n\r\nEND:VCALENDAR\r\n");
    text.prepend(QChar(0xFEFF));
    const QStringList lines = parser::LineUnfolder::unfold(text);
    QCOMPARE(lines, QStringList({ QStringLiteral("BEGIN:VCALENDAR"), QStringLiteral("SUMMARY:a b"),
                                  QStringLiteral("END:VCALENDAR") }));
}

void LineUnfolderTest::reportsStartingLineNumbers()
{
    parser::LineUnfolder unfolder(QStringLiteral("A:1\n continued\n\nB:2"));
    auto first = unfolder.next();
    QVERIFY(first.has_value());
    QCOMPARE(first->lineNumber, 1);
    auto second = unfolder.next();
    QVERIFY(second.has_value());
    QCOMPARE(second->text, QStringLiteral("B:2"));
    QCOMPARE(second->lineNumber, 4);
    QVERIFY(!unfolder.next().has_value());
    QVERIFY(unfolder.atEnd());
}

void LineUnfolderTest::strayContinuationStartsNewLine()
{
    const QStringList lines = parser::LineUnfolder::unfold(QStringLiteral(" X:1\nY:2"));
    QCOMPARE(lines, QStringList({ QStringLiteral("X:1"), QStringLiteral("Y:2") }));
}

QTEST_GUILESS_MAIN(LineUnfolderTest)
#include "LineUnfolderTest.moc"
