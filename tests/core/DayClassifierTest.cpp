#include <QtTest/QtTest>

#include "vacationplaner/core/DateUtils.hpp"
#include "vacationplaner/core/DayClassifier.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

using namespace vacationplaner;
using namespace vacationplaner::core;

namespace {

data::HolidayConfig christmasHolidays()
{
    data::HolidayConfig config;
    config.region = QStringLiteral("TG");
    config.year = 2025;
    config.holidays.push_back({QDate(2025, 12, 25), QStringLiteral("Christmas")});
    config.holidays.push_back({QDate(2025, 12, 26), QStringLiteral("St. Stephen's Day")});
    return config;
}

data::VacationConfig vacationWith(std::vector<data::VacationBlock> blocks)
{
    data::VacationConfig config;
    config.firstName = QStringLiteral("Anna");
    config.lastName = QStringLiteral("Muster");
    config.year = 2025;
    config.region = QStringLiteral("TG");
    for (size_t i = 0; i < blocks.size(); ++i) {
        blocks[i].id = static_cast<int>(i);
    }
    config.vacationBlocks = std::move(blocks);
    return config;
}

data::VacationBlock makeBlock(const QDate &start, const QDate &end, const QString &description)
{
    data::VacationBlock block;
    block.start = start;
    block.end = end;
    block.description = description;
    return block;
}

} // namespace

class DayClassifierTest : public QObject
{
    Q_OBJECT

private slots:
    void classifiesChristmasWeek_data();
    void classifiesChristmasWeek();
    void holidayWinsOverWeekend();
    void weekendInsideBlockStaysWeekend();
    void firstMatchingBlockWins();
    void firstMatchingHolidayWins();
    void singleDayBlock();
    void paddingCellIsBlank();
    void precedenceHoldsForWholeYear();
    void typeNames();
};

void DayClassifierTest::classifiesChristmasWeek_data()
{
    QTest::addColumn<QDate>("date");
    QTest::addColumn<int>("type");
    QTest::addColumn<QString>("description");
    QTest::addColumn<int>("blockId");

    const int none = -1;
    QTest::newRow("monday") << QDate(2025, 12, 22) << int(DayType::Vacation) << QStringLiteral("Christmas break") << 0;
    QTest::newRow("tuesday") << QDate(2025, 12, 23) << int(DayType::Vacation) << QStringLiteral("Christmas break") << 0;
    QTest::newRow("wednesday") << QDate(2025, 12, 24) << int(DayType::Vacation) << QStringLiteral("Christmas break") << 0;
    QTest::newRow("christmas") << QDate(2025, 12, 25) << int(DayType::Holiday) << QStringLiteral("Christmas") << none;
    QTest::newRow("st stephen") << QDate(2025, 12, 26) << int(DayType::Holiday) << QStringLiteral("St. Stephen's Day") << none;
    QTest::newRow("saturday") << QDate(2025, 12, 27) << int(DayType::Weekend) << QString() << none;
    QTest::newRow("sunday") << QDate(2025, 12, 28) << int(DayType::Weekend) << QString() << none;
    QTest::newRow("after block") << QDate(2025, 12, 29) << int(DayType::Weekday) << QString() << none;
}

void DayClassifierTest::classifiesChristmasWeek()
{
    QFETCH(QDate, date);
    QFETCH(int, type);
    QFETCH(QString, description);
    QFETCH(int, blockId);

    const auto holidays = christmasHolidays();
    const auto vacation = vacationWith(
        {makeBlock(QDate(2025, 12, 22), QDate(2025, 12, 28), QStringLiteral("Christmas break"))});

    const DayClassification result = classify(date, holidays, vacation);
    QCOMPARE(int(result.type), type);
    QCOMPARE(result.display, QString::number(date.day()));
    QCOMPARE(result.description.value_or(QString()), description);
    QCOMPARE(result.vacationBlockId.value_or(-1), blockId);
}

void DayClassifierTest::holidayWinsOverWeekend()
{
    data::HolidayConfig holidays;
    holidays.year = 2025;
    holidays.holidays.push_back({QDate(2025, 11, 1), QStringLiteral("All Saints")}); // Saturday
    const auto vacation = vacationWith({});

    const auto result = classify(QDate(2025, 11, 1), holidays, vacation);
    QCOMPARE(result.type, DayType::Holiday);
    QCOMPARE(*result.description, QStringLiteral("All Saints"));
}

void DayClassifierTest::weekendInsideBlockStaysWeekend()
{
    const auto vacation = vacationWith(
        {makeBlock(QDate(2025, 1, 1), QDate(2025, 1, 10), QStringLiteral("Ski week"))});
    const data::HolidayConfig holidays;

    const auto saturday = classify(QDate(2025, 1, 4), holidays, vacation);
    QCOMPARE(saturday.type, DayType::Weekend);
    QVERIFY(!saturday.description.has_value());
    QVERIFY(!saturday.vacationBlockId.has_value());

    QVERIFY(isInVacationBlock(QDate(2025, 1, 4), vacation));
}

void DayClassifierTest::firstMatchingBlockWins()
{
    const auto vacation = vacationWith({makeBlock(QDate(2025, 1, 1), QDate(2025, 1, 10), QStringLiteral("First")),
                                        makeBlock(QDate(2025, 1, 6), QDate(2025, 1, 15), QStringLiteral("Second"))});
    const data::HolidayConfig holidays;

    const auto overlap = classify(QDate(2025, 1, 7), holidays, vacation);
    QCOMPARE(overlap.type, DayType::Vacation);
    QCOMPARE(*overlap.description, QStringLiteral("First"));
    QCOMPARE(*overlap.vacationBlockId, 0);

    const auto secondOnly = classify(QDate(2025, 1, 13), holidays, vacation);
    QCOMPARE(*secondOnly.description, QStringLiteral("Second"));
    QCOMPARE(*secondOnly.vacationBlockId, 1);

    QCOMPARE(findVacationBlock(QDate(2025, 1, 7), vacation)->id, 0);
    QVERIFY(findVacationBlock(QDate(2025, 1, 16), vacation) == nullptr);
}

void DayClassifierTest::firstMatchingHolidayWins()
{
    data::HolidayConfig holidays;
    holidays.year = 2025;
    holidays.holidays.push_back({QDate(2025, 8, 1), QStringLiteral("National Day")});
    holidays.holidays.push_back({QDate(2025, 8, 1), QStringLiteral("Duplicate")});

    const auto result = classify(QDate(2025, 8, 1), holidays, vacationWith({}));
    QCOMPARE(*result.description, QStringLiteral("National Day"));
    QVERIFY(isHoliday(QDate(2025, 8, 1), holidays));
    QVERIFY(!isHoliday(QDate(2025, 8, 2), holidays));
    QVERIFY(findHoliday(QDate(2025, 8, 4), holidays) == nullptr);
}

void DayClassifierTest::singleDayBlock()
{
    const auto vacation = vacationWith({makeBlock(QDate(2025, 6, 2), QDate(2025, 6, 2), QStringLiteral("Moving"))});
    const data::HolidayConfig holidays;

    QCOMPARE(classify(QDate(2025, 6, 2), holidays, vacation).type, DayType::Vacation);
    QCOMPARE(classify(QDate(2025, 6, 3), holidays, vacation).type, DayType::Weekday);
    QCOMPARE(classify(QDate(2025, 5, 30), holidays, vacation).type, DayType::Weekday);
}

void DayClassifierTest::paddingCellIsBlank()
{
    const auto holidays = christmasHolidays();
    const auto vacation = vacationWith({});

    const auto padding = classify(2025, 12, 0, holidays, vacation);
    QCOMPARE(padding.type, DayType::Weekday);
    QVERIFY(padding.display.isEmpty());
    QVERIFY(!padding.description.has_value());
    QVERIFY(!padding.vacationBlockId.has_value());

    const auto christmas = classify(2025, 12, 25, holidays, vacation);
    QCOMPARE(christmas.type, DayType::Holiday);
    QCOMPARE(christmas.display, QStringLiteral("25"));
}

void DayClassifierTest::precedenceHoldsForWholeYear()
{
    data::HolidayConfig holidays = christmasHolidays();
    holidays.holidays.push_back({QDate(2025, 1, 1), QStringLiteral("New Year")});
    holidays.holidays.push_back({QDate(2025, 8, 1), QStringLiteral("National Day")});
    const auto vacation = vacationWith({makeBlock(QDate(2025, 7, 21), QDate(2025, 8, 8), QStringLiteral("Summer")),
                                        makeBlock(QDate(2025, 12, 22), QDate(2026, 1, 2), QStringLiteral("Winter"))});

    int visited = 0;
    for (const QDate &date : daysInRange(QDate(2025, 1, 1), QDate(2025, 12, 31))) {
        DayType expected = DayType::Weekday;
        if (isHoliday(date, holidays)) {
            expected = DayType::Holiday;
        } else if (isWeekend(date)) {
            expected = DayType::Weekend;
        } else if (isInVacationBlock(date, vacation)) {
            expected = DayType::Vacation;
        }
        const auto result = classify(date, holidays, vacation);
        QCOMPARE(result.type, expected);
        QCOMPARE(result.vacationBlockId.has_value(), expected == DayType::Vacation);
        QCOMPARE(result.description.has_value(), expected == DayType::Holiday || expected == DayType::Vacation);
        ++visited;
    }
    QCOMPARE(visited, 365);
}

void DayClassifierTest::typeNames()
{
    QCOMPARE(dayTypeName(DayType::Holiday), QStringLiteral("holiday"));
    QCOMPARE(dayTypeName(DayType::Vacation), QStringLiteral("vacation"));
    QCOMPARE(dayTypeName(DayType::Weekend), QStringLiteral("weekend"));
    QCOMPARE(dayTypeName(DayType::Weekday), QStringLiteral("weekday"));
}

QTEST_GUILESS_MAIN(DayClassifierTest)
#include "DayClassifierTest.moc"
