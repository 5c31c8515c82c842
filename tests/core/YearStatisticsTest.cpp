#include <QtTest/QtTest>

#include "vacationplaner/core/YearStatistics.hpp"
#include "vacationplaner/data/HolidayConfig.hpp"
#include "vacationplaner/data/VacationConfig.hpp"

using namespace vacationplaner;
using namespace vacationplaner::core;

namespace {

data::VacationConfig vacationWith(const QList<QPair<QDate, QDate>> &ranges)
{
    data::VacationConfig config;
    config.firstName = QStringLiteral("Anna");
    config.lastName = QStringLiteral("Muster");
    config.year = 2025;
    config.region = QStringLiteral("TG");
    int id = 0;
    for (const auto &range : ranges) {
        data::VacationBlock block;
        block.id = id;
        block.start = range.first;
        block.end = range.second;
        block.description = QStringLiteral("Block %1").arg(id);
        config.vacationBlocks.push_back(block);
        ++id;
    }
    return config;
}

data::HolidayConfig holidaysOn(const QList<QDate> &dates)
{
    data::HolidayConfig config;
    config.region = QStringLiteral("TG");
    config.year = 2025;
    for (const QDate &date : dates) {
        config.holidays.push_back({date, QStringLiteral("Holiday")});
    }
    return config;
}

} // namespace

class YearStatisticsTest : public QObject
{
    Q_OBJECT

private slots:
    void countsDaysOfYear_data();
    void countsDaysOfYear();
    void partitionIdentityHolds_data();
    void partitionIdentityHolds();
    void computesDaysOffAndPercentage();
    void holidayOnWeekendStillCounts();
    void overlappingBlocksCountTwice();
    void blockWorkdaysSkipWeekendsAndHolidays();
    void blockCrossingYearEnd();
    void emptyYearHasZeroPercentage();
};

void YearStatisticsTest::countsDaysOfYear_data()
{
    QTest::addColumn<int>("year");
    QTest::addColumn<int>("totalDays");
    QTest::addColumn<int>("weekends");
    QTest::addColumn<int>("workdays");

    QTest::newRow("2025") << 2025 << 365 << 104 << 261;
    QTest::newRow("2024 leap year") << 2024 << 366 << 104 << 262;
}

void YearStatisticsTest::countsDaysOfYear()
{
    QFETCH(int, year);
    QFETCH(int, totalDays);
    QFETCH(int, weekends);
    QFETCH(int, workdays);

    const auto stats = computeStatistics(year, data::HolidayConfig(), data::VacationConfig());
    QCOMPARE(stats.year, year);
    QCOMPARE(stats.totalDays, totalDays);
    QCOMPARE(stats.weekends, weekends);
    QCOMPARE(stats.workdays, workdays);
    QCOMPARE(stats.holidays, 0);
    QCOMPARE(stats.vacationDays, 0);
    QCOMPARE(stats.daysOff, weekends);
    QCOMPARE(stats.daysAtWork, workdays);
}

void YearStatisticsTest::partitionIdentityHolds_data()
{
    QTest::addColumn<QList<QDate>>("holidays");
    QTest::addColumn<int>("firstBlockStartMonth");

    QTest::newRow("nothing configured") << QList<QDate>() << 0;
    QTest::newRow("holidays only") << QList<QDate>{QDate(2025, 1, 1), QDate(2025, 8, 1), QDate(2025, 12, 25)} << 0;
    QTest::newRow("holidays and vacation")
        << QList<QDate>{QDate(2025, 1, 1), QDate(2025, 4, 18), QDate(2025, 12, 25)} << 4;
    QTest::newRow("holiday inside vacation") << QList<QDate>{QDate(2025, 7, 23)} << 7;
}

void YearStatisticsTest::partitionIdentityHolds()
{
    QFETCH(QList<QDate>, holidays);
    QFETCH(int, firstBlockStartMonth);

    QList<QPair<QDate, QDate>> ranges;
    if (firstBlockStartMonth > 0) {
        ranges << qMakePair(QDate(2025, firstBlockStartMonth, 14), QDate(2025, firstBlockStartMonth, 27));
        ranges << qMakePair(QDate(2025, 10, 6), QDate(2025, 10, 10));
    }

    const auto stats = computeStatistics(2025, holidaysOn(holidays), vacationWith(ranges));
    QCOMPARE(stats.workdays + stats.weekends, stats.totalDays);
    QCOMPARE(stats.daysOff + stats.daysAtWork, stats.workdays + stats.weekends);
    QVERIFY(stats.vacationWorkdays <= stats.vacationDays);
}

void YearStatisticsTest::computesDaysOffAndPercentage()
{
    // 2025-08-04 to 2025-08-08 is Monday to Friday.
    const auto stats = computeStatistics(2025, holidaysOn({QDate(2025, 1, 1), QDate(2025, 12, 25)}),
                                         vacationWith({qMakePair(QDate(2025, 8, 4), QDate(2025, 8, 8))}));
    QCOMPARE(stats.holidays, 2);
    QCOMPARE(stats.vacationDays, 5);
    QCOMPARE(stats.vacationWorkdays, 5);
    QCOMPARE(stats.daysOff, 104 + 2 + 5);
    QCOMPARE(stats.daysAtWork, 261 - 2 - 5);
    QVERIFY(qAbs(stats.percentDaysOff() - 100.0 * 111 / 365) < 1e-9);
}

void YearStatisticsTest::holidayOnWeekendStillCounts()
{
    // 2025-11-01 is a Saturday.
    const auto stats = computeStatistics(2025, holidaysOn({QDate(2025, 11, 1)}), data::VacationConfig());
    QCOMPARE(stats.holidays, 1);
    QCOMPARE(stats.weekends, 104);
    QCOMPARE(stats.daysOff, 105);
}

void YearStatisticsTest::overlappingBlocksCountTwice()
{
    const auto stats = computeStatistics(2025, data::HolidayConfig(),
                                         vacationWith({qMakePair(QDate(2025, 1, 1), QDate(2025, 1, 1)),
                                                       qMakePair(QDate(2025, 1, 1), QDate(2025, 1, 3))}));
    QCOMPARE(stats.vacationDays, 4);
    QCOMPARE(stats.vacationWorkdays, 4);
    QCOMPARE(stats.vacationBlockStats.size(), static_cast<size_t>(2));
    QCOMPARE(stats.vacationBlockStats[0].totalDays, 1);
    QCOMPARE(stats.vacationBlockStats[1].totalDays, 3);
}

void YearStatisticsTest::blockWorkdaysSkipWeekendsAndHolidays()
{
    const auto stats = computeStatistics(2025, holidaysOn({QDate(2025, 12, 25), QDate(2025, 12, 26)}),
                                         vacationWith({qMakePair(QDate(2025, 12, 22), QDate(2025, 12, 28))}));
    QCOMPARE(stats.vacationBlockStats.size(), static_cast<size_t>(1));
    const auto &block = stats.vacationBlockStats.front();
    QCOMPARE(block.id, 0);
    QCOMPARE(block.description, QStringLiteral("Block 0"));
    QCOMPARE(block.start, QDate(2025, 12, 22));
    QCOMPARE(block.end, QDate(2025, 12, 28));
    QCOMPARE(block.totalDays, 7);
    QCOMPARE(block.workdays, 3);

    QCOMPARE(stats.vacationDays, 7);
    QCOMPARE(stats.vacationWorkdays, 5);
}

void YearStatisticsTest::blockCrossingYearEnd()
{
    const auto stats = computeStatistics(2025, data::HolidayConfig(),
                                         vacationWith({qMakePair(QDate(2025, 12, 29), QDate(2026, 1, 4))}));
    QCOMPARE(stats.vacationDays, 3);
    QCOMPARE(stats.vacationWorkdays, 3);
    QCOMPARE(stats.vacationBlockStats.front().totalDays, 7);
    QCOMPARE(stats.vacationBlockStats.front().workdays, 5);
}

void YearStatisticsTest::emptyYearHasZeroPercentage()
{
    const YearStatistics stats;
    QCOMPARE(stats.percentDaysOff(), 0.0);
}

QTEST_GUILESS_MAIN(YearStatisticsTest)
#include "YearStatisticsTest.moc"
