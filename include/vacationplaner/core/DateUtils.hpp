#pragma once

#include <QDate>
#include <QString>
#include <array>
#include <iterator>
#include <optional>
#include <vector>

namespace vacationplaner {
namespace core {

// Accepts exactly "YYYY-MM-DD" naming a valid proleptic Gregorian date.
std::optional<QDate> parseDate(const QString &text);
QString formatDate(const QDate &date);

// Saturday or Sunday.
bool isWeekend(const QDate &date);

// Inclusive, restartable enumeration of the days between two dates.
// Empty when either bound is invalid or start > end.
class DateRange
{
public:
    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = QDate;
        using difference_type = qint64;
        using pointer = const QDate *;
        using reference = const QDate &;

        const_iterator() = default;
        explicit const_iterator(QDate current)
            : m_current(current)
        {
        }

        reference operator*() const { return m_current; }
        pointer operator->() const { return &m_current; }
        const_iterator &operator++()
        {
            m_current = m_current.addDays(1);
            return *this;
        }
        const_iterator operator++(int)
        {
            const_iterator previous = *this;
            ++*this;
            return previous;
        }
        bool operator==(const const_iterator &other) const { return m_current == other.m_current; }
        bool operator!=(const const_iterator &other) const { return !(*this == other); }

    private:
        QDate m_current;
    };

    DateRange(QDate start, QDate end);

    const_iterator begin() const;
    const_iterator end() const;
    bool isEmpty() const;
    int size() const;

private:
    QDate m_start;
    QDate m_end;
};

DateRange daysInRange(const QDate &start, const QDate &end);

using Week = std::array<int, 7>;

// Weeks from Monday to Sunday; days outside the month are 0.
std::vector<Week> monthGrid(int year, int month);

} // namespace core
} // namespace vacationplaner
