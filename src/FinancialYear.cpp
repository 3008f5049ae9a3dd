#include "FinancialYear.hpp"
#include <iomanip>
#include <sstream>

namespace lotledger {

Date FinancialYear::firstDay() const
{
    return makeDate(startYear, startMonth, 1);
}

Date FinancialYear::lastDay() const
{
    FinancialYear next{startYear + 1, startMonth};
    return next.firstDay() - std::chrono::days{1};
}

bool FinancialYear::contains(const Date& date) const
{
    return date >= firstDay() && date <= lastDay();
}

std::string FinancialYear::label() const
{
    std::ostringstream oss;
    oss << "FY " << startYear;

    if (startMonth != 1) {
        oss << '-' << std::setfill('0') << std::setw(2) << ((startYear + 1) % 100);
    }

    return oss.str();
}

FinancialYear FinancialYear::containing(const Date& date, unsigned startMonth)
{
    std::chrono::year_month_day ymd{date};
    int year = static_cast<int>(ymd.year());

    if (static_cast<unsigned>(ymd.month()) < startMonth) {
        --year;
    }

    return FinancialYear{year, startMonth};
}

}  // namespace lotledger
