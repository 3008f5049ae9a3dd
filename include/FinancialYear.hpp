#pragma once

#include "LedgerTypes.hpp"
#include <string>

namespace lotledger {

// Финансовый год, начинающийся первого числа startMonth.
// По умолчанию апрель-март: FY 2024-25 = 2024-04-01 .. 2025-03-31.
struct FinancialYear {
    int startYear = 0;
    unsigned startMonth = 4;

    Date firstDay() const;
    Date lastDay() const;
    bool contains(const Date& date) const;

    // "FY 2024-25"; для года, начинающегося в январе, "FY 2024"
    std::string label() const;

    static FinancialYear containing(const Date& date, unsigned startMonth = 4);
};

}  // namespace lotledger
