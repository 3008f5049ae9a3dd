#pragma once

#include "FinancialYear.hpp"
#include "GainClassifier.hpp"
#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lotledger {

struct CapitalGainsReport {
    FinancialYear year;
    std::vector<RealizedGain> shortTermGains;
    std::vector<RealizedGain> longTermGains;
    double shortTermTotal = 0.0;
    double longTermTotal = 0.0;
    double totalCost = 0.0;
    double totalProceeds = 0.0;
    std::string instrumentFilter;   // Пусто - все инструменты

    // tax - доля отчета; periodTax - налог всего года.
    // Без фильтра они совпадают.
    TaxEstimate tax;
    TaxEstimate periodTax;

    double netGain() const noexcept { return shortTermTotal + longTermTotal; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Отчет по реализованным доходам за финансовый год
// ═══════════════════════════════════════════════════════════════════════════════

class CapitalGainsReporter {
public:
    CapitalGainsReporter(std::shared_ptr<ILedgerDatabase> database, TaxSettings settings);

    // Доходы, чья продажа попадает в год; порог расходуется
    // с нуля в начале каждого года. С фильтром инструменту достается
    // пропорциональная доля порога года.
    LedgerResult<CapitalGainsReport> generate(
        int fiscalYearStart,
        std::string_view instrumentFilter = "") const;

private:
    std::shared_ptr<ILedgerDatabase> database_;
    TaxSettings settings_;
};

}  // namespace lotledger
