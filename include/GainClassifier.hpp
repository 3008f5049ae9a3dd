#pragma once

#include "LedgerError.hpp"
#include "LedgerTypes.hpp"
#include <vector>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Налоговые параметры
// ═══════════════════════════════════════════════════════════════════════════════

struct TaxSettings {
    double shortRate = 0.20;
    double longRate = 0.10;
    double longExemptionThreshold = 100000.0;
    unsigned fiscalYearStartMonth = 4;   // Апрель - март

    LedgerStatus validate() const;
};

struct TaxEstimate {
    double shortTermNet = 0.0;       // Σ краткосрочных доходов с учетом убытков
    double longTermNet = 0.0;
    double taxableShortTerm = 0.0;   // Σ положительных краткосрочных доходов
    double taxableLongTerm = 0.0;    // Часть пула сверх необлагаемого порога
    double exemptionApplied = 0.0;
    double shortTax = 0.0;
    double longTax = 0.0;

    double totalTax() const noexcept { return shortTax + longTax; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Классификатор и оценка налога
// ═══════════════════════════════════════════════════════════════════════════════

class GainClassifier {
public:
    // LONG строго при holdingPeriodDays > 365
    static GainBucket classify(std::int64_t holdingPeriodDays) noexcept;

    // Краткосрочные доходы облагаются по shortRate целиком, убытки дают
    // ноль налога. Долгосрочные доходы объединяются с уже реализованными
    // в периоде (priorLongTermGainsThisPeriod); облагается только прирост
    // части пула сверх порога.
    static LedgerResult<TaxEstimate> estimateTax(
        const std::vector<RealizedGain>& realizedGains,
        double priorLongTermGainsThisPeriod,
        double shortRate,
        double longRate,
        double longExemptionThreshold);

    static LedgerResult<TaxEstimate> estimateTax(
        const std::vector<RealizedGain>& realizedGains,
        double priorLongTermGainsThisPeriod,
        const TaxSettings& settings);

    // Пересчитывает срок, корзину, цены и доход по датам и ценам сделок
    static RealizedGain derive(
        RealizedGain gain,
        const TransactionRecord& acquisition,
        const TransactionRecord& disposal);
};

}  // namespace lotledger
