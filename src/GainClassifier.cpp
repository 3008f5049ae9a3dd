#include "GainClassifier.hpp"
#include <algorithm>

namespace lotledger {

LedgerStatus TaxSettings::validate() const
{
    if (shortRate < 0.0 || shortRate > 1.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Short-term rate must be within [0, 1]"));
    }
    if (longRate < 0.0 || longRate > 1.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Long-term rate must be within [0, 1]"));
    }
    if (longExemptionThreshold < 0.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Long-term exemption threshold cannot be negative"));
    }
    if (fiscalYearStartMonth < 1 || fiscalYearStartMonth > 12) {
        return std::unexpected(LedgerError::invalidArgument(
            "Fiscal year start month must be within 1..12"));
    }
    return {};
}

GainBucket GainClassifier::classify(std::int64_t holdingPeriodDays) noexcept
{
    return holdingPeriodDays > kLongTermThresholdDays ? GainBucket::Long : GainBucket::Short;
}

LedgerResult<TaxEstimate> GainClassifier::estimateTax(
    const std::vector<RealizedGain>& realizedGains,
    double priorLongTermGainsThisPeriod,
    double shortRate,
    double longRate,
    double longExemptionThreshold)
{
    if (shortRate < 0.0 || longRate < 0.0) {
        return std::unexpected(LedgerError::invalidArgument("Tax rates cannot be negative"));
    }
    if (longExemptionThreshold < 0.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Long-term exemption threshold cannot be negative"));
    }
    if (priorLongTermGainsThisPeriod < 0.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Prior long-term gains cannot be negative"));
    }

    TaxEstimate estimate;
    double positiveLong = 0.0;

    for (const auto& gain : realizedGains) {
        if (gain.bucket == GainBucket::Short) {
            estimate.shortTermNet += gain.gainAmount;
            estimate.taxableShortTerm += std::max(0.0, gain.gainAmount);
        } else {
            estimate.longTermNet += gain.gainAmount;
            positiveLong += std::max(0.0, gain.gainAmount);
        }
    }

    // Порог расходуется пулом периода, а не отдельным доходом:
    // облагаем только прирост превышения над порогом
    double prior = priorLongTermGainsThisPeriod;
    double excessBefore = std::max(0.0, prior - longExemptionThreshold);
    double excessAfter = std::max(0.0, prior + positiveLong - longExemptionThreshold);

    estimate.taxableLongTerm = excessAfter - excessBefore;
    estimate.exemptionApplied = positiveLong - estimate.taxableLongTerm;

    estimate.shortTax = estimate.taxableShortTerm * shortRate;
    estimate.longTax = estimate.taxableLongTerm * longRate;

    return estimate;
}

LedgerResult<TaxEstimate> GainClassifier::estimateTax(
    const std::vector<RealizedGain>& realizedGains,
    double priorLongTermGainsThisPeriod,
    const TaxSettings& settings)
{
    return estimateTax(realizedGains,
                       priorLongTermGainsThisPeriod,
                       settings.shortRate,
                       settings.longRate,
                       settings.longExemptionThreshold);
}

RealizedGain GainClassifier::derive(
    RealizedGain gain,
    const TransactionRecord& acquisition,
    const TransactionRecord& disposal)
{
    gain.acquisitionId = acquisition.id;
    gain.disposalId = disposal.id;
    gain.instrumentId = disposal.instrumentId;
    gain.unitCostBasis = acquisition.unitPrice;
    gain.unitProceeds = disposal.unitPrice;
    gain.holdingPeriodDays = daysBetween(acquisition.date, disposal.date);
    gain.bucket = classify(gain.holdingPeriodDays);
    gain.gainAmount = gain.quantity * (gain.unitProceeds - gain.unitCostBasis);
    return gain;
}

}  // namespace lotledger
