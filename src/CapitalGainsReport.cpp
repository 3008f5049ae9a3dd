#include "CapitalGainsReport.hpp"
#include <algorithm>

namespace lotledger {

CapitalGainsReporter::CapitalGainsReporter(
    std::shared_ptr<ILedgerDatabase> database,
    TaxSettings settings)
    : database_(std::move(database)),
      settings_(settings)
{
}

LedgerResult<CapitalGainsReport> CapitalGainsReporter::generate(
    int fiscalYearStart,
    std::string_view instrumentFilter) const
{
    auto valid = settings_.validate();
    if (!valid) {
        return std::unexpected(valid.error());
    }

    if (fiscalYearStart < 1900 || fiscalYearStart > 9998) {
        return std::unexpected(LedgerError::invalidArgument(
            "Fiscal year out of supported range: " + std::to_string(fiscalYearStart)));
    }

    CapitalGainsReport report;
    report.year = FinancialYear{fiscalYearStart, settings_.fiscalYearStartMonth};

    auto gains = fromStorage(
        database_->listGainsByDisposalDate(report.year.firstDay(), report.year.lastDay()));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    std::vector<RealizedGain> selected;
    double selectedPositiveLong = 0.0;
    for (const auto& gain : *gains) {
        if (!instrumentFilter.empty() && gain.instrumentId != instrumentFilter) {
            continue;
        }

        report.totalCost += gain.cost();
        report.totalProceeds += gain.proceeds();

        if (gain.bucket == GainBucket::Long) {
            report.longTermTotal += gain.gainAmount;
            report.longTermGains.push_back(gain);
            selectedPositiveLong += std::max(0.0, gain.gainAmount);
        } else {
            report.shortTermTotal += gain.gainAmount;
            report.shortTermGains.push_back(gain);
        }
        selected.push_back(gain);
    }

    // Порог принадлежит всему году: налог считается по всем доходам года
    auto periodTax = GainClassifier::estimateTax(*gains, 0.0, settings_);
    if (!periodTax) {
        return std::unexpected(periodTax.error());
    }
    report.periodTax = *periodTax;

    if (instrumentFilter.empty()) {
        report.tax = *periodTax;
        return report;
    }

    report.instrumentFilter = std::string(instrumentFilter);

    auto tax = GainClassifier::estimateTax(selected, 0.0, settings_);
    if (!tax) {
        return std::unexpected(tax.error());
    }

    // Доля инструмента в использованном пороге пропорциональна его доле
    // в положительных долгосрочных доходах года
    double periodPositiveLong = periodTax->taxableLongTerm + periodTax->exemptionApplied;
    double exemptionShare = periodPositiveLong > 0.0
        ? periodTax->exemptionApplied * selectedPositiveLong / periodPositiveLong
        : 0.0;

    tax->exemptionApplied = exemptionShare;
    tax->taxableLongTerm = selectedPositiveLong - exemptionShare;
    tax->longTax = tax->taxableLongTerm * settings_.longRate;
    report.tax = *tax;

    return report;
}

}  // namespace lotledger
