#include "DisposalOrchestrator.hpp"
#include "AtomicUnit.hpp"
#include "FinancialYear.hpp"
#include <algorithm>
#include <iostream>

namespace lotledger {

DisposalOrchestrator::DisposalOrchestrator(
    std::shared_ptr<ILedgerDatabase> database,
    TaxSettings settings)
    : database_(std::move(database)),
      ledger_(database_),
      settings_(settings)
{
}

LedgerStatus DisposalOrchestrator::validateInput(
    std::string_view instrumentId,
    double quantity,
    double unitPrice)
{
    if (instrumentId.empty()) {
        return std::unexpected(LedgerError::invalidArgument("Instrument ID is required"));
    }
    if (!(quantity > 0.0)) {
        return std::unexpected(LedgerError::invalidArgument("Quantity must be positive"));
    }
    if (!(unitPrice > 0.0)) {
        return std::unexpected(LedgerError::invalidArgument("Unit price must be positive"));
    }
    return {};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Покупка
// ═══════════════════════════════════════════════════════════════════════════════

LedgerResult<TransactionRecord> DisposalOrchestrator::recordAcquisition(
    std::string_view instrumentId,
    double quantity,
    double unitPrice,
    const Date& date,
    std::string_view notes)
{
    auto valid = validateInput(instrumentId, quantity, unitPrice);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    TransactionRecord record;
    record.instrumentId = std::string(instrumentId);
    record.type = TransactionType::Acquisition;
    record.date = date;
    record.quantity = quantity;
    record.unitPrice = unitPrice;
    record.notes = std::string(notes);

    auto id = fromStorage(database_->insertTransaction(record));
    if (!id) {
        return std::unexpected(id.error());
    }
    record.id = *id;

    std::cout << "[DisposalOrchestrator] Recorded acquisition #" << record.id
              << ": " << record.quantity << " " << record.instrumentId
              << " @ " << record.unitPrice << " on " << formatDate(record.date)
              << std::endl;

    return record;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Продажа
// ═══════════════════════════════════════════════════════════════════════════════

LedgerResult<MatchResult> DisposalOrchestrator::matchAgainstLots(
    const TransactionRecord& disposal)
{
    // Продаже предлагаются только лоты, купленные не позднее ее даты
    auto lots = ledger_.availableLotsAsOf(
        disposal.instrumentId, disposal.date, LotLedger::Cutoff::OnOrBefore, disposal.id);
    if (!lots) {
        return std::unexpected(lots.error());
    }

    return FifoMatcher::match(*lots, disposal.quantity, disposal.date, disposal.unitPrice);
}

LedgerResult<std::vector<RealizedGain>> DisposalOrchestrator::persistMatches(
    const TransactionRecord& disposal,
    const MatchResult& match)
{
    std::vector<RealizedGain> gains;
    gains.reserve(match.matchedLots.size());

    for (const auto& lot : match.matchedLots) {
        RealizedGain gain;
        gain.acquisitionId = lot.acquisitionId;
        gain.disposalId = disposal.id;
        gain.instrumentId = disposal.instrumentId;
        gain.quantity = lot.quantity;
        gain.unitCostBasis = lot.unitCostBasis;
        gain.unitProceeds = lot.unitProceeds;
        gain.holdingPeriodDays = lot.holdingPeriodDays;
        gain.bucket = GainClassifier::classify(lot.holdingPeriodDays);
        gain.gainAmount = lot.gain();

        auto id = fromStorage(database_->insertRealizedGain(gain));
        if (!id) {
            return std::unexpected(id.error());
        }
        gain.id = *id;

        gains.push_back(gain);
    }

    return gains;
}

LedgerResult<double> DisposalOrchestrator::priorLongTermGains(const Date& date)
{
    auto year = FinancialYear::containing(date, settings_.fiscalYearStartMonth);

    auto gains = fromStorage(database_->listGainsByDisposalDate(year.firstDay(), date));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    double total = 0.0;
    for (const auto& gain : *gains) {
        if (gain.bucket == GainBucket::Long) {
            total += std::max(0.0, gain.gainAmount);
        }
    }
    return total;
}

LedgerResult<DisposalResult> DisposalOrchestrator::recordDisposal(
    std::string_view instrumentId,
    double quantity,
    double unitPrice,
    const Date& date,
    std::string_view notes)
{
    auto valid = validateInput(instrumentId, quantity, unitPrice);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    DisposalResult result;
    result.disposal.instrumentId = std::string(instrumentId);
    result.disposal.type = TransactionType::Disposal;
    result.disposal.date = date;
    result.disposal.quantity = quantity;
    result.disposal.unitPrice = unitPrice;
    result.disposal.notes = std::string(notes);

    auto status = runAtomically(*database_, [&]() -> LedgerStatus {
        // Сопоставление до вставки: при нехватке ничего не пишется
        auto match = matchAgainstLots(result.disposal);
        if (!match) {
            return std::unexpected(match.error());
        }
        result.match = std::move(*match);

        auto prior = priorLongTermGains(date);
        if (!prior) {
            return std::unexpected(prior.error());
        }

        auto id = fromStorage(database_->insertTransaction(result.disposal));
        if (!id) {
            return std::unexpected(id.error());
        }
        result.disposal.id = *id;

        auto gains = persistMatches(result.disposal, result.match);
        if (!gains) {
            return std::unexpected(gains.error());
        }
        result.gains = std::move(*gains);

        auto estimate = GainClassifier::estimateTax(result.gains, *prior, settings_);
        if (!estimate) {
            return std::unexpected(estimate.error());
        }
        result.taxPreview = *estimate;
        return {};
    });

    if (!status) {
        std::cerr << "[DisposalOrchestrator] Disposal of " << quantity << " "
                  << instrumentId << " rejected: " << status.error().describe()
                  << std::endl;
        return std::unexpected(status.error());
    }

    for (const auto& gain : result.gains) {
        if (gain.bucket == GainBucket::Long) {
            result.longTermGain += gain.gainAmount;
        } else {
            result.shortTermGain += gain.gainAmount;
        }
    }
    result.fiscalYearLabel =
        FinancialYear::containing(date, settings_.fiscalYearStartMonth).label();

    std::cout << "[DisposalOrchestrator] Recorded disposal #" << result.disposal.id
              << ": " << quantity << " " << instrumentId << " matched against "
              << result.gains.size() << " lot(s)" << std::endl;

    return result;
}

LedgerResult<std::vector<RealizedGain>> DisposalOrchestrator::rematchDisposal(
    const TransactionRecord& disposal)
{
    if (!disposal.isDisposal()) {
        return std::unexpected(LedgerError::invalidArgument(
            "Transaction " + std::to_string(disposal.id) + " is not a disposal"));
    }

    auto valid = validateInput(disposal.instrumentId, disposal.quantity, disposal.unitPrice);
    if (!valid) {
        return std::unexpected(valid.error());
    }

    std::vector<RealizedGain> created;

    auto status = runAtomically(*database_, [&]() -> LedgerStatus {
        auto removed = fromStorage(database_->deleteRealizedGainsForDisposal(disposal.id));
        if (!removed) {
            return std::unexpected(removed.error());
        }

        auto match = matchAgainstLots(disposal);
        if (!match) {
            return std::unexpected(match.error());
        }

        auto gains = persistMatches(disposal, *match);
        if (!gains) {
            return std::unexpected(gains.error());
        }
        created = std::move(*gains);
        return {};
    });

    if (!status) {
        return std::unexpected(status.error());
    }

    return created;
}

}  // namespace lotledger
