#include "EditValidator.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace lotledger {

namespace {

bool differs(double a, double b)
{
    return std::abs(a - b) > kQuantityEpsilon * std::max({1.0, std::abs(a), std::abs(b)});
}

double sumQuantity(const std::vector<RealizedGain>& gains)
{
    double total = 0.0;
    for (const auto& gain : gains) {
        total += gain.quantity;
    }
    return total;
}

EditRejection makeRejection(EditRule rule, std::string field, double bound, std::string message)
{
    EditRejection rejection;
    rejection.rule = rule;
    rejection.field = std::move(field);
    rejection.bound = bound;
    rejection.message = std::move(message);
    return rejection;
}

std::string formatQuantity(double value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

TransactionRecord EditRequest::applyTo(const TransactionRecord& original) const
{
    TransactionRecord result = original;
    if (date) result.date = *date;
    if (instrumentId) result.instrumentId = *instrumentId;
    if (type) result.type = *type;
    if (quantity) result.quantity = *quantity;
    if (unitPrice) result.unitPrice = *unitPrice;
    if (notes) result.notes = *notes;
    return result;
}

std::string_view toString(EditState state) noexcept
{
    switch (state) {
    case EditState::Proposed: return "PROPOSED";
    case EditState::Accepted: return "ACCEPTED";
    case EditState::Rejected: return "REJECTED";
    }
    return "UNKNOWN";
}

EditValidator::EditValidator(std::shared_ptr<ILedgerDatabase> database)
    : database_(std::move(database)),
      ledger_(database_)
{
}

LedgerResult<TransactionRecord> EditValidator::loadTransaction(RecordId id) const
{
    auto record = fromStorage(database_->getTransaction(id));
    if (!record) {
        return std::unexpected(record.error());
    }
    if (!record->has_value()) {
        return std::unexpected(LedgerError::notFound(
            "Transaction not found: " + std::to_string(id)));
    }
    return **record;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Проверка правки
// ═══════════════════════════════════════════════════════════════════════════════

LedgerResult<EditDecision> EditValidator::validate(RecordId id, const EditRequest& request) const
{
    auto original = loadTransaction(id);
    if (!original) {
        return std::unexpected(original.error());
    }
    return validate(*original, request);
}

LedgerResult<EditDecision> EditValidator::validate(
    const TransactionRecord& original,
    const EditRequest& request) const
{
    if (request.quantity && !(*request.quantity > 0.0)) {
        return std::unexpected(LedgerError::invalidArgument("Quantity must be positive"));
    }
    if (request.unitPrice && !(*request.unitPrice > 0.0)) {
        return std::unexpected(LedgerError::invalidArgument("Unit price must be positive"));
    }
    if (request.instrumentId && request.instrumentId->empty()) {
        return std::unexpected(LedgerError::invalidArgument("Instrument ID cannot be empty"));
    }

    EditDecision decision;
    decision.original = original;
    decision.proposed = request.applyTo(original);

    auto rejection = evaluateRules(decision.original, decision.proposed);
    if (!rejection) {
        return std::unexpected(rejection.error());
    }

    if (*rejection) {
        decision.state = EditState::Rejected;
        decision.rejection = std::move(*rejection);
    } else {
        decision.state = EditState::Accepted;
    }

    return decision;
}

LedgerResult<std::optional<EditRejection>> EditValidator::evaluateRules(
    const TransactionRecord& original,
    const TransactionRecord& proposed) const
{
    using NoRejection = std::optional<EditRejection>;

    const bool wasAcquisition = original.isAcquisition();
    const bool dateChanged = original.date != proposed.date;
    const bool instrumentChanged = original.instrumentId != proposed.instrumentId;

    std::vector<RealizedGain> gains;
    {
        auto loaded = wasAcquisition
            ? fromStorage(database_->listGainsForAcquisition(original.id))
            : fromStorage(database_->listGainsForDisposal(original.id));
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        gains = std::move(*loaded);
    }
    const double matched = sumQuantity(gains);

    // 1. Количество покупки
    if (wasAcquisition && proposed.quantity < matched - kQuantityEpsilon) {
        auto rejection = makeRejection(
            EditRule::InsufficientAcquisitionQuantity, "quantity", matched,
            "Cannot reduce quantity below " + formatQuantity(matched) +
            ": that much has already been disposed from this acquisition");
        for (const auto& gain : gains) {
            rejection.conflictingRecords.push_back(gain.disposalId);
        }
        return NoRejection{rejection};
    }

    // 2. Дата покупки относительно связанных продаж
    if (wasAcquisition && dateChanged) {
        std::optional<Date> earliest;
        std::vector<RecordId> conflicts;

        for (const auto& gain : gains) {
            auto disposal = loadTransaction(gain.disposalId);
            if (!disposal) {
                return std::unexpected(disposal.error());
            }
            if (!earliest || disposal->date < *earliest) {
                earliest = disposal->date;
            }
            if (disposal->date < proposed.date) {
                conflicts.push_back(disposal->id);
            }
        }

        if (!conflicts.empty()) {
            auto rejection = makeRejection(
                EditRule::AcquisitionDateConflict, "date", 0.0,
                "Acquisition date cannot be later than " + formatDate(*earliest) +
                ", the earliest disposal that consumed it");
            rejection.boundDate = earliest;
            rejection.conflictingRecords = std::move(conflicts);
            return NoRejection{rejection};
        }
    }

    // 3. Дата продажи относительно связанных покупок
    if (!wasAcquisition && dateChanged) {
        std::optional<Date> latest;
        std::vector<RecordId> conflicts;

        for (const auto& gain : gains) {
            auto acquisition = loadTransaction(gain.acquisitionId);
            if (!acquisition) {
                return std::unexpected(acquisition.error());
            }
            if (!latest || acquisition->date > *latest) {
                latest = acquisition->date;
            }
            if (acquisition->date > proposed.date) {
                conflicts.push_back(acquisition->id);
            }
        }

        if (!conflicts.empty()) {
            auto rejection = makeRejection(
                EditRule::DisposalDateConflict, "date", 0.0,
                "Disposal date cannot be earlier than " + formatDate(*latest) +
                ", the latest acquisition it consumed");
            rejection.boundDate = latest;
            rejection.conflictingRecords = std::move(conflicts);
            return NoRejection{rejection};
        }
    }

    // 4. Покупка -> продажа: запас строго до новой даты, без самой записи
    if (wasAcquisition && proposed.isDisposal()) {
        auto lots = ledger_.availableLotsAsOf(
            proposed.instrumentId, proposed.date,
            LotLedger::Cutoff::StrictlyBefore, original.id);
        if (!lots) {
            return std::unexpected(lots.error());
        }

        double available = LotLedger::totalAvailable(*lots);
        if (available < proposed.quantity - kQuantityEpsilon) {
            return NoRejection{makeRejection(
                EditRule::TypeChangeInsufficientInventory, "type", available,
                "Cannot convert to a disposal of " + formatQuantity(proposed.quantity) +
                ": only " + formatQuantity(available) + " available before " +
                formatDate(proposed.date))};
        }
    }

    // 5. Продажа -> покупка
    if (!wasAcquisition && proposed.isAcquisition() && !gains.empty()) {
        auto rejection = makeRejection(
            EditRule::TypeChangeMatchedDisposal, "type", matched,
            "A disposal that has been matched against acquisitions cannot become an acquisition");
        for (const auto& gain : gains) {
            rejection.conflictingRecords.push_back(gain.acquisitionId);
        }
        return NoRejection{rejection};
    }

    // 6. Смена инструмента
    if (instrumentChanged && !gains.empty()) {
        auto rejection = makeRejection(
            EditRule::InstrumentChangeWithMatches, "instrument_id", matched,
            "Cannot change the instrument of a record that has matches");
        for (const auto& gain : gains) {
            rejection.conflictingRecords.push_back(
                wasAcquisition ? gain.disposalId : gain.acquisitionId);
        }
        return NoRejection{rejection};
    }

    // 7. Израсходованная покупка не может стать продажей
    if (wasAcquisition && proposed.isDisposal() && matched > kQuantityEpsilon) {
        auto rejection = makeRejection(
            EditRule::TypeChangeConsumedAcquisition, "type", matched,
            "Cannot convert to a disposal: " + formatQuantity(matched) +
            " of this acquisition has already been disposed");
        for (const auto& gain : gains) {
            rejection.conflictingRecords.push_back(gain.disposalId);
        }
        return NoRejection{rejection};
    }

    // 8. Рост количества продажи
    if (!wasAcquisition && proposed.isDisposal() &&
        proposed.quantity > original.quantity && differs(proposed.quantity, original.quantity)) {
        auto lots = ledger_.availableLotsAsOf(
            proposed.instrumentId, proposed.date, LotLedger::Cutoff::OnOrBefore);
        if (!lots) {
            return std::unexpected(lots.error());
        }

        double maximum = matched + LotLedger::totalAvailable(*lots);
        if (proposed.quantity > maximum + kQuantityEpsilon) {
            return NoRejection{makeRejection(
                EditRule::DisposalQuantityExceedsInventory, "quantity", maximum,
                "Disposal quantity cannot exceed " + formatQuantity(maximum) +
                ", the inventory available on " + formatDate(proposed.date))};
        }
    }

    return NoRejection{};
}

// ═══════════════════════════════════════════════════════════════════════════════
// Удаление
// ═══════════════════════════════════════════════════════════════════════════════

LedgerResult<std::optional<EditRejection>> EditValidator::checkDelete(
    const TransactionRecord& record) const
{
    using NoRejection = std::optional<EditRejection>;

    if (record.isDisposal()) {
        return NoRejection{makeRejection(
            EditRule::DeleteWithMatches, "type", record.quantity,
            "Disposals cannot be deleted: their matches are permanent")};
    }

    auto gains = fromStorage(database_->listGainsForAcquisition(record.id));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    if (!gains->empty()) {
        double matched = sumQuantity(*gains);
        auto rejection = makeRejection(
            EditRule::DeleteWithMatches, "quantity", matched,
            "Cannot delete an acquisition that has been used by " +
            std::to_string(gains->size()) + " disposal match(es)");
        for (const auto& gain : *gains) {
            rejection.conflictingRecords.push_back(gain.disposalId);
        }
        return NoRejection{rejection};
    }

    return NoRejection{};
}

}  // namespace lotledger
