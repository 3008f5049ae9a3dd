#include "TransactionEditor.hpp"
#include "AtomicUnit.hpp"
#include "GainClassifier.hpp"
#include <cmath>
#include <iostream>

namespace lotledger {

TransactionEditor::TransactionEditor(std::shared_ptr<ILedgerDatabase> database)
    : database_(std::move(database)),
      validator_(database_),
      auditLogger_(database_),
      orchestrator_(database_)
{
}

LedgerResult<EditDecision> TransactionEditor::proposeEdit(
    RecordId id,
    const EditRequest& request) const
{
    return validator_.validate(id, request);
}

LedgerResult<std::vector<RealizedGain>> TransactionEditor::recomputeDependentGains(
    const TransactionRecord& record)
{
    auto gains = record.isAcquisition()
        ? fromStorage(database_->listGainsForAcquisition(record.id))
        : fromStorage(database_->listGainsForDisposal(record.id));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    std::vector<RealizedGain> recomputed;

    for (const auto& gain : *gains) {
        RecordId counterpartId = record.isAcquisition() ? gain.disposalId : gain.acquisitionId;

        auto counterpart = fromStorage(database_->getTransaction(counterpartId));
        if (!counterpart) {
            return std::unexpected(counterpart.error());
        }
        if (!counterpart->has_value()) {
            return std::unexpected(LedgerError::persistence(
                "Realized gain " + std::to_string(gain.id) +
                " references missing transaction " + std::to_string(counterpartId)));
        }

        const TransactionRecord& acquisition = record.isAcquisition() ? record : **counterpart;
        const TransactionRecord& disposal = record.isAcquisition() ? **counterpart : record;

        RealizedGain updated = GainClassifier::derive(gain, acquisition, disposal);

        auto stored = fromStorage(database_->updateRealizedGain(updated));
        if (!stored) {
            return std::unexpected(stored.error());
        }

        recomputed.push_back(updated);
    }

    return recomputed;
}

LedgerResult<EditOutcome> TransactionEditor::commitEdit(
    RecordId id,
    const EditRequest& request,
    const TimePoint& timestamp)
{
    EditOutcome outcome;
    outcome.committedAt = timestamp;

    auto status = runAtomically(*database_, [&]() -> LedgerStatus {
        // Проверка внутри транзакции: видит то же состояние, что и запись
        auto decision = validator_.validate(id, request);
        if (!decision) {
            return std::unexpected(decision.error());
        }
        if (!decision->accepted()) {
            return std::unexpected(LedgerError::editRejected(*decision->rejection));
        }

        outcome.before = decision->original;
        outcome.after = decision->proposed;

        const auto& before = outcome.before;
        const auto& after = outcome.after;

        auto updated = fromStorage(database_->updateTransaction(after));
        if (!updated) {
            return std::unexpected(updated.error());
        }

        // Продажа сопоставляется заново, если изменилось ее количество
        // или инструмент, либо если покупка стала продажей
        bool rematch = after.isDisposal() &&
            (before.isAcquisition() ||
             before.instrumentId != after.instrumentId ||
             std::abs(before.quantity - after.quantity) > kQuantityEpsilon);

        if (rematch) {
            auto created = orchestrator_.rematchDisposal(after);
            if (!created) {
                return std::unexpected(created.error());
            }
            outcome.createdGains = std::move(*created);
        } else {
            auto recomputed = recomputeDependentGains(after);
            if (!recomputed) {
                return std::unexpected(recomputed.error());
            }
            outcome.recomputedGains = std::move(*recomputed);
        }

        auto audit = auditLogger_.logEdit(id, before, after, timestamp);
        if (!audit) {
            return std::unexpected(audit.error());
        }
        outcome.auditEntries = std::move(*audit);

        return {};
    });

    if (!status) {
        std::cerr << "[TransactionEditor] Edit of transaction #" << id
                  << " not committed: " << status.error().describe() << std::endl;
        return std::unexpected(status.error());
    }

    std::cout << "[TransactionEditor] Committed edit of transaction #" << id
              << " (" << outcome.auditEntries.size() << " field(s), "
              << outcome.recomputedGains.size() << " gain(s) recomputed, "
              << outcome.createdGains.size() << " gain(s) rematched)" << std::endl;

    return outcome;
}

LedgerStatus TransactionEditor::deleteTransaction(RecordId id)
{
    auto status = runAtomically(*database_, [&]() -> LedgerStatus {
        auto record = fromStorage(database_->getTransaction(id));
        if (!record) {
            return std::unexpected(record.error());
        }
        if (!record->has_value()) {
            return std::unexpected(LedgerError::notFound(
                "Transaction not found: " + std::to_string(id)));
        }

        auto rejection = validator_.checkDelete(**record);
        if (!rejection) {
            return std::unexpected(rejection.error());
        }
        if (*rejection) {
            return std::unexpected(LedgerError::editRejected(**rejection));
        }

        auto deleted = fromStorage(database_->deleteTransaction(id));
        if (!deleted) {
            return deleted;
        }

        return auditLogger_.deleteHistory(id);
    });

    if (!status) {
        std::cerr << "[TransactionEditor] Delete of transaction #" << id
                  << " refused: " << status.error().describe() << std::endl;
        return status;
    }

    std::cout << "[TransactionEditor] Deleted transaction #" << id << std::endl;
    return {};
}

}  // namespace lotledger
