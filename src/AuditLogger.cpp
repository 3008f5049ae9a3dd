#include "AuditLogger.hpp"
#include "AtomicUnit.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>

namespace lotledger {

namespace {

bool numbersDiffer(double a, double b)
{
    return std::abs(a - b) > kQuantityEpsilon * std::max({1.0, std::abs(a), std::abs(b)});
}

// Свободный текст (notes, instrument_id) может быть не UTF-8:
// недопустимые байты заменяются на U+FFFD, dump() не бросает
template<typename T>
std::string toJsonText(const T& value)
{
    return nlohmann::json(value).dump(-1, ' ', false,
                                       nlohmann::json::error_handler_t::replace);
}

template<typename T>
void addChange(std::vector<FieldChange>& changes, const char* field,
               const T& oldValue, const T& newValue)
{
    changes.push_back({field, toJsonText(oldValue), toJsonText(newValue)});
}

}  // namespace

AuditLogger::AuditLogger(std::shared_ptr<ILedgerDatabase> database)
    : database_(std::move(database))
{
}

std::vector<FieldChange> AuditLogger::detectChanges(
    const TransactionRecord& before,
    const TransactionRecord& after)
{
    std::vector<FieldChange> changes;

    if (before.date != after.date) {
        addChange(changes, "date", formatDate(before.date), formatDate(after.date));
    }
    if (before.instrumentId != after.instrumentId) {
        addChange(changes, "instrument_id", before.instrumentId, after.instrumentId);
    }
    if (before.type != after.type) {
        addChange(changes, "type",
                  std::string(toString(before.type)), std::string(toString(after.type)));
    }
    if (numbersDiffer(before.quantity, after.quantity)) {
        addChange(changes, "quantity", before.quantity, after.quantity);
    }
    if (numbersDiffer(before.unitPrice, after.unitPrice)) {
        addChange(changes, "unit_price", before.unitPrice, after.unitPrice);
    }
    if (before.notes != after.notes) {
        addChange(changes, "notes", before.notes, after.notes);
    }

    return changes;
}

LedgerResult<std::vector<AuditEntry>> AuditLogger::logEdit(
    RecordId recordId,
    const TransactionRecord& before,
    const TransactionRecord& after,
    const TimePoint& timestamp)
{
    auto changes = detectChanges(before, after);
    std::vector<AuditEntry> written;

    if (changes.empty()) {
        return written;
    }

    auto status = runAtomically(*database_, [&]() -> LedgerStatus {
        for (const auto& change : changes) {
            AuditEntry entry;
            entry.recordId = recordId;
            entry.timestamp = timestamp;
            entry.fieldName = change.fieldName;
            entry.oldValue = change.oldValue;
            entry.newValue = change.newValue;

            auto id = fromStorage(database_->insertAuditEntry(entry));
            if (!id) {
                return std::unexpected(id.error());
            }
            entry.id = *id;
            written.push_back(std::move(entry));
        }
        return {};
    });

    if (!status) {
        return std::unexpected(status.error());
    }

    std::cout << "[AuditLogger] Recorded " << written.size()
              << " field change(s) for transaction #" << recordId << std::endl;

    return written;
}

LedgerResult<std::vector<AuditEntry>> AuditLogger::getHistory(RecordId recordId) const
{
    return fromStorage(database_->listAuditEntries(recordId));
}

LedgerResult<EditSummary> AuditLogger::getEditSummary(RecordId recordId) const
{
    auto history = getHistory(recordId);
    if (!history) {
        return std::unexpected(history.error());
    }

    EditSummary summary;
    summary.totalChanges = history->size();
    summary.hasBeenEdited = !history->empty();

    std::set<TimePoint> edits;
    std::set<std::string> fields;

    for (const auto& entry : *history) {
        edits.insert(entry.timestamp);
        fields.insert(entry.fieldName);
    }

    summary.editCount = edits.size();
    if (!edits.empty()) {
        summary.lastModified = *edits.rbegin();
    }
    summary.fieldsChanged.assign(fields.begin(), fields.end());

    return summary;
}

LedgerStatus AuditLogger::deleteHistory(RecordId recordId)
{
    auto record = fromStorage(database_->getTransaction(recordId));
    if (!record) {
        return std::unexpected(record.error());
    }

    if (record->has_value()) {
        return std::unexpected(LedgerError::invalidArgument(
            "Audit history of transaction #" + std::to_string(recordId) +
            " is permanent while the transaction exists"));
    }

    auto deleted = fromStorage(database_->deleteAuditEntries(recordId));
    if (!deleted) {
        return deleted;
    }

    std::cout << "[AuditLogger] Deleted history of transaction #" << recordId << std::endl;
    return {};
}

}  // namespace lotledger
