#pragma once

#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lotledger {

struct FieldChange {
    std::string fieldName;
    std::string oldValue;   // JSON
    std::string newValue;   // JSON
};

struct EditSummary {
    bool hasBeenEdited = false;
    std::size_t editCount = 0;            // Различные моменты правки
    std::optional<TimePoint> lastModified;
    std::vector<std::string> fieldsChanged;
    std::size_t totalChanges = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Audit Logger
// ═══════════════════════════════════════════════════════════════════════════════

class AuditLogger {
public:
    explicit AuditLogger(std::shared_ptr<ILedgerDatabase> database);

    // Отслеживаемые поля: date, instrument_id, type, quantity, unit_price, notes.
    // Числа сравниваются с погрешностью представления double.
    static std::vector<FieldChange> detectChanges(
        const TransactionRecord& before,
        const TransactionRecord& after);

    // Одна запись на изменившееся поле; ничего, если изменений нет
    LedgerResult<std::vector<AuditEntry>> logEdit(
        RecordId recordId,
        const TransactionRecord& before,
        const TransactionRecord& after,
        const TimePoint& timestamp);

    LedgerResult<std::vector<AuditEntry>> getHistory(RecordId recordId) const;

    LedgerResult<EditSummary> getEditSummary(RecordId recordId) const;

    // Разрешено только после удаления самой записи
    LedgerStatus deleteHistory(RecordId recordId);

private:
    std::shared_ptr<ILedgerDatabase> database_;
};

}  // namespace lotledger
