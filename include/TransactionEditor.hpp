#pragma once

#include "AuditLogger.hpp"
#include "DisposalOrchestrator.hpp"
#include "EditValidator.hpp"
#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include <memory>
#include <vector>

namespace lotledger {

struct EditOutcome {
    TransactionRecord before;
    TransactionRecord after;
    std::vector<RealizedGain> recomputedGains;   // Существующие доходы с новыми значениями
    std::vector<RealizedGain> createdGains;      // Доходы повторного сопоставления
    std::vector<AuditEntry> auditEntries;
    TimePoint committedAt{};
};

// ═══════════════════════════════════════════════════════════════════════════════
// Transaction Editor: правка и удаление уже сохраненных сделок
// ═══════════════════════════════════════════════════════════════════════════════

class TransactionEditor {
public:
    explicit TransactionEditor(std::shared_ptr<ILedgerDatabase> database);

    // Только проверка, без записи
    LedgerResult<EditDecision> proposeEdit(RecordId id, const EditRequest& request) const;

    // Повторная проверка, обновление записи, пересчет зависимых доходов
    // и журнал правок - одна атомарная операция. Нарушение правила
    // возвращается как ошибка EditRejected.
    LedgerResult<EditOutcome> commitEdit(
        RecordId id,
        const EditRequest& request,
        const TimePoint& timestamp = std::chrono::system_clock::now());

    // Удаляет неизрасходованную покупку вместе с ее историей правок
    LedgerStatus deleteTransaction(RecordId id);

private:
    std::shared_ptr<ILedgerDatabase> database_;
    EditValidator validator_;
    AuditLogger auditLogger_;
    DisposalOrchestrator orchestrator_;

    // Пересчитывает доходы, в которых участвует запись
    LedgerResult<std::vector<RealizedGain>> recomputeDependentGains(
        const TransactionRecord& record);
};

}  // namespace lotledger
