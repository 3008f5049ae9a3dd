#pragma once

#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include "LotLedger.hpp"
#include <memory>
#include <optional>
#include <string>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Запрос на правку: заданы только изменяемые поля
// ═══════════════════════════════════════════════════════════════════════════════

struct EditRequest {
    std::optional<Date> date;
    std::optional<std::string> instrumentId;
    std::optional<TransactionType> type;
    std::optional<double> quantity;
    std::optional<double> unitPrice;
    std::optional<std::string> notes;

    bool empty() const noexcept {
        return !date && !instrumentId && !type && !quantity && !unitPrice && !notes;
    }

    TransactionRecord applyTo(const TransactionRecord& original) const;
};

enum class EditState {
    Proposed,
    Accepted,
    Rejected
};

std::string_view toString(EditState state) noexcept;

struct EditDecision {
    EditState state = EditState::Proposed;
    TransactionRecord original;
    TransactionRecord proposed;
    std::optional<EditRejection> rejection;

    bool accepted() const noexcept { return state == EditState::Accepted; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Edit Validator
// ═══════════════════════════════════════════════════════════════════════════════
//
// Правила проверяются по порядку, побеждает первое нарушенное:
//   1. количество покупки не меньше уже израсходованного
//   2. новая дата покупки не позже самой ранней связанной продажи
//   3. новая дата продажи не раньше самой поздней связанной покупки
//   4. покупка -> продажа: запаса строго до новой даты хватает
//   5. продажа -> покупка: у продажи нет сопоставлений
//   6. смена инструмента: у записи нет сопоставлений
//   7. покупка -> продажа: из покупки ничего не израсходовано
//   8. рост количества продажи: хватает запаса на ее дату

class EditValidator {
public:
    explicit EditValidator(std::shared_ptr<ILedgerDatabase> database);

    // NotFound для неизвестной записи, InvalidArgument для некорректных
    // значений; нарушение правила - решение Rejected, а не ошибка
    LedgerResult<EditDecision> validate(RecordId id, const EditRequest& request) const;

    LedgerResult<EditDecision> validate(
        const TransactionRecord& original,
        const EditRequest& request) const;

    // Удалять можно только покупку, из которой ничего не израсходовано
    LedgerResult<std::optional<EditRejection>> checkDelete(
        const TransactionRecord& record) const;

private:
    std::shared_ptr<ILedgerDatabase> database_;
    LotLedger ledger_;

    LedgerResult<std::optional<EditRejection>> evaluateRules(
        const TransactionRecord& original,
        const TransactionRecord& proposed) const;

    LedgerResult<TransactionRecord> loadTransaction(RecordId id) const;
};

}  // namespace lotledger
