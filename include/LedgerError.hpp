#pragma once

#include "LedgerTypes.hpp"
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Виды ошибок движка
// ═══════════════════════════════════════════════════════════════════════════════

enum class ErrorKind {
    InvalidArgument,         // Некорректное количество / цена / дата
    InsufficientInventory,   // Продажа превышает доступные лоты
    EditRejected,            // Правило валидатора правок
    NotFound,                // Неизвестная запись или инструмент
    PersistenceFailure       // Ошибка хранилища
};

// Правила валидатора правок (порядок = порядок проверки)
enum class EditRule {
    InsufficientAcquisitionQuantity,
    AcquisitionDateConflict,
    DisposalDateConflict,
    TypeChangeInsufficientInventory,
    TypeChangeMatchedDisposal,
    InstrumentChangeWithMatches,
    TypeChangeConsumedAcquisition,
    DisposalQuantityExceedsInventory,
    DeleteWithMatches
};

std::string_view toString(ErrorKind kind) noexcept;
std::string_view toString(EditRule rule) noexcept;

// Структурированная причина отказа: правило + граница
struct EditRejection {
    EditRule rule = EditRule::InsufficientAcquisitionQuantity;
    std::string field;
    double bound = 0.0;
    std::optional<Date> boundDate;
    std::vector<RecordId> conflictingRecords;
    std::string message;
};

struct LedgerError {
    ErrorKind kind = ErrorKind::InvalidArgument;
    std::string message;
    double shortfall = 0.0;
    std::optional<EditRejection> rejection;

    static LedgerError invalidArgument(std::string message);
    static LedgerError insufficientInventory(double shortfall, std::string message);
    static LedgerError editRejected(EditRejection rejection);
    static LedgerError notFound(std::string message);
    static LedgerError persistence(std::string cause);

    // Одна строка для вывода пользователю
    std::string describe() const;
};

template<typename T>
using LedgerResult = std::expected<T, LedgerError>;

using LedgerStatus = LedgerResult<void>;

// Ошибка хранилища (строка) -> PersistenceFailure
template<typename T>
LedgerResult<T> fromStorage(std::expected<T, std::string> result)
{
    if (!result) {
        return std::unexpected(LedgerError::persistence(result.error()));
    }
    if constexpr (std::is_void_v<T>) {
        return {};
    } else {
        return std::move(*result);
    }
}

}  // namespace lotledger
