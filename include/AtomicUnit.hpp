#pragma once

#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include <functional>
#include <optional>

namespace lotledger {

// Выполняет work в одной транзакции хранилища.
// Типизированная ошибка work возвращается вызывающему как есть
// (после отката); сбой самого хранилища (BEGIN/COMMIT) становится
// PersistenceFailure.
inline LedgerStatus runAtomically(ILedgerDatabase& database,
                                  const std::function<LedgerStatus()>& work)
{
    std::optional<LedgerError> failure;

    auto result = database.runInTransaction([&]() -> Result {
        auto status = work();
        if (!status) {
            failure = status.error();
            return std::unexpected(status.error().message);
        }
        return {};
    });

    if (failure) {
        return std::unexpected(*failure);
    }
    if (!result) {
        return std::unexpected(LedgerError::persistence(result.error()));
    }
    return {};
}

}  // namespace lotledger
