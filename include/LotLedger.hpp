#pragma once

#include "ILedgerDatabase.hpp"
#include "LedgerError.hpp"
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Lot Ledger: представление только для чтения
// ═══════════════════════════════════════════════════════════════════════════════
//
// Израсходованное количество каждой покупки не хранится: оно каждый раз
// суммируется по реализованным доходам, поэтому правка не может оставить
// устаревший кэш.

class LotLedger {
public:
    // Граница даты для availableLotsAsOf()
    enum class Cutoff {
        OnOrBefore,      // date <= cutoff
        StrictlyBefore   // date < cutoff
    };

    explicit LotLedger(std::shared_ptr<ILedgerDatabase> database);

    // Лоты с available > 0, по возрастанию даты, затем id.
    // NotFound, если по инструменту нет ни одной покупки.
    LedgerResult<std::vector<AvailableLot>> availableLots(
        std::string_view instrumentId) const;

    // То же, но с отсечкой по дате и без ошибки NotFound
    LedgerResult<std::vector<AvailableLot>> availableLotsAsOf(
        std::string_view instrumentId,
        const Date& cutoff,
        Cutoff mode,
        std::optional<RecordId> excluding = std::nullopt) const;

    // Все покупки инструмента: исходное, израсходованное и доступное количество
    LedgerResult<std::vector<LotPosition>> lotPositions(
        std::string_view instrumentId) const;

    // Σ количеств, взятых из покупки всеми продажами
    LedgerResult<double> matchedQuantity(RecordId acquisitionId) const;

    static double totalAvailable(const std::vector<AvailableLot>& lots) noexcept;

private:
    std::shared_ptr<ILedgerDatabase> database_;
};

}  // namespace lotledger
