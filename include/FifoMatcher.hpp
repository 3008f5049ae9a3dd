#pragma once

#include "LedgerError.hpp"
#include "LedgerTypes.hpp"
#include <vector>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Результат сопоставления
// ═══════════════════════════════════════════════════════════════════════════════

struct MatchedLot {
    RecordId acquisitionId = 0;
    Date acquisitionDate{};
    double quantity = 0.0;
    double unitCostBasis = 0.0;
    double unitProceeds = 0.0;
    double cost = 0.0;        // quantity * unitCostBasis
    double proceeds = 0.0;    // quantity * unitProceeds
    std::int64_t holdingPeriodDays = 0;

    double gain() const noexcept { return proceeds - cost; }
};

struct MatchResult {
    std::vector<MatchedLot> matchedLots;
    double totalCost = 0.0;
    double totalProceeds = 0.0;
    double totalGain = 0.0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// FIFO Matcher
// ═══════════════════════════════════════════════════════════════════════════════

class FifoMatcher {
public:
    // Расходует лоты в переданном порядке (старые первыми).
    // Порядок не пересортировывается: одинаковые даты остаются
    // в порядке, заданном Lot Ledger.
    // При нехватке возвращает InsufficientInventory с недостающим
    // количеством и не возвращает частичный результат.
    static LedgerResult<MatchResult> match(
        const std::vector<AvailableLot>& lots,
        double disposalQuantity,
        const Date& disposalDate,
        double disposalUnitPrice);
};

}  // namespace lotledger
