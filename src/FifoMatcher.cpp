#include "FifoMatcher.hpp"
#include "LotLedger.hpp"
#include <algorithm>
#include <sstream>

namespace lotledger {

LedgerResult<MatchResult> FifoMatcher::match(
    const std::vector<AvailableLot>& lots,
    double disposalQuantity,
    const Date& disposalDate,
    double disposalUnitPrice)
{
    if (disposalQuantity <= 0.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Disposal quantity must be positive"));
    }

    if (disposalUnitPrice <= 0.0) {
        return std::unexpected(LedgerError::invalidArgument(
            "Disposal unit price must be positive"));
    }

    // Лот позже продажи дал бы отрицательный срок владения: вызывающий
    // обязан отобрать лоты по дате, иначе это ошибка аргумента
    for (const auto& lot : lots) {
        if (lot.date > disposalDate) {
            return std::unexpected(LedgerError::invalidArgument(
                "Lot " + std::to_string(lot.acquisitionId) + " dated " +
                formatDate(lot.date) + " is later than disposal date " +
                formatDate(disposalDate)));
        }
    }

    double totalAvailable = LotLedger::totalAvailable(lots);
    if (totalAvailable < disposalQuantity - kQuantityEpsilon) {
        double shortfall = disposalQuantity - totalAvailable;

        std::ostringstream oss;
        oss << "Insufficient inventory: requested " << disposalQuantity
            << ", available " << totalAvailable;
        return std::unexpected(LedgerError::insufficientInventory(shortfall, oss.str()));
    }

    MatchResult result;
    double remaining = disposalQuantity;

    for (const auto& lot : lots) {
        if (remaining <= kQuantityEpsilon) {
            break;
        }
        if (lot.available <= kQuantityEpsilon) {
            continue;
        }

        MatchedLot matched;
        matched.acquisitionId = lot.acquisitionId;
        matched.acquisitionDate = lot.date;
        matched.quantity = std::min(remaining, lot.available);
        matched.unitCostBasis = lot.unitPrice;
        matched.unitProceeds = disposalUnitPrice;
        matched.cost = matched.quantity * lot.unitPrice;
        matched.proceeds = matched.quantity * disposalUnitPrice;
        matched.holdingPeriodDays = daysBetween(lot.date, disposalDate);

        result.totalCost += matched.cost;
        result.totalProceeds += matched.proceeds;
        result.matchedLots.push_back(matched);

        remaining -= matched.quantity;
    }

    result.totalGain = result.totalProceeds - result.totalCost;
    return result;
}

}  // namespace lotledger
