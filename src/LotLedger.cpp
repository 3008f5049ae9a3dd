#include "LotLedger.hpp"
#include <map>

namespace lotledger {

LotLedger::LotLedger(std::shared_ptr<ILedgerDatabase> database)
    : database_(std::move(database))
{
}

LedgerResult<std::vector<LotPosition>> LotLedger::lotPositions(
    std::string_view instrumentId) const
{
    auto acquisitions = fromStorage(
        database_->listTransactions(instrumentId, TransactionType::Acquisition));
    if (!acquisitions) {
        return std::unexpected(acquisitions.error());
    }

    auto gains = fromStorage(database_->listGainsForInstrument(instrumentId));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    std::map<RecordId, double> consumed;
    for (const auto& gain : *gains) {
        consumed[gain.acquisitionId] += gain.quantity;
    }

    // listTransactions уже упорядочен по дате, затем по id
    std::vector<LotPosition> positions;
    positions.reserve(acquisitions->size());

    for (const auto& record : *acquisitions) {
        LotPosition position;
        position.acquisitionId = record.id;
        position.date = record.date;
        position.unitPrice = record.unitPrice;
        position.quantity = record.quantity;

        auto it = consumed.find(record.id);
        position.consumed = it != consumed.end() ? it->second : 0.0;

        positions.push_back(position);
    }

    return positions;
}

LedgerResult<std::vector<AvailableLot>> LotLedger::availableLots(
    std::string_view instrumentId) const
{
    auto positions = lotPositions(instrumentId);
    if (!positions) {
        return std::unexpected(positions.error());
    }

    if (positions->empty()) {
        return std::unexpected(LedgerError::notFound(
            "No acquisitions recorded for instrument: " + std::string(instrumentId)));
    }

    std::vector<AvailableLot> lots;
    for (const auto& position : *positions) {
        double available = position.available();
        if (available > kQuantityEpsilon) {
            lots.push_back({position.acquisitionId, position.date, position.unitPrice, available});
        }
    }

    return lots;
}

LedgerResult<std::vector<AvailableLot>> LotLedger::availableLotsAsOf(
    std::string_view instrumentId,
    const Date& cutoff,
    Cutoff mode,
    std::optional<RecordId> excluding) const
{
    auto positions = lotPositions(instrumentId);
    if (!positions) {
        return std::unexpected(positions.error());
    }

    std::vector<AvailableLot> lots;
    for (const auto& position : *positions) {
        if (excluding && position.acquisitionId == *excluding) {
            continue;
        }

        bool eligible = mode == Cutoff::OnOrBefore
            ? position.date <= cutoff
            : position.date < cutoff;
        if (!eligible) {
            continue;
        }

        double available = position.available();
        if (available > kQuantityEpsilon) {
            lots.push_back({position.acquisitionId, position.date, position.unitPrice, available});
        }
    }

    return lots;
}

LedgerResult<double> LotLedger::matchedQuantity(RecordId acquisitionId) const
{
    auto gains = fromStorage(database_->listGainsForAcquisition(acquisitionId));
    if (!gains) {
        return std::unexpected(gains.error());
    }

    double total = 0.0;
    for (const auto& gain : *gains) {
        total += gain.quantity;
    }
    return total;
}

double LotLedger::totalAvailable(const std::vector<AvailableLot>& lots) noexcept
{
    double total = 0.0;
    for (const auto& lot : lots) {
        total += lot.available;
    }
    return total;
}

}  // namespace lotledger
