#include "InMemoryDatabase.hpp"
#include <algorithm>
#include <set>

namespace lotledger {

namespace {

// Порядок сделок: дата, затем id (порядок вставки)
bool transactionOrder(const TransactionRecord& a, const TransactionRecord& b)
{
    if (a.date != b.date) {
        return a.date < b.date;
    }
    return a.id < b.id;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Внедрение отказов и транзакции
// ═══════════════════════════════════════════════════════════════════════════════

void InMemoryDatabase::failOn(const std::string& operation, std::size_t succeedingCalls) {
    failures_[operation] = succeedingCalls;
}

Result InMemoryDatabase::checkInjectedFailure(const std::string& operation) {
    auto it = failures_.find(operation);
    if (it == failures_.end()) {
        return Result{};
    }

    if (it->second > 0) {
        --it->second;
        return Result{};
    }

    failures_.erase(it);
    return std::unexpected("Injected failure in " + operation);
}

Result InMemoryDatabase::runInTransaction(const TransactionWork& work) {
    if (transactionDepth_ > 0) {
        // Вложенный вызов: откат выполнит внешняя транзакция
        return work();
    }

    State snapshot = state_;
    ++transactionDepth_;

    Result result;
    try {
        result = work();
    } catch (...) {
        state_ = std::move(snapshot);
        --transactionDepth_;
        throw;
    }

    --transactionDepth_;

    if (!result) {
        state_ = std::move(snapshot);
    }

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Сделки
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> InMemoryDatabase::insertTransaction(
    const TransactionRecord& record
) {
    auto injected = checkInjectedFailure("insertTransaction");
    if (!injected) {
        return std::unexpected(injected.error());
    }

    if (record.instrumentId.empty()) {
        return std::unexpected("Instrument ID is required");
    }
    if (record.quantity <= 0.0 || record.unitPrice <= 0.0) {
        return std::unexpected("Quantity and price must be positive");
    }

    TransactionRecord stored = record;
    stored.id = state_.nextTransactionId++;
    state_.transactions[stored.id] = stored;

    return stored.id;
}

Result InMemoryDatabase::updateTransaction(const TransactionRecord& record) {
    auto injected = checkInjectedFailure("updateTransaction");
    if (!injected) {
        return injected;
    }

    auto it = state_.transactions.find(record.id);
    if (it == state_.transactions.end()) {
        return std::unexpected("Transaction not found: " + std::to_string(record.id));
    }
    if (record.quantity <= 0.0 || record.unitPrice <= 0.0) {
        return std::unexpected("Quantity and price must be positive");
    }

    it->second = record;
    return Result{};
}

Result InMemoryDatabase::deleteTransaction(RecordId id) {
    auto injected = checkInjectedFailure("deleteTransaction");
    if (!injected) {
        return injected;
    }

    if (state_.transactions.find(id) == state_.transactions.end()) {
        return std::unexpected("Transaction not found: " + std::to_string(id));
    }

    // Как ON DELETE RESTRICT: нельзя удалить запись, на которую ссылаются доходы
    for (const auto& [gainId, gain] : state_.gains) {
        if (gain.acquisitionId == id || gain.disposalId == id) {
            return std::unexpected("Transaction " + std::to_string(id) +
                                   " is referenced by realized gain " +
                                   std::to_string(gainId));
        }
    }

    state_.transactions.erase(id);
    return Result{};
}

std::expected<std::optional<TransactionRecord>, std::string> InMemoryDatabase::getTransaction(
    RecordId id
) {
    auto it = state_.transactions.find(id);
    if (it == state_.transactions.end()) {
        return std::optional<TransactionRecord>{};
    }
    return std::optional<TransactionRecord>{it->second};
}

std::expected<std::vector<TransactionRecord>, std::string> InMemoryDatabase::listTransactions(
    std::string_view instrumentId,
    std::optional<TransactionType> typeFilter
) {
    std::vector<TransactionRecord> result;

    for (const auto& [id, record] : state_.transactions) {
        bool instrumentMatch = instrumentId.empty() || record.instrumentId == instrumentId;
        bool typeMatch = !typeFilter || record.type == *typeFilter;

        if (instrumentMatch && typeMatch) {
            result.push_back(record);
        }
    }

    std::stable_sort(result.begin(), result.end(), transactionOrder);
    return result;
}

std::expected<std::vector<std::string>, std::string> InMemoryDatabase::listInstruments() {
    std::set<std::string> instruments;

    for (const auto& [id, record] : state_.transactions) {
        instruments.insert(record.instrumentId);
    }

    return std::vector<std::string>(instruments.begin(), instruments.end());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Реализованные доходы
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> InMemoryDatabase::insertRealizedGain(
    const RealizedGain& gain
) {
    auto injected = checkInjectedFailure("insertRealizedGain");
    if (!injected) {
        return std::unexpected(injected.error());
    }

    if (state_.transactions.find(gain.acquisitionId) == state_.transactions.end()) {
        return std::unexpected("Acquisition not found: " + std::to_string(gain.acquisitionId));
    }
    if (state_.transactions.find(gain.disposalId) == state_.transactions.end()) {
        return std::unexpected("Disposal not found: " + std::to_string(gain.disposalId));
    }

    RealizedGain stored = gain;
    stored.id = state_.nextGainId++;
    state_.gains[stored.id] = stored;

    return stored.id;
}

Result InMemoryDatabase::updateRealizedGain(const RealizedGain& gain) {
    auto injected = checkInjectedFailure("updateRealizedGain");
    if (!injected) {
        return injected;
    }

    auto it = state_.gains.find(gain.id);
    if (it == state_.gains.end()) {
        return std::unexpected("Realized gain not found: " + std::to_string(gain.id));
    }

    it->second = gain;
    return Result{};
}

Result InMemoryDatabase::deleteRealizedGainsForDisposal(RecordId disposalId) {
    auto injected = checkInjectedFailure("deleteRealizedGainsForDisposal");
    if (!injected) {
        return injected;
    }

    std::erase_if(state_.gains, [disposalId](const auto& item) {
        return item.second.disposalId == disposalId;
    });

    return Result{};
}

std::expected<std::vector<RealizedGain>, std::string> InMemoryDatabase::listGainsForAcquisition(
    RecordId acquisitionId
) {
    std::vector<RealizedGain> result;
    for (const auto& [id, gain] : state_.gains) {
        if (gain.acquisitionId == acquisitionId) {
            result.push_back(gain);
        }
    }
    return result;
}

std::expected<std::vector<RealizedGain>, std::string> InMemoryDatabase::listGainsForDisposal(
    RecordId disposalId
) {
    std::vector<RealizedGain> result;
    for (const auto& [id, gain] : state_.gains) {
        if (gain.disposalId == disposalId) {
            result.push_back(gain);
        }
    }
    return result;
}

std::expected<std::vector<RealizedGain>, std::string> InMemoryDatabase::listGainsForInstrument(
    std::string_view instrumentId
) {
    std::vector<RealizedGain> result;
    for (const auto& [id, gain] : state_.gains) {
        if (gain.instrumentId == instrumentId) {
            result.push_back(gain);
        }
    }
    return result;
}

std::expected<std::vector<RealizedGain>, std::string> InMemoryDatabase::listGainsByDisposalDate(
    const Date& from,
    const Date& to
) {
    std::vector<RealizedGain> result;

    for (const auto& [id, gain] : state_.gains) {
        auto disposal = state_.transactions.find(gain.disposalId);
        if (disposal == state_.transactions.end()) {
            return std::unexpected("Dangling realized gain " + std::to_string(id));
        }

        if (disposal->second.date >= from && disposal->second.date <= to) {
            result.push_back(gain);
        }
    }

    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Журнал правок
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> InMemoryDatabase::insertAuditEntry(
    const AuditEntry& entry
) {
    auto injected = checkInjectedFailure("insertAuditEntry");
    if (!injected) {
        return std::unexpected(injected.error());
    }

    AuditEntry stored = entry;
    stored.id = state_.nextAuditId++;
    state_.audit[stored.id] = stored;

    return stored.id;
}

std::expected<std::vector<AuditEntry>, std::string> InMemoryDatabase::listAuditEntries(
    RecordId recordId
) {
    std::vector<AuditEntry> result;
    for (const auto& [id, entry] : state_.audit) {
        if (entry.recordId == recordId) {
            result.push_back(entry);
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const AuditEntry& a, const AuditEntry& b) {
                         if (a.timestamp != b.timestamp) {
                             return a.timestamp < b.timestamp;
                         }
                         return a.id < b.id;
                     });
    return result;
}

Result InMemoryDatabase::deleteAuditEntries(RecordId recordId) {
    auto injected = checkInjectedFailure("deleteAuditEntries");
    if (!injected) {
        return injected;
    }

    std::erase_if(state_.audit, [recordId](const auto& item) {
        return item.second.recordId == recordId;
    });

    return Result{};
}

}  // namespace lotledger
