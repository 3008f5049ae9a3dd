#pragma once

#include "ILedgerDatabase.hpp"
#include <map>
#include <string>
#include <vector>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// Реализация: InMemoryDatabase
// ═══════════════════════════════════════════════════════════════════════════════

class InMemoryDatabase : public ILedgerDatabase {
private:
    // Всё состояние хранилища: копируется целиком при открытии транзакции
    struct State {
        std::map<RecordId, TransactionRecord> transactions;
        std::map<RecordId, RealizedGain> gains;
        std::map<RecordId, AuditEntry> audit;
        RecordId nextTransactionId = 1;
        RecordId nextGainId = 1;
        RecordId nextAuditId = 1;
    };

    State state_;
    int transactionDepth_ = 0;

    // Внедрение отказов: operation -> сколько успешных вызовов пропустить
    std::map<std::string, std::size_t> failures_;

    Result checkInjectedFailure(const std::string& operation);

public:
    InMemoryDatabase() = default;
    ~InMemoryDatabase() override = default;

    Result runInTransaction(const TransactionWork& work) override;

    std::expected<RecordId, std::string> insertTransaction(
        const TransactionRecord& record
    ) override;

    Result updateTransaction(const TransactionRecord& record) override;

    Result deleteTransaction(RecordId id) override;

    std::expected<std::optional<TransactionRecord>, std::string> getTransaction(
        RecordId id
    ) override;

    std::expected<std::vector<TransactionRecord>, std::string> listTransactions(
        std::string_view instrumentId,
        std::optional<TransactionType> typeFilter = std::nullopt
    ) override;

    std::expected<std::vector<std::string>, std::string> listInstruments() override;

    std::expected<RecordId, std::string> insertRealizedGain(
        const RealizedGain& gain
    ) override;

    Result updateRealizedGain(const RealizedGain& gain) override;

    Result deleteRealizedGainsForDisposal(RecordId disposalId) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForAcquisition(
        RecordId acquisitionId
    ) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForDisposal(
        RecordId disposalId
    ) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForInstrument(
        std::string_view instrumentId
    ) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsByDisposalDate(
        const Date& from,
        const Date& to
    ) override;

    std::expected<RecordId, std::string> insertAuditEntry(
        const AuditEntry& entry
    ) override;

    std::expected<std::vector<AuditEntry>, std::string> listAuditEntries(
        RecordId recordId
    ) override;

    Result deleteAuditEntries(RecordId recordId) override;

    // Вспомогательные методы для тестирования
    std::size_t transactionCount() const { return state_.transactions.size(); }
    std::size_t realizedGainCount() const { return state_.gains.size(); }
    std::size_t auditEntryCount() const { return state_.audit.size(); }
    bool inTransaction() const { return transactionDepth_ > 0; }

    // Вызов operation (имя метода) завершится ошибкой после
    // succeedingCalls успешных вызовов. Срабатывает один раз.
    void failOn(const std::string& operation, std::size_t succeedingCalls = 0);
    void clearFailures() { failures_.clear(); }
};

}  // namespace lotledger
