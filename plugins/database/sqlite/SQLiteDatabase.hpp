#pragma once

#include "ILedgerDatabase.hpp"
#include <sqlite3.h>
#include <string>
#include <boost/program_options.hpp>

namespace lotledger {

class SQLiteDatabase : public ILedgerDatabase {
public:
    // ═════════════════════════════════════════════════════════════════════════
    // Конструкторы и деструктор
    // ═════════════════════════════════════════════════════════════════════════

    // Пустой путь: база открывается позже через initializeFromOptions()
    explicit SQLiteDatabase(std::string_view dbPath);
    ~SQLiteDatabase() override;

    // Disable copy
    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    Result initializeFromOptions(
        const boost::program_options::variables_map& options) override;

    // ═════════════════════════════════════════════════════════════════════════
    // ILedgerDatabase interface
    // ═════════════════════════════════════════════════════════════════════════

    Result runInTransaction(const TransactionWork& work) override;

    std::expected<RecordId, std::string> insertTransaction(
        const TransactionRecord& record) override;

    Result updateTransaction(const TransactionRecord& record) override;

    Result deleteTransaction(RecordId id) override;

    std::expected<std::optional<TransactionRecord>, std::string> getTransaction(
        RecordId id) override;

    std::expected<std::vector<TransactionRecord>, std::string> listTransactions(
        std::string_view instrumentId,
        std::optional<TransactionType> typeFilter = std::nullopt) override;

    std::expected<std::vector<std::string>, std::string> listInstruments() override;

    std::expected<RecordId, std::string> insertRealizedGain(
        const RealizedGain& gain) override;

    Result updateRealizedGain(const RealizedGain& gain) override;

    Result deleteRealizedGainsForDisposal(RecordId disposalId) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForAcquisition(
        RecordId acquisitionId) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForDisposal(
        RecordId disposalId) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsForInstrument(
        std::string_view instrumentId) override;

    std::expected<std::vector<RealizedGain>, std::string> listGainsByDisposalDate(
        const Date& from,
        const Date& to) override;

    std::expected<RecordId, std::string> insertAuditEntry(
        const AuditEntry& entry) override;

    std::expected<std::vector<AuditEntry>, std::string> listAuditEntries(
        RecordId recordId) override;

    Result deleteAuditEntries(RecordId recordId) override;

    const std::string& path() const noexcept { return dbPath_; }

private:
    sqlite3* db_ = nullptr;
    std::string dbPath_;
    bool initialized_ = false;
    int transactionDepth_ = 0;

    // ═════════════════════════════════════════════════════════════════════════
    // Вспомогательные методы
    // ═════════════════════════════════════════════════════════════════════════

    Result createTables();
    Result initializeDatabase(std::string_view path);
    Result execute(const char* sql);

    // Выполняет SELECT из realized_gains с одним параметром (id или текст)
    std::expected<std::vector<RealizedGain>, std::string> queryGains(
        const char* sql,
        const std::function<void(sqlite3_stmt*)>& bind);

    static std::expected<TransactionRecord, std::string> readTransaction(sqlite3_stmt* stmt);
    static std::expected<RealizedGain, std::string> readGain(sqlite3_stmt* stmt);
    static AuditEntry readAuditEntry(sqlite3_stmt* stmt);
};

}  // namespace lotledger
