#include "SQLiteDatabase.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace lotledger {

namespace {

constexpr const char* kTransactionColumns =
    "id, instrument_id, transaction_type, transaction_date, quantity, unit_price, notes";

constexpr const char* kGainColumns =
    "id, acquisition_id, disposal_id, instrument_id, quantity, unit_cost_basis, "
    "unit_proceeds, holding_period_days, gain_type, gain_amount";

std::string columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

void bindText(sqlite3_stmt* stmt, int index, std::string_view value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

// modified_at хранится в наносекундах от эпохи
std::int64_t toNanoseconds(const TimePoint& tp)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint fromNanoseconds(std::int64_t ns)
{
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(ns)));
}

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Конструктор и деструктор
// ═════════════════════════════════════════════════════════════════════════════

SQLiteDatabase::SQLiteDatabase(std::string_view dbPath)
    : dbPath_(dbPath), initialized_(false) {
    if (!dbPath.empty()) {
        auto result = initializeDatabase(dbPath);
        if (!result) {
            throw std::runtime_error("Failed to initialize database: " + result.error());
        }
    }
}

SQLiteDatabase::~SQLiteDatabase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Инициализация
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteDatabase::initializeFromOptions(
    const boost::program_options::variables_map& options) {

    if (initialized_) {
        return {};
    }

    if (!options.count("sqlite-path")) {
        return std::unexpected(
            "SQLite database path not specified.\n"
            "Use --sqlite-path <path>");
    }

    return initializeDatabase(options.at("sqlite-path").as<std::string>());
}

Result SQLiteDatabase::initializeDatabase(std::string_view path) {
    if (initialized_) {
        return {};
    }

    dbPath_ = std::string(path);

    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = "Failed to open database: ";
        if (db_) {
            error += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        } else {
            error += "Out of memory";
        }
        return std::unexpected(error);
    }

    // Внешние ключи защищают доходы от удаления связанных сделок
    auto pragmaResult = execute("PRAGMA foreign_keys = ON");
    if (!pragmaResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return pragmaResult;
    }

    auto createResult = createTables();
    if (!createResult) {
        sqlite3_close(db_);
        db_ = nullptr;
        return createResult;
    }

    initialized_ = true;
    return {};
}

Result SQLiteDatabase::execute(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);

    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : "Unknown error";
        sqlite3_free(errMsg);
        return std::unexpected(error);
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// СХЕМА
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteDatabase::createTables() {
    const char* sql = R"(
        -- Покупки и продажи
        CREATE TABLE IF NOT EXISTS transactions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument_id TEXT NOT NULL,
            transaction_type TEXT NOT NULL
                CHECK (transaction_type IN ('ACQUISITION', 'DISPOSAL')),
            transaction_date TEXT NOT NULL,
            quantity REAL NOT NULL CHECK (quantity > 0),
            unit_price REAL NOT NULL CHECK (unit_price > 0),
            notes TEXT NOT NULL DEFAULT ''
        );

        -- Пары (покупка, продажа), созданные FIFO-сопоставлением
        CREATE TABLE IF NOT EXISTS realized_gains (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            acquisition_id INTEGER NOT NULL,
            disposal_id INTEGER NOT NULL,
            instrument_id TEXT NOT NULL,
            quantity REAL NOT NULL CHECK (quantity > 0),
            unit_cost_basis REAL NOT NULL,
            unit_proceeds REAL NOT NULL,
            holding_period_days INTEGER NOT NULL,
            gain_type TEXT NOT NULL CHECK (gain_type IN ('SHORT', 'LONG')),
            gain_amount REAL NOT NULL,
            FOREIGN KEY (acquisition_id) REFERENCES transactions(id) ON DELETE RESTRICT,
            FOREIGN KEY (disposal_id) REFERENCES transactions(id) ON DELETE RESTRICT
        );

        -- Журнал правок (только добавление)
        CREATE TABLE IF NOT EXISTS transaction_audit (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            transaction_id INTEGER NOT NULL,
            modified_at INTEGER NOT NULL,
            field_name TEXT NOT NULL,
            old_value TEXT,
            new_value TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_transactions_instrument
            ON transactions(instrument_id, transaction_date);
        CREATE INDEX IF NOT EXISTS idx_gains_acquisition ON realized_gains(acquisition_id);
        CREATE INDEX IF NOT EXISTS idx_gains_disposal ON realized_gains(disposal_id);
        CREATE INDEX IF NOT EXISTS idx_audit_transaction
            ON transaction_audit(transaction_id, modified_at);
    )";

    auto result = execute(sql);
    if (!result) {
        return std::unexpected("Failed to create tables: " + result.error());
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Транзакции хранилища
// ═════════════════════════════════════════════════════════════════════════════

Result SQLiteDatabase::runInTransaction(const TransactionWork& work) {
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    if (transactionDepth_ > 0) {
        return work();
    }

    auto begin = execute("BEGIN IMMEDIATE");
    if (!begin) {
        return std::unexpected("Failed to begin transaction: " + begin.error());
    }

    ++transactionDepth_;

    Result result;
    try {
        result = work();
    } catch (...) {
        --transactionDepth_;
        auto rollback = execute("ROLLBACK");
        if (!rollback) {
            std::cerr << "[SQLiteDatabase] Rollback failed: " << rollback.error() << std::endl;
        }
        throw;
    }

    --transactionDepth_;

    if (!result) {
        auto rollback = execute("ROLLBACK");
        if (!rollback) {
            return std::unexpected(result.error() + "; rollback failed: " + rollback.error());
        }
        return result;
    }

    auto commit = execute("COMMIT");
    if (!commit) {
        auto rollback = execute("ROLLBACK");
        if (!rollback) {
            std::cerr << "[SQLiteDatabase] Rollback failed: " << rollback.error() << std::endl;
        }
        return std::unexpected("Failed to commit transaction: " + commit.error());
    }

    return {};
}

// ═════════════════════════════════════════════════════════════════════════════
// Чтение строк
// ═════════════════════════════════════════════════════════════════════════════

std::expected<TransactionRecord, std::string> SQLiteDatabase::readTransaction(sqlite3_stmt* stmt) {
    TransactionRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.instrumentId = columnText(stmt, 1);

    auto type = parseTransactionType(columnText(stmt, 2));
    if (!type) {
        return std::unexpected(type.error());
    }
    record.type = *type;

    auto date = parseDate(columnText(stmt, 3));
    if (!date) {
        return std::unexpected(date.error());
    }
    record.date = *date;

    record.quantity = sqlite3_column_double(stmt, 4);
    record.unitPrice = sqlite3_column_double(stmt, 5);
    record.notes = columnText(stmt, 6);
    return record;
}

std::expected<RealizedGain, std::string> SQLiteDatabase::readGain(sqlite3_stmt* stmt) {
    RealizedGain gain;
    gain.id = sqlite3_column_int64(stmt, 0);
    gain.acquisitionId = sqlite3_column_int64(stmt, 1);
    gain.disposalId = sqlite3_column_int64(stmt, 2);
    gain.instrumentId = columnText(stmt, 3);
    gain.quantity = sqlite3_column_double(stmt, 4);
    gain.unitCostBasis = sqlite3_column_double(stmt, 5);
    gain.unitProceeds = sqlite3_column_double(stmt, 6);
    gain.holdingPeriodDays = sqlite3_column_int64(stmt, 7);

    auto bucket = parseGainBucket(columnText(stmt, 8));
    if (!bucket) {
        return std::unexpected(bucket.error());
    }
    gain.bucket = *bucket;

    gain.gainAmount = sqlite3_column_double(stmt, 9);
    return gain;
}

AuditEntry SQLiteDatabase::readAuditEntry(sqlite3_stmt* stmt) {
    AuditEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.recordId = sqlite3_column_int64(stmt, 1);
    entry.timestamp = fromNanoseconds(sqlite3_column_int64(stmt, 2));
    entry.fieldName = columnText(stmt, 3);
    entry.oldValue = columnText(stmt, 4);
    entry.newValue = columnText(stmt, 5);
    return entry;
}

// ═════════════════════════════════════════════════════════════════════════════
// Сделки
// ═════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> SQLiteDatabase::insertTransaction(
    const TransactionRecord& record)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        INSERT INTO transactions
            (instrument_id, transaction_type, transaction_date, quantity, unit_price, notes)
        VALUES (?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    std::string date = formatDate(record.date);
    bindText(stmt, 1, record.instrumentId);
    bindText(stmt, 2, toString(record.type));
    bindText(stmt, 3, date);
    sqlite3_bind_double(stmt, 4, record.quantity);
    sqlite3_bind_double(stmt, 5, record.unitPrice);
    bindText(stmt, 6, record.notes);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to insert transaction: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

Result SQLiteDatabase::updateTransaction(const TransactionRecord& record)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        UPDATE transactions
        SET instrument_id = ?, transaction_type = ?, transaction_date = ?,
            quantity = ?, unit_price = ?, notes = ?
        WHERE id = ?
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    std::string date = formatDate(record.date);
    bindText(stmt, 1, record.instrumentId);
    bindText(stmt, 2, toString(record.type));
    bindText(stmt, 3, date);
    sqlite3_bind_double(stmt, 4, record.quantity);
    sqlite3_bind_double(stmt, 5, record.unitPrice);
    bindText(stmt, 6, record.notes);
    sqlite3_bind_int64(stmt, 7, record.id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to update transaction: " + std::string(sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return std::unexpected("Transaction not found: " + std::to_string(record.id));
    }

    return {};
}

Result SQLiteDatabase::deleteTransaction(RecordId id)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = "DELETE FROM transactions WHERE id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete transaction: " + std::string(sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return std::unexpected("Transaction not found: " + std::to_string(id));
    }

    return {};
}

std::expected<std::optional<TransactionRecord>, std::string> SQLiteDatabase::getTransaction(
    RecordId id)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    std::string sql = std::string("SELECT ") + kTransactionColumns +
                      " FROM transactions WHERE id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, id);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        sqlite3_finalize(stmt);
        return std::optional<TransactionRecord>{};
    }

    if (rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return std::unexpected("Error reading transaction: " + error);
    }

    auto record = readTransaction(stmt);
    sqlite3_finalize(stmt);

    if (!record) {
        return std::unexpected(record.error());
    }

    return std::optional<TransactionRecord>{*record};
}

std::expected<std::vector<TransactionRecord>, std::string> SQLiteDatabase::listTransactions(
    std::string_view instrumentId,
    std::optional<TransactionType> typeFilter)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    std::string sql = std::string("SELECT ") + kTransactionColumns +
                      " FROM transactions WHERE (? = '' OR instrument_id = ?)";
    if (typeFilter) {
        sql += " AND transaction_type = ?";
    }
    sql += " ORDER BY transaction_date ASC, id ASC";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    bindText(stmt, 1, instrumentId);
    bindText(stmt, 2, instrumentId);
    if (typeFilter) {
        bindText(stmt, 3, toString(*typeFilter));
    }

    std::vector<TransactionRecord> records;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto record = readTransaction(stmt);
        if (!record) {
            sqlite3_finalize(stmt);
            return std::unexpected(record.error());
        }
        records.push_back(std::move(*record));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading transactions: " + std::string(sqlite3_errmsg(db_)));
    }

    return records;
}

std::expected<std::vector<std::string>, std::string> SQLiteDatabase::listInstruments()
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = "SELECT DISTINCT instrument_id FROM transactions ORDER BY instrument_id";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    std::vector<std::string> instruments;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        instruments.push_back(columnText(stmt, 0));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading instruments: " + std::string(sqlite3_errmsg(db_)));
    }

    return instruments;
}

// ═════════════════════════════════════════════════════════════════════════════
// Реализованные доходы
// ═════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> SQLiteDatabase::insertRealizedGain(
    const RealizedGain& gain)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        INSERT INTO realized_gains
            (acquisition_id, disposal_id, instrument_id, quantity, unit_cost_basis,
             unit_proceeds, holding_period_days, gain_type, gain_amount)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, gain.acquisitionId);
    sqlite3_bind_int64(stmt, 2, gain.disposalId);
    bindText(stmt, 3, gain.instrumentId);
    sqlite3_bind_double(stmt, 4, gain.quantity);
    sqlite3_bind_double(stmt, 5, gain.unitCostBasis);
    sqlite3_bind_double(stmt, 6, gain.unitProceeds);
    sqlite3_bind_int64(stmt, 7, gain.holdingPeriodDays);
    bindText(stmt, 8, toString(gain.bucket));
    sqlite3_bind_double(stmt, 9, gain.gainAmount);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to insert realized gain: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

Result SQLiteDatabase::updateRealizedGain(const RealizedGain& gain)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        UPDATE realized_gains
        SET acquisition_id = ?, disposal_id = ?, instrument_id = ?, quantity = ?,
            unit_cost_basis = ?, unit_proceeds = ?, holding_period_days = ?,
            gain_type = ?, gain_amount = ?
        WHERE id = ?
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, gain.acquisitionId);
    sqlite3_bind_int64(stmt, 2, gain.disposalId);
    bindText(stmt, 3, gain.instrumentId);
    sqlite3_bind_double(stmt, 4, gain.quantity);
    sqlite3_bind_double(stmt, 5, gain.unitCostBasis);
    sqlite3_bind_double(stmt, 6, gain.unitProceeds);
    sqlite3_bind_int64(stmt, 7, gain.holdingPeriodDays);
    bindText(stmt, 8, toString(gain.bucket));
    sqlite3_bind_double(stmt, 9, gain.gainAmount);
    sqlite3_bind_int64(stmt, 10, gain.id);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to update realized gain: " + std::string(sqlite3_errmsg(db_)));
    }

    if (sqlite3_changes(db_) == 0) {
        return std::unexpected("Realized gain not found: " + std::to_string(gain.id));
    }

    return {};
}

Result SQLiteDatabase::deleteRealizedGainsForDisposal(RecordId disposalId)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = "DELETE FROM realized_gains WHERE disposal_id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, disposalId);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete realized gains: " + std::string(sqlite3_errmsg(db_)));
    }

    return {};
}

std::expected<std::vector<RealizedGain>, std::string> SQLiteDatabase::queryGains(
    const char* sql,
    const std::function<void(sqlite3_stmt*)>& bind)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    bind(stmt);

    std::vector<RealizedGain> gains;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto gain = readGain(stmt);
        if (!gain) {
            sqlite3_finalize(stmt);
            return std::unexpected(gain.error());
        }
        gains.push_back(std::move(*gain));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading realized gains: " + std::string(sqlite3_errmsg(db_)));
    }

    return gains;
}

std::expected<std::vector<RealizedGain>, std::string> SQLiteDatabase::listGainsForAcquisition(
    RecordId acquisitionId)
{
    std::string sql = std::string("SELECT ") + kGainColumns +
                      " FROM realized_gains WHERE acquisition_id = ? ORDER BY id";

    return queryGains(sql.c_str(), [acquisitionId](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, acquisitionId);
    });
}

std::expected<std::vector<RealizedGain>, std::string> SQLiteDatabase::listGainsForDisposal(
    RecordId disposalId)
{
    std::string sql = std::string("SELECT ") + kGainColumns +
                      " FROM realized_gains WHERE disposal_id = ? ORDER BY id";

    return queryGains(sql.c_str(), [disposalId](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, disposalId);
    });
}

std::expected<std::vector<RealizedGain>, std::string> SQLiteDatabase::listGainsForInstrument(
    std::string_view instrumentId)
{
    std::string sql = std::string("SELECT ") + kGainColumns +
                      " FROM realized_gains WHERE instrument_id = ? ORDER BY id";

    return queryGains(sql.c_str(), [instrumentId](sqlite3_stmt* stmt) {
        bindText(stmt, 1, instrumentId);
    });
}

std::expected<std::vector<RealizedGain>, std::string> SQLiteDatabase::listGainsByDisposalDate(
    const Date& from,
    const Date& to)
{
    // Даты YYYY-MM-DD сравниваются лексикографически
    const char* sql = R"(
        SELECT g.id, g.acquisition_id, g.disposal_id, g.instrument_id, g.quantity,
               g.unit_cost_basis, g.unit_proceeds, g.holding_period_days,
               g.gain_type, g.gain_amount
        FROM realized_gains g
        JOIN transactions d ON d.id = g.disposal_id
        WHERE d.transaction_date BETWEEN ? AND ?
        ORDER BY g.id
    )";

    std::string fromText = formatDate(from);
    std::string toText = formatDate(to);

    return queryGains(sql, [&fromText, &toText](sqlite3_stmt* stmt) {
        bindText(stmt, 1, fromText);
        bindText(stmt, 2, toText);
    });
}

// ═════════════════════════════════════════════════════════════════════════════
// Журнал правок
// ═════════════════════════════════════════════════════════════════════════════

std::expected<RecordId, std::string> SQLiteDatabase::insertAuditEntry(
    const AuditEntry& entry)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        INSERT INTO transaction_audit
            (transaction_id, modified_at, field_name, old_value, new_value)
        VALUES (?, ?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, entry.recordId);
    sqlite3_bind_int64(stmt, 2, toNanoseconds(entry.timestamp));
    bindText(stmt, 3, entry.fieldName);
    bindText(stmt, 4, entry.oldValue);
    bindText(stmt, 5, entry.newValue);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to insert audit entry: " + std::string(sqlite3_errmsg(db_)));
    }

    return sqlite3_last_insert_rowid(db_);
}

std::expected<std::vector<AuditEntry>, std::string> SQLiteDatabase::listAuditEntries(
    RecordId recordId)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = R"(
        SELECT id, transaction_id, modified_at, field_name, old_value, new_value
        FROM transaction_audit
        WHERE transaction_id = ?
        ORDER BY modified_at ASC, id ASC
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, recordId);

    std::vector<AuditEntry> entries;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(readAuditEntry(stmt));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Error reading audit entries: " + std::string(sqlite3_errmsg(db_)));
    }

    return entries;
}

Result SQLiteDatabase::deleteAuditEntries(RecordId recordId)
{
    if (!initialized_ || !db_) {
        return std::unexpected("Database not initialized");
    }

    const char* sql = "DELETE FROM transaction_audit WHERE transaction_id = ?";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

    if (rc != SQLITE_OK) {
        return std::unexpected("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    sqlite3_bind_int64(stmt, 1, recordId);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return std::unexpected("Failed to delete audit entries: " + std::string(sqlite3_errmsg(db_)));
    }

    return {};
}

}  // namespace lotledger
