#pragma once

#include "LedgerTypes.hpp"
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <boost/program_options.hpp>

namespace lotledger {

// ═══════════════════════════════════════════════════════════════════════════════
// ИНТЕРФЕЙС: ILedgerDatabase
// ═══════════════════════════════════════════════════════════════════════════════
//
// Хранилище сделок, реализованных доходов и журнала правок.
// Движок не управляет долговечностью сам: все изменяющие операции
// выполняются внутри runInTransaction().

class ILedgerDatabase {
public:
    using TransactionWork = std::function<Result()>;

    virtual ~ILedgerDatabase() = default;

    // Инициализация из опций командной строки.
    // Плагин извлекает только свои опции (с правильным префиксом)
    virtual Result initializeFromOptions(
        [[maybe_unused]] const boost::program_options::variables_map& options) {
        return {};
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Транзакции хранилища
    // ═══════════════════════════════════════════════════════════════════════

    // Выполняет work атомарно. Если work вернул ошибку или бросил
    // исключение, все записи, сделанные внутри, откатываются.
    // Вложенный вызов присоединяется к внешней транзакции.
    virtual Result runInTransaction(const TransactionWork& work) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Сделки (покупки / продажи)
    // ═══════════════════════════════════════════════════════════════════════

    // Поле id игнорируется, возвращается присвоенный идентификатор
    virtual std::expected<RecordId, std::string> insertTransaction(
        const TransactionRecord& record
        ) = 0;

    virtual Result updateTransaction(const TransactionRecord& record) = 0;

    virtual Result deleteTransaction(RecordId id) = 0;

    virtual std::expected<std::optional<TransactionRecord>, std::string> getTransaction(
        RecordId id
        ) = 0;

    // Упорядочено по дате, затем по id
    virtual std::expected<std::vector<TransactionRecord>, std::string> listTransactions(
        std::string_view instrumentId,
        std::optional<TransactionType> typeFilter = std::nullopt
        ) = 0;

    virtual std::expected<std::vector<std::string>, std::string> listInstruments() = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Реализованные доходы
    // ═══════════════════════════════════════════════════════════════════════

    virtual std::expected<RecordId, std::string> insertRealizedGain(
        const RealizedGain& gain
        ) = 0;

    virtual Result updateRealizedGain(const RealizedGain& gain) = 0;

    virtual Result deleteRealizedGainsForDisposal(RecordId disposalId) = 0;

    // Все списки доходов упорядочены по id (порядок создания)
    virtual std::expected<std::vector<RealizedGain>, std::string> listGainsForAcquisition(
        RecordId acquisitionId
        ) = 0;

    virtual std::expected<std::vector<RealizedGain>, std::string> listGainsForDisposal(
        RecordId disposalId
        ) = 0;

    virtual std::expected<std::vector<RealizedGain>, std::string> listGainsForInstrument(
        std::string_view instrumentId
        ) = 0;

    // Доходы, чья продажа датирована в [from, to] включительно
    virtual std::expected<std::vector<RealizedGain>, std::string> listGainsByDisposalDate(
        const Date& from,
        const Date& to
        ) = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Журнал правок
    // ═══════════════════════════════════════════════════════════════════════

    virtual std::expected<RecordId, std::string> insertAuditEntry(
        const AuditEntry& entry
        ) = 0;

    // Упорядочено по времени, затем по id
    virtual std::expected<std::vector<AuditEntry>, std::string> listAuditEntries(
        RecordId recordId
        ) = 0;

    virtual Result deleteAuditEntries(RecordId recordId) = 0;
};

}  // namespace lotledger
