#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lotledger {

using TimePoint = std::chrono::system_clock::time_point;
using Date = std::chrono::sys_days;
using RecordId = std::int64_t;
using Result = std::expected<void, std::string>;

// Погрешность сравнения количеств (double)
inline constexpr double kQuantityEpsilon = 1e-9;

// Граница долгосрочного владения: LONG строго при > 365 дней
inline constexpr std::int64_t kLongTermThresholdDays = 365;

// ═══════════════════════════════════════════════════════════════════════════════
// Тип операции
// ═══════════════════════════════════════════════════════════════════════════════

enum class TransactionType {
    Acquisition,   // Покупка (лот)
    Disposal       // Продажа
};

enum class GainBucket {
    Short,
    Long
};

// ═══════════════════════════════════════════════════════════════════════════════
// Записи хранилища
// ═══════════════════════════════════════════════════════════════════════════════

struct TransactionRecord {
    RecordId id = 0;
    std::string instrumentId;
    TransactionType type = TransactionType::Acquisition;
    Date date{};
    double quantity = 0.0;
    double unitPrice = 0.0;
    std::string notes;

    bool isAcquisition() const noexcept { return type == TransactionType::Acquisition; }
    bool isDisposal() const noexcept { return type == TransactionType::Disposal; }
};

// Одна пара (покупка, продажа), созданная FIFO-сопоставлением
struct RealizedGain {
    RecordId id = 0;
    RecordId acquisitionId = 0;
    RecordId disposalId = 0;
    std::string instrumentId;
    double quantity = 0.0;
    double unitCostBasis = 0.0;
    double unitProceeds = 0.0;
    std::int64_t holdingPeriodDays = 0;
    GainBucket bucket = GainBucket::Short;
    double gainAmount = 0.0;

    double cost() const noexcept { return quantity * unitCostBasis; }
    double proceeds() const noexcept { return quantity * unitProceeds; }
};

// Старое и новое значения хранятся как JSON-текст
struct AuditEntry {
    RecordId id = 0;
    RecordId recordId = 0;
    TimePoint timestamp{};
    std::string fieldName;
    std::string oldValue;
    std::string newValue;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Производные представления (не хранятся)
// ═══════════════════════════════════════════════════════════════════════════════

struct AvailableLot {
    RecordId acquisitionId = 0;
    Date date{};
    double unitPrice = 0.0;
    double available = 0.0;
};

struct LotPosition {
    RecordId acquisitionId = 0;
    Date date{};
    double unitPrice = 0.0;
    double quantity = 0.0;
    double consumed = 0.0;

    double available() const noexcept { return quantity - consumed; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Даты и строковые представления
// ═══════════════════════════════════════════════════════════════════════════════

// Разница в календарных днях: to - from
std::int64_t daysBetween(const Date& from, const Date& to) noexcept;

Date makeDate(int year, unsigned month, unsigned day);

// Формат YYYY-MM-DD
std::expected<Date, std::string> parseDate(std::string_view text);
std::string formatDate(const Date& date);

std::string formatTimestamp(const TimePoint& timestamp);

std::string_view toString(TransactionType type) noexcept;
std::expected<TransactionType, std::string> parseTransactionType(std::string_view text);

std::string_view toString(GainBucket bucket) noexcept;
std::expected<GainBucket, std::string> parseGainBucket(std::string_view text);

}  // namespace lotledger
