#include "LedgerTypes.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lotledger {

std::int64_t daysBetween(const Date& from, const Date& to) noexcept
{
    return (to - from).count();
}

Date makeDate(int year, unsigned month, unsigned day)
{
    return std::chrono::sys_days{
        std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

std::expected<Date, std::string> parseDate(std::string_view text)
{
    std::tm tm = {};
    std::istringstream ss{std::string(text)};
    ss >> std::get_time(&tm, "%Y-%m-%d");

    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        return std::unexpected("Failed to parse date: " + std::string(text) +
                               ". Expected format: YYYY-MM-DD");
    }

    // std::get_time не проверяет количество дней в месяце
    std::chrono::year_month_day ymd{
        std::chrono::year{tm.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};

    if (!ymd.ok()) {
        return std::unexpected("Invalid calendar date: " + std::string(text));
    }

    int year = static_cast<int>(ymd.year());
    if (year < 1900 || year > 9999) {
        return std::unexpected("Date out of supported range: " + std::string(text));
    }

    return std::chrono::sys_days{ymd};
}

std::string formatDate(const Date& date)
{
    std::chrono::year_month_day ymd{date};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day());
    return oss.str();
}

std::string formatTimestamp(const TimePoint& timestamp)
{
    auto time = std::chrono::system_clock::to_time_t(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm tm = {};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string_view toString(TransactionType type) noexcept
{
    return type == TransactionType::Acquisition ? "ACQUISITION" : "DISPOSAL";
}

std::expected<TransactionType, std::string> parseTransactionType(std::string_view text)
{
    if (text == "ACQUISITION" || text == "acquisition" ||
        text == "BUY" || text == "buy") {
        return TransactionType::Acquisition;
    }
    if (text == "DISPOSAL" || text == "disposal" ||
        text == "SELL" || text == "sell") {
        return TransactionType::Disposal;
    }
    return std::unexpected("Unknown transaction type: " + std::string(text));
}

std::string_view toString(GainBucket bucket) noexcept
{
    return bucket == GainBucket::Long ? "LONG" : "SHORT";
}

std::expected<GainBucket, std::string> parseGainBucket(std::string_view text)
{
    if (text == "SHORT") {
        return GainBucket::Short;
    }
    if (text == "LONG") {
        return GainBucket::Long;
    }
    return std::unexpected("Unknown gain bucket: " + std::string(text));
}

}  // namespace lotledger
