#include "DateUtils.hpp"
#include <ctime>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <array>
#include <algorithm>

namespace settlement {

namespace {

constexpr std::int64_t kSecondsPerDay = 24 * 60 * 60;

std::tm toUtcTm(const TimePoint& date) noexcept
{
    auto timeT = std::chrono::system_clock::to_time_t(date);

    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &timeT);
#else
    gmtime_r(&timeT, &tm);
#endif
    return tm;
}

std::string formatUtc(const TimePoint& date, const char* format)
{
    std::tm tm = toUtcTm(date);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string trim(std::string_view value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return std::string(value.substr(begin, end - begin));
}

// Проверяем, что std::get_time не принял несуществующую дату (например, 02/30)
std::expected<TimePoint, std::string> fromParsedTm(const std::tm& parsed)
{
    if (parsed.tm_hour < 0 || parsed.tm_hour > 23 ||
        parsed.tm_min < 0 || parsed.tm_min > 59 ||
        parsed.tm_sec < 0 || parsed.tm_sec > 59) {
        return std::unexpected("Invalid time of day");
    }

    auto result = makeDate(parsed.tm_year + 1900, parsed.tm_mon + 1, parsed.tm_mday,
                           parsed.tm_hour, parsed.tm_min, parsed.tm_sec);

    std::tm check = toUtcTm(result);
    if (check.tm_year != parsed.tm_year ||
        check.tm_mon != parsed.tm_mon ||
        check.tm_mday != parsed.tm_mday) {
        return std::unexpected("Invalid calendar date");
    }

    return result;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Создание и нормализация
// ═══════════════════════════════════════════════════════════════════════════════

TimePoint makeDate(int year, int month, int day, int hour, int minute, int second)
{
    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

#ifdef _WIN32
    std::time_t tt = _mkgmtime(&tm);
#else
    std::time_t tt = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(tt);
}

TimePoint normalizeDate(const TimePoint& date) noexcept
{
    // Арифметика без time_t, чтобы не зависеть от локальной временной зоны
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        date.time_since_epoch()).count();

    auto days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) {
        --days;
    }

    return TimePoint(std::chrono::seconds(days * kSecondsPerDay));
}

TimePoint addDays(const TimePoint& date, int days) noexcept
{
    return date + std::chrono::seconds(static_cast<std::int64_t>(days) * kSecondsPerDay);
}

std::chrono::seconds timeOfDay(const TimePoint& date) noexcept
{
    return std::chrono::duration_cast<std::chrono::seconds>(date - normalizeDate(date));
}

bool hasTimeOfDay(const TimePoint& date) noexcept
{
    return timeOfDay(date).count() != 0;
}

bool isSameDay(const TimePoint& lhs, const TimePoint& rhs) noexcept
{
    return normalizeDate(lhs) == normalizeDate(rhs);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Форматирование
// ═══════════════════════════════════════════════════════════════════════════════

std::string formatDate(const TimePoint& date)
{
    return formatUtc(date, "%Y-%m-%d");
}

std::string formatDateTime(const TimePoint& date)
{
    if (!hasTimeOfDay(date)) {
        return formatDate(date);
    }
    return formatUtc(date, "%Y-%m-%d %H:%M:%S");
}

std::string formatMonthKey(const TimePoint& date)
{
    return formatUtc(date, "%Y-%m");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Разбор
// ═══════════════════════════════════════════════════════════════════════════════

std::expected<TimePoint, std::string> parseDateString(std::string_view dateStr)
{
    std::string value = trim(dateStr);
    if (value.empty()) {
        return std::unexpected("Empty date string");
    }

    // Компактный формат YYYYMMDD разбираем вручную:
    // %Y в std::get_time жадно забирает все цифры
    if (value.size() == 8 &&
        std::all_of(value.begin(), value.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; })) {
        std::tm tm = {};
        tm.tm_year = std::stoi(value.substr(0, 4)) - 1900;
        tm.tm_mon = std::stoi(value.substr(4, 2)) - 1;
        tm.tm_mday = std::stoi(value.substr(6, 2));
        auto result = fromParsedTm(tm);
        if (!result) {
            return std::unexpected("Failed to parse date: " + value + " (" + result.error() + ")");
        }
        return result;
    }

    static constexpr std::array<const char*, 9> formats = {
        "%Y-%m-%d %H:%M:%S",
        "%Y-%m-%dT%H:%M:%S",
        "%Y-%m-%d %H:%M",
        "%Y-%m-%dT%H:%M",
        "%Y-%m-%d",
        "%m/%d/%Y %H:%M:%S",
        "%m/%d/%Y %H:%M",
        "%m/%d/%Y",
        "%m-%d-%Y",
    };

    for (const char* format : formats) {
        std::tm tm = {};
        std::istringstream ss(value);
        ss >> std::get_time(&tm, format);

        if (ss.fail()) {
            continue;
        }

        // Формат должен покрыть строку целиком
        ss >> std::ws;
        if (!ss.eof()) {
            continue;
        }

        auto result = fromParsedTm(tm);
        if (!result) {
            return std::unexpected("Failed to parse date: " + value + " (" + result.error() + ")");
        }
        return result;
    }

    return std::unexpected("Failed to parse date: " + value +
                           ". Expected format: YYYY-MM-DD, MM/DD/YYYY or YYYYMMDD");
}

}  // namespace settlement
