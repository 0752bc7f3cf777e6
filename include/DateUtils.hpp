#pragma once

#include "SettlementTypes.hpp"
#include <string>
#include <string_view>
#include <expected>
#include <chrono>

namespace settlement {

// ═══════════════════════════════════════════════════════════════════════════════
// Работа с датами
// ═══════════════════════════════════════════════════════════════════════════════
//
// Все даты хранятся как TimePoint в UTC. Полночь означает "только дата",
// ненулевое время суток - дата со временем сделки.

// Создать дату (UTC)
TimePoint makeDate(int year, int month, int day,
                   int hour = 0, int minute = 0, int second = 0);

// Начало дня (полночь UTC)
TimePoint normalizeDate(const TimePoint& date) noexcept;

// Смещение на целое число дней
TimePoint addDays(const TimePoint& date, int days) noexcept;

// Время от начала дня
std::chrono::seconds timeOfDay(const TimePoint& date) noexcept;

bool hasTimeOfDay(const TimePoint& date) noexcept;

bool isSameDay(const TimePoint& lhs, const TimePoint& rhs) noexcept;

// "YYYY-MM-DD"
std::string formatDate(const TimePoint& date);

// "YYYY-MM-DD" или "YYYY-MM-DD HH:MM:SS", если задано время
std::string formatDateTime(const TimePoint& date);

// "YYYY-MM"
std::string formatMonthKey(const TimePoint& date);

// Разбор даты в одном из форматов:
//   YYYY-MM-DD, MM/DD/YYYY, YYYYMMDD,
//   с необязательным временем HH:MM или HH:MM:SS (через пробел или 'T')
std::expected<TimePoint, std::string> parseDateString(std::string_view dateStr);

}  // namespace settlement
