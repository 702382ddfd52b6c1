#pragma once

#include <cstdint>
#include <string>

constexpr std::int64_t kSecondsPerDay = 86400;

// Даты храним как полночь UTC в секундах от эпохи.

// "YYYY-MM-DD" -> epoch. Бросает std::invalid_argument на неверный формат
// или несуществующую дату (2025-02-30).
std::int64_t parse_iso_date(const std::string &text);

std::string format_iso_date(std::int64_t epoch);

// Отбрасывает время суток.
std::int64_t utc_midnight(std::int64_t epoch);

std::int64_t today_utc();

std::int64_t days_between(std::int64_t from, std::int64_t to);

bool is_weekend(std::int64_t epoch);
