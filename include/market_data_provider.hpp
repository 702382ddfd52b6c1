#pragma once

#include <cstdint>
#include <string>

#include "price_series.hpp"

// Источник исторических цен закрытия. Возвращает ряд, упорядоченный по
// времени, с датами в [from, to] (полночь UTC). Пустой ряд означает, что
// данных нет; сбои транспорта и разбора - через исключения.
class MarketDataProvider {
public:
  virtual ~MarketDataProvider() = default;

  virtual PriceSeries get_history(const std::string &ticker, std::int64_t from,
                                  std::int64_t to) = 0;
};
