#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Дневная цена закрытия; timestamp - полночь UTC торгового дня.
struct PricePoint {
  std::int64_t timestamp{};
  double close{};
};

struct PriceSeries {
  std::string ticker;
  std::vector<PricePoint> points;

  bool empty() const { return points.empty(); }
  double last_close() const { return points.back().close; }
};
