#pragma once

#include "price_series.hpp"

#include <cstddef>
#include <vector>

struct VolatilityConfig {
  // Сколько последних наблюдений (цен) брать в расчёт.
  std::size_t window{252};
  double trading_days_per_year{252.0};
};

class VolatilityEstimator {
public:
  VolatilityEstimator() = default;
  explicit VolatilityEstimator(VolatilityConfig config);

  // Годовая историческая волатильность: выборочное стандартное отклонение
  // логарифмических доходностей, умноженное на sqrt(trading_days_per_year).
  double estimate(const PriceSeries &series) const;

  double estimate(const std::vector<double> &closes) const;

  static std::vector<double> log_returns(const std::vector<double> &closes);

  static double sample_stddev(const std::vector<double> &values);

private:
  VolatilityConfig config_;
};
