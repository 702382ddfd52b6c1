#include "synthetic_history_provider.hpp"

#include "date_utils.hpp"

#include <cmath>
#include <functional>
#include <random>

SyntheticHistoryProvider::SyntheticHistoryProvider(
    SyntheticHistoryConfig config)
    : config_(config) {}

PriceSeries SyntheticHistoryProvider::get_history(const std::string &ticker,
                                                  std::int64_t from,
                                                  std::int64_t to) {
  PriceSeries series;
  series.ticker = ticker;

  std::mt19937_64 rng{config_.seed ^ std::hash<std::string>{}(ticker)};
  std::normal_distribution<double> normal(0.0, 1.0);

  const double dt = 1.0 / 252.0;
  const double mu = (config_.drift - 0.5 * config_.volatility *
                                         config_.volatility) * dt;
  const double sd = config_.volatility * std::sqrt(dt);

  double price = config_.initial_price;
  bool first = true;
  for (std::int64_t day = utc_midnight(from); day <= utc_midnight(to);
       day += kSecondsPerDay) {
    if (is_weekend(day)) {
      continue;
    }
    if (!first) {
      price *= std::exp(mu + sd * normal(rng));
    }
    first = false;
    series.points.push_back(PricePoint{day, price});
  }
  return series;
}
