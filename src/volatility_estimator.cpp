#include "volatility_estimator.hpp"

#include "pricing_error.hpp"

#include <cmath>
#include <numeric>
#include <string>

VolatilityEstimator::VolatilityEstimator(VolatilityConfig config)
    : config_(config) {}

double VolatilityEstimator::estimate(const PriceSeries &series) const {
  std::vector<double> closes;
  closes.reserve(series.points.size());
  for (const auto &p : series.points) {
    closes.push_back(p.close);
  }
  return estimate(closes);
}

double VolatilityEstimator::estimate(const std::vector<double> &closes) const {
  if (config_.window < 2) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       "volatility window must be at least 2, got " +
                           std::to_string(config_.window));
  }
  if (!std::isfinite(config_.trading_days_per_year) ||
      config_.trading_days_per_year <= 0.0) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       "trading days per year must be positive");
  }

  // Весь ряд должен быть валидным, а не только окно.
  for (double c : closes) {
    if (!std::isfinite(c) || c <= 0.0) {
      throw PricingError(PricingErrorKind::InvalidInput,
                         "price series contains non-positive price " +
                             std::to_string(c));
    }
  }

  auto first = closes.begin();
  if (closes.size() > config_.window) {
    first = closes.end() - static_cast<std::ptrdiff_t>(config_.window);
  }
  std::vector<double> window(first, closes.end());

  const auto returns = log_returns(window);
  if (returns.size() < 2) {
    throw PricingError(PricingErrorKind::InsufficientData,
                       "need at least 3 price observations, got " +
                           std::to_string(window.size()));
  }

  return sample_stddev(returns) * std::sqrt(config_.trading_days_per_year);
}

std::vector<double>
VolatilityEstimator::log_returns(const std::vector<double> &closes) {
  for (double c : closes) {
    if (!std::isfinite(c) || c <= 0.0) {
      throw PricingError(PricingErrorKind::InvalidInput,
                         "price series contains non-positive price " +
                             std::to_string(c));
    }
  }

  std::vector<double> returns;
  if (closes.size() < 2) {
    return returns;
  }
  returns.reserve(closes.size() - 1);
  for (std::size_t i = 1; i < closes.size(); ++i) {
    returns.push_back(std::log(closes[i] / closes[i - 1]));
  }
  return returns;
}

double VolatilityEstimator::sample_stddev(const std::vector<double> &values) {
  if (values.size() < 2) {
    throw PricingError(PricingErrorKind::InsufficientData,
                       "sample standard deviation needs at least 2 values");
  }
  const double n = static_cast<double>(values.size());
  const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double sq = 0.0;
  for (double v : values) {
    sq += (v - mean) * (v - mean);
  }
  return std::sqrt(sq / (n - 1.0));
}
