#pragma once

#include "market_data_provider.hpp"

#include <cstdint>

struct SyntheticHistoryConfig {
  double initial_price{100.0};
  double drift{0.05};
  double volatility{0.25};
  std::uint64_t seed{42};
};

// Геометрическое броуновское движение по будним дням запрошенного периода.
// Для одинаковых (seed, ticker, from, to) ряд всегда один и тот же.
class SyntheticHistoryProvider : public MarketDataProvider {
public:
  explicit SyntheticHistoryProvider(SyntheticHistoryConfig config = {});

  PriceSeries get_history(const std::string &ticker, std::int64_t from,
                          std::int64_t to) override;

private:
  SyntheticHistoryConfig config_;
};
