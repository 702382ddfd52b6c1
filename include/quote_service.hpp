#pragma once

#include "market_data_provider.hpp"
#include "option_pricer.hpp"
#include "pricing_error.hpp"
#include "volatility_estimator.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct QuoteRequest {
  std::string ticker;
  double strike{};
  // ISO 8601, YYYY-MM-DD.
  std::string expiry;
  std::string option_type{"call"};
  double risk_free_rate{0.05};
  std::string model{"BS"};
  int lookback_days{365};
};

struct QuoteResult {
  std::string ticker;
  OptionKind kind{OptionKind::Call};
  double spot{};
  double strike{};
  std::int64_t days_to_expiry{};
  double volatility{};
  double rate{};
  double price{};
  std::size_t observations{};
  PricingResult pricing;
};

// Либо результат, либо тип ошибки с сообщением.
struct QuoteOutcome {
  std::optional<PricingErrorKind> error_kind;
  std::string error;
  QuoteResult result;

  bool ok() const { return !error_kind.has_value(); }

  static QuoteOutcome success(QuoteResult result);
  static QuoteOutcome failure(PricingErrorKind kind, std::string message);
};

class QuoteService {
public:
  QuoteService(std::shared_ptr<MarketDataProvider> provider,
               VolatilityConfig volatility_config = {});

  // Дата оценки - сегодня (UTC).
  QuoteOutcome quote(const QuoteRequest &request) const;

  QuoteOutcome quote(const QuoteRequest &request,
                     std::int64_t valuation_date) const;

  // Несколько типов опциона по одной загрузке истории: call и put
  // считаются от одного ряда. request.option_type игнорируется.
  std::vector<QuoteOutcome>
  quote_all(const QuoteRequest &request,
            const std::vector<std::string> &option_types) const;

  std::vector<QuoteOutcome>
  quote_all(const QuoteRequest &request,
            const std::vector<std::string> &option_types,
            std::int64_t valuation_date) const;

private:
  struct MarketSnapshot {
    std::int64_t days_to_expiry{};
    double spot{};
    double volatility{};
    std::size_t observations{};
  };

  MarketSnapshot load(const QuoteRequest &request,
                      std::int64_t valuation_date) const;

  static QuoteResult price(const QuoteRequest &request,
                           const MarketSnapshot &snapshot, OptionKind kind);

  std::shared_ptr<MarketDataProvider> provider_;
  VolatilityEstimator estimator_;
};
