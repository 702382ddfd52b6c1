#include "quote_service.hpp"

#include "date_utils.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

constexpr double kDaysPerYear = 365.0;

bool is_black_scholes(const std::string &model) {
  std::string upper = model;
  for (auto &c : upper) {
    c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
  }
  return upper == "BS";
}

} // namespace

QuoteOutcome QuoteOutcome::success(QuoteResult result) {
  QuoteOutcome outcome;
  outcome.result = std::move(result);
  return outcome;
}

QuoteOutcome QuoteOutcome::failure(PricingErrorKind kind,
                                   std::string message) {
  QuoteOutcome outcome;
  outcome.error_kind = kind;
  outcome.error = std::move(message);
  return outcome;
}

QuoteService::QuoteService(std::shared_ptr<MarketDataProvider> provider,
                           VolatilityConfig volatility_config)
    : provider_(std::move(provider)), estimator_(volatility_config) {}

QuoteOutcome QuoteService::quote(const QuoteRequest &request) const {
  return quote(request, today_utc());
}

QuoteOutcome QuoteService::quote(const QuoteRequest &request,
                                 std::int64_t valuation_date) const {
  return quote_all(request, {request.option_type}, valuation_date).front();
}

std::vector<QuoteOutcome>
QuoteService::quote_all(const QuoteRequest &request,
                        const std::vector<std::string> &option_types) const {
  return quote_all(request, option_types, today_utc());
}

std::vector<QuoteOutcome>
QuoteService::quote_all(const QuoteRequest &request,
                        const std::vector<std::string> &option_types,
                        std::int64_t valuation_date) const {
  std::vector<QuoteOutcome> outcomes(option_types.size());
  if (!is_black_scholes(request.model)) {
    for (auto &outcome : outcomes) {
      outcome = QuoteOutcome::failure(PricingErrorKind::UnsupportedModel,
                                      "Unsupported model: '" + request.model +
                                          "' (only BS is available)");
    }
    return outcomes;
  }

  std::vector<std::optional<OptionKind>> kinds(option_types.size());

  bool any_valid = false;
  for (std::size_t i = 0; i < option_types.size(); ++i) {
    try {
      kinds[i] = parse_option_kind(option_types[i]);
      any_valid = true;
    } catch (const PricingError &ex) {
      outcomes[i] = QuoteOutcome::failure(ex.kind(), ex.what());
    }
  }
  if (!any_valid) {
    return outcomes;
  }

  MarketSnapshot snapshot;
  try {
    snapshot = load(request, valuation_date);
  } catch (const PricingError &ex) {
    for (std::size_t i = 0; i < kinds.size(); ++i) {
      if (kinds[i]) {
        outcomes[i] = QuoteOutcome::failure(ex.kind(), ex.what());
      }
    }
    return outcomes;
  }

  for (std::size_t i = 0; i < kinds.size(); ++i) {
    if (!kinds[i]) {
      continue;
    }
    try {
      outcomes[i] = QuoteOutcome::success(price(request, snapshot, *kinds[i]));
    } catch (const PricingError &ex) {
      outcomes[i] = QuoteOutcome::failure(ex.kind(), ex.what());
    }
  }
  return outcomes;
}

QuoteService::MarketSnapshot
QuoteService::load(const QuoteRequest &request,
                   std::int64_t valuation_date) const {
  std::int64_t expiry = 0;
  try {
    expiry = parse_iso_date(request.expiry);
  } catch (const std::invalid_argument &ex) {
    throw PricingError(PricingErrorKind::InvalidExpiry, ex.what());
  }

  const std::int64_t today = utc_midnight(valuation_date);
  const std::int64_t days = days_between(today, expiry);
  if (days <= 0) {
    throw PricingError(PricingErrorKind::InvalidExpiry,
                       "Expiry date must be in the future");
  }

  if (!(request.strike > 0.0)) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       "strike price must be positive");
  }
  if (request.lookback_days <= 0) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       "lookback period must be positive");
  }
  if (!provider_) {
    throw PricingError(PricingErrorKind::DataUnavailable,
                       "no market data provider configured");
  }

  PriceSeries series;
  try {
    series = provider_->get_history(
        request.ticker, today - request.lookback_days * kSecondsPerDay, today);
  } catch (const std::exception &ex) {
    throw PricingError(PricingErrorKind::DataUnavailable,
                       "Failed to fetch history for " + request.ticker + ": " +
                           ex.what());
  }

  if (series.empty()) {
    throw PricingError(PricingErrorKind::NoDataFound,
                       "No data found for " + request.ticker);
  }

  MarketSnapshot snapshot;
  snapshot.days_to_expiry = days;
  snapshot.spot = series.last_close();
  snapshot.volatility = estimator_.estimate(series);
  snapshot.observations = series.points.size();
  return snapshot;
}

QuoteResult QuoteService::price(const QuoteRequest &request,
                                const MarketSnapshot &snapshot,
                                OptionKind kind) {
  PricingRequest pricing_request;
  pricing_request.spot = snapshot.spot;
  pricing_request.strike = request.strike;
  pricing_request.maturity_years =
      static_cast<double>(snapshot.days_to_expiry) / kDaysPerYear;
  pricing_request.rate = request.risk_free_rate;
  pricing_request.volatility = snapshot.volatility;
  pricing_request.kind = kind;

  QuoteResult result;
  result.pricing = OptionPricer::price(pricing_request);
  result.ticker = request.ticker;
  result.kind = kind;
  result.spot = snapshot.spot;
  result.strike = request.strike;
  result.days_to_expiry = snapshot.days_to_expiry;
  result.volatility = snapshot.volatility;
  result.rate = request.risk_free_rate;
  result.price = result.pricing.price;
  result.observations = snapshot.observations;
  return result;
}
