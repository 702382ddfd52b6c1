#include "option_pricer.hpp"

#include "pricing_error.hpp"

#include <cmath>
#include <string>

namespace {

struct DTerms {
  double d1;
  double d2;
};

void require_positive(double value, const char *name) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       std::string(name) + " must be positive, got " +
                           std::to_string(value));
  }
}

void validate(double S, double K, double T, double r, double sigma) {
  require_positive(S, "spot price");
  require_positive(K, "strike price");
  require_positive(T, "time to maturity");
  require_positive(sigma, "volatility");
  if (!std::isfinite(r)) {
    throw PricingError(PricingErrorKind::InvalidInput,
                       "risk-free rate must be finite");
  }
}

DTerms d_terms(double S, double K, double T, double r, double sigma) {
  const double sqrtT = std::sqrt(T);
  const double d1 =
      (std::log(S / K) + (r + 0.5 * sigma * sigma) * T) / (sigma * sqrtT);
  return {d1, d1 - sigma * sqrtT};
}

} // namespace

double OptionPricer::normal_cdf(double x) {
  return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double OptionPricer::black_scholes_call(double S, double K, double T, double r,
                                        double sigma) {
  validate(S, K, T, r, sigma);
  const DTerms d = d_terms(S, K, T, r, sigma);
  return S * normal_cdf(d.d1) - K * std::exp(-r * T) * normal_cdf(d.d2);
}

double OptionPricer::black_scholes_put(double S, double K, double T, double r,
                                       double sigma) {
  validate(S, K, T, r, sigma);
  const DTerms d = d_terms(S, K, T, r, sigma);
  return K * std::exp(-r * T) * normal_cdf(-d.d2) - S * normal_cdf(-d.d1);
}

PricingResult OptionPricer::price(const PricingRequest &request) {
  PricingResult result;
  result.request = request;
  if (request.kind == OptionKind::Call) {
    result.price =
        black_scholes_call(request.spot, request.strike, request.maturity_years,
                           request.rate, request.volatility);
  } else {
    result.price =
        black_scholes_put(request.spot, request.strike, request.maturity_years,
                          request.rate, request.volatility);
  }
  return result;
}
