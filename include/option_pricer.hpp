#pragma once

#include "option_kind.hpp"

struct PricingRequest {
  double spot{};
  double strike{};
  double maturity_years{};
  double rate{};
  double volatility{};
  OptionKind kind{OptionKind::Call};
};

struct PricingResult {
  PricingRequest request;
  double price{};
};

class OptionPricer {
public:
  static double normal_cdf(double x);

  static double black_scholes_call(double S, double K, double T, double r,
                                   double sigma);

  static double black_scholes_put(double S, double K, double T, double r,
                                  double sigma);

  // Проверяет входные данные и бросает PricingError(InvalidInput),
  // если S, K, T или sigma не положительны либо что-то не конечно.
  static PricingResult price(const PricingRequest &request);
};
