#pragma once

#include <stdexcept>
#include <string>

enum class PricingErrorKind {
  NoDataFound,
  InvalidExpiry,
  InsufficientData,
  InvalidInput,
  UnsupportedOptionKind,
  UnsupportedModel,
  DataUnavailable,
};

const char *to_string(PricingErrorKind kind);

// Ошибка вычисления: тип сохраняется, чтобы вызывающий код мог
// различать причины отказа.
class PricingError : public std::runtime_error {
public:
  PricingError(PricingErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  PricingErrorKind kind() const noexcept { return kind_; }

private:
  PricingErrorKind kind_;
};
