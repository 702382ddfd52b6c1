#include "pricing_error.hpp"

const char *to_string(PricingErrorKind kind) {
  switch (kind) {
  case PricingErrorKind::NoDataFound:
    return "NoDataFound";
  case PricingErrorKind::InvalidExpiry:
    return "InvalidExpiry";
  case PricingErrorKind::InsufficientData:
    return "InsufficientData";
  case PricingErrorKind::InvalidInput:
    return "InvalidInput";
  case PricingErrorKind::UnsupportedOptionKind:
    return "UnsupportedOptionKind";
  case PricingErrorKind::UnsupportedModel:
    return "UnsupportedModel";
  case PricingErrorKind::DataUnavailable:
    return "DataUnavailable";
  }
  return "Unknown";
}
