#include "option_kind.hpp"

#include "pricing_error.hpp"

#include <cctype>

OptionKind parse_option_kind(const std::string &text) {
  std::string lower = text;
  for (auto &c : lower) {
    c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "call") {
    return OptionKind::Call;
  }
  if (lower == "put") {
    return OptionKind::Put;
  }
  throw PricingError(PricingErrorKind::UnsupportedOptionKind,
                     "Unsupported option type: '" + text +
                         "' (expected call or put)");
}

const char *to_string(OptionKind kind) {
  return kind == OptionKind::Call ? "call" : "put";
}
