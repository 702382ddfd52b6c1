#include "quote_report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

std::string escape_json(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out += c;
    }
  }
  return out;
}

} // namespace

double round_to(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

std::string to_json_line(const QuoteOutcome &outcome,
                         const QuoteRequest &request) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2);
  ss << "{" << "\"ticker\":\"" << escape_json(request.ticker) << "\",";

  if (outcome.ok()) {
    const QuoteResult &r = outcome.result;
    ss << "\"option_type\":\"" << to_string(r.kind) << "\","
       << "\"current_price\":" << round_to(r.spot, 2) << ","
       << "\"strike_price\":" << std::defaultfloat << std::setprecision(15)
       << r.strike << std::fixed << std::setprecision(2) << ","
       << "\"days_to_expiry\":" << r.days_to_expiry << ","
       << "\"volatility\":" << round_to(r.volatility * 100.0, 2) << ","
       << "\"risk_free_rate\":" << round_to(r.rate * 100.0, 2) << ","
       << "\"calculated_price\":" << round_to(r.price, 2) << ","
       << "\"status\":\"OK\",\"error_kind\":\"\",\"error\":\"\"";
  } else {
    ss << "\"option_type\":\"" << escape_json(request.option_type) << "\","
       << "\"status\":\"ERROR\","
       << "\"error_kind\":\"" << to_string(*outcome.error_kind) << "\","
       << "\"error\":\"" << escape_json(outcome.error) << "\"";
  }
  ss << "}";
  return ss.str();
}
