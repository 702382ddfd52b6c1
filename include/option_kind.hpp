#pragma once

#include <string>

enum class OptionKind { Call, Put };

// Регистр не важен: "call", "Call", "PUT". Всё остальное отклоняется
// с PricingErrorKind::UnsupportedOptionKind.
OptionKind parse_option_kind(const std::string &text);

const char *to_string(OptionKind kind);
