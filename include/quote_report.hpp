#pragma once

#include "quote_service.hpp"

#include <string>

double round_to(double value, int digits);

// Одна JSON-строка (без перевода строки) с полями в том же округлении,
// что и в отчёте: цены и проценты - 2 знака, дни - целые.
std::string to_json_line(const QuoteOutcome &outcome,
                         const QuoteRequest &request);
