#include "csv_history_provider.hpp"

#include "date_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

std::string trim(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\r\n\"");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = str.find_last_not_of(" \t\r\n\"");
  return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter) {
  std::vector<std::string> tokens;
  std::stringstream ss(str);
  std::string token;
  while (std::getline(ss, token, delimiter)) {
    tokens.push_back(trim(token));
  }
  return tokens;
}

int find_column(const std::vector<std::string> &header,
                std::initializer_list<const char *> names) {
  for (std::size_t i = 0; i < header.size(); ++i) {
    for (const char *name : names) {
      if (header[i] == name) {
        return static_cast<int>(i);
      }
    }
  }
  return -1;
}

} // namespace

CsvHistoryProvider::CsvHistoryProvider(std::string directory)
    : directory_(std::move(directory)) {}

PriceSeries CsvHistoryProvider::get_history(const std::string &ticker,
                                            std::int64_t from,
                                            std::int64_t to) {
  std::string path = directory_;
  if (!path.empty() && path.back() != '/') {
    path += '/';
  }
  path += ticker + ".csv";

  std::ifstream in(path);
  if (!in.is_open()) {
    std::cerr << "CsvHistoryProvider: no history file at " << path << "\n";
    PriceSeries empty;
    empty.ticker = ticker;
    return empty;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  PriceSeries series = parse_csv(buffer.str(), ticker);

  const std::int64_t lo = utc_midnight(from);
  const std::int64_t hi = utc_midnight(to);
  series.points.erase(std::remove_if(series.points.begin(),
                                     series.points.end(),
                                     [&](const PricePoint &p) {
                                       return p.timestamp < lo ||
                                              p.timestamp > hi;
                                     }),
                      series.points.end());
  return series;
}

PriceSeries CsvHistoryProvider::parse_csv(const std::string &content,
                                          const std::string &ticker) {
  PriceSeries series;
  series.ticker = ticker;

  std::istringstream in(content);
  std::string line;
  if (!std::getline(in, line)) {
    return series;
  }

  const auto header = split(line, ',');
  const int date_index = find_column(header, {"Date", "TRADEDATE", "date"});
  const int close_index = find_column(header, {"Close", "CLOSE", "close"});
  if (date_index < 0 || close_index < 0) {
    throw std::runtime_error("CSV header must contain Date and Close columns");
  }

  std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) {
      continue;
    }
    const auto fields = split(line, ',');
    if (static_cast<int>(fields.size()) <= std::max(date_index, close_index)) {
      throw std::runtime_error("CSV line " + std::to_string(line_no) +
                               " has too few columns");
    }
    // Пустое или null закрытие - день без торгов.
    const std::string &close = fields[close_index];
    if (close.empty() || close == "null") {
      continue;
    }

    PricePoint point;
    try {
      // Yahoo пишет дату с временем: "2024-05-01 00:00:00-04:00".
      point.timestamp = parse_iso_date(fields[date_index].substr(0, 10));
      point.close = std::stod(close);
    } catch (const std::exception &ex) {
      throw std::runtime_error("CSV line " + std::to_string(line_no) + ": " +
                               ex.what());
    }
    series.points.push_back(point);
  }

  std::stable_sort(series.points.begin(), series.points.end(),
                   [](const PricePoint &a, const PricePoint &b) {
                     return a.timestamp < b.timestamp;
                   });
  return series;
}
