#pragma once

#include "market_data_provider.hpp"

#include <string>

// Воспроизведение истории из файлов <dir>/<TICKER>.csv. Первая строка -
// заголовок, нужны колонки Date (или TRADEDATE) и Close (или CLOSE).
// Формат совпадает с выгрузкой дневных цен Yahoo Finance и MOEX.
class CsvHistoryProvider : public MarketDataProvider {
public:
  explicit CsvHistoryProvider(std::string directory);

  PriceSeries get_history(const std::string &ticker, std::int64_t from,
                          std::int64_t to) override;

  static PriceSeries parse_csv(const std::string &content,
                               const std::string &ticker);

private:
  std::string directory_;
};
