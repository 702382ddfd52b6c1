#pragma once

#include "market_data_provider.hpp"

#include <string>

// История закрытий из PostgreSQL:
//   ticker(id, name)
//   price_history(ticker_id, trade_date date, close double precision)
// Строка результата (trade_date::text, close) -> точка ряда.
// Бросает std::runtime_error на нечисловой close или кривую дату.
PricePoint parse_price_row(const std::string &trade_date,
                           const std::string &close);

class PostgresHistoryProvider : public MarketDataProvider {
public:
  explicit PostgresHistoryProvider(std::string conninfo);

  PriceSeries get_history(const std::string &ticker, std::int64_t from,
                          std::int64_t to) override;

private:
  std::string conninfo_;
};
