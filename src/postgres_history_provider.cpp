#include "postgres_history_provider.hpp"

#include "date_utils.hpp"

#include <postgresql/libpq-fe.h>

#include <iostream>
#include <stdexcept>
#include <utility>

PricePoint parse_price_row(const std::string &trade_date,
                           const std::string &close) {
  PricePoint point;
  try {
    point.timestamp = parse_iso_date(trade_date);
  } catch (const std::invalid_argument &ex) {
    throw std::runtime_error(std::string("bad trade_date in price_history: ") +
                             ex.what());
  }
  try {
    std::size_t used = 0;
    point.close = std::stod(close, &used);
    if (used != close.size()) {
      throw std::invalid_argument(close);
    }
  } catch (const std::exception &) {
    throw std::runtime_error("bad close in price_history for " + trade_date +
                             ": '" + close + "'");
  }
  return point;
}

PostgresHistoryProvider::PostgresHistoryProvider(std::string conninfo)
    : conninfo_(std::move(conninfo)) {}

PriceSeries PostgresHistoryProvider::get_history(const std::string &ticker,
                                                 std::int64_t from,
                                                 std::int64_t to) {
  if (conninfo_.empty()) {
    throw std::runtime_error("PostgresHistoryProvider: empty conninfo");
  }

  PGconn *conn = PQconnectdb(conninfo_.c_str());
  if (!conn || PQstatus(conn) != CONNECTION_OK) {
    std::string reason =
        conn ? PQerrorMessage(conn) : "PQconnectdb returned null";
    std::cerr << "PostgresHistoryProvider: connection failed: " << reason
              << "\n";
    if (conn) {
      PQfinish(conn);
    }
    throw std::runtime_error("database connection failed: " + reason);
  }

  const std::string from_date = format_iso_date(from);
  const std::string to_date = format_iso_date(to);
  const char *params[3] = {ticker.c_str(), from_date.c_str(), to_date.c_str()};

  PGresult *res = PQexecParams(
      conn,
      "select ph.trade_date::text, ph.close from price_history ph "
      "join ticker t on t.id = ph.ticker_id "
      "where t.name = $1 and ph.trade_date between $2::date and $3::date "
      "and ph.close is not null "
      "order by ph.trade_date;",
      3, nullptr, params, nullptr, nullptr, 0);
  if (PQresultStatus(res) != PGRES_TUPLES_OK) {
    std::string reason = PQerrorMessage(conn);
    std::cerr << "PostgresHistoryProvider: query failed: " << reason;
    PQclear(res);
    PQfinish(conn);
    throw std::runtime_error("price history query failed: " + reason);
  }

  PriceSeries series;
  series.ticker = ticker;

  int rows = PQntuples(res);
  series.points.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    PricePoint point;
    try {
      point = parse_price_row(PQgetvalue(res, i, 0), PQgetvalue(res, i, 1));
    } catch (const std::exception &) {
      PQclear(res);
      PQfinish(conn);
      throw;
    }
    series.points.push_back(point);
  }

  PQclear(res);
  PQfinish(conn);
  return series;
}
