#pragma once

#include "market_data_provider.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct MoexClientConfig {
  std::string base_url{"https://iss.moex.com"};
  std::string board{"TQBR"};
  long connect_timeout_ms{5000};
  long timeout_ms{15000};
  // Верхняя граница числа страниц истории за один запрос.
  int max_pages{100};
};

// Дневная история закрытий через MOEX ISS
// (/iss/history/engines/stock/markets/shares/boards/<board>/securities/...).
class MoexHistoryClient : public MarketDataProvider {
public:
  explicit MoexHistoryClient(MoexClientConfig config = {});
  ~MoexHistoryClient() override;

  PriceSeries get_history(const std::string &ticker, std::int64_t from,
                          std::int64_t to) override;

  struct HistoryPage {
    std::vector<PricePoint> points;
    std::size_t rows{};
    std::int64_t index{};
    std::int64_t total{};
    std::int64_t page_size{};
  };

  static HistoryPage parse_history_page(const std::string &body);

  std::string build_url(const std::string &ticker, std::int64_t from,
                        std::int64_t to, std::int64_t start) const;

protected:
  virtual std::string http_get(const std::string &url) const;

private:
  MoexClientConfig config_;
};
