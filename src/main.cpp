#include "cli_config.hpp"
#include "csv_history_provider.hpp"
#include "moex_history_client.hpp"
#include "postgres_history_provider.hpp"
#include "quote_report.hpp"
#include "quote_service.hpp"
#include "synthetic_history_provider.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::shared_ptr<MarketDataProvider> make_provider(const CliConfig &cfg) {
  if (cfg.provider == "synthetic") {
    return std::make_shared<SyntheticHistoryProvider>();
  }
  if (cfg.provider == "csv") {
    return std::make_shared<CsvHistoryProvider>(cfg.csv_dir);
  }
  if (cfg.provider == "postgres") {
    return std::make_shared<PostgresHistoryProvider>(build_conninfo(cfg));
  }
  MoexClientConfig moex;
  moex.board = cfg.moex_board;
  moex.timeout_ms = cfg.timeout_ms;
  moex.connect_timeout_ms = cfg.connect_timeout_ms;
  return std::make_shared<MoexHistoryClient>(moex);
}

} // namespace

int main(int argc, char **argv) {
  // Приоритет: ENV_FILE -> .env в текущем каталоге -> ../.env (для запуска
  // из build/).
  if (const char *env_file = std::getenv("ENV_FILE")) {
    if (*env_file) {
      load_env_from_file(env_file);
    }
  } else {
    load_env_from_file(".env");
    load_env_from_file("../.env");
  }

  CliConfig cfg = parse_cli(argc, argv);
  if (cfg.show_help) {
    std::cout << usage();
    return 0;
  }
  if (!validate(cfg)) {
    for (const auto &e : cfg.errors) {
      std::cerr << "option_quote: " << e << "\n";
    }
    std::cerr << usage();
    return 2;
  }

  VolatilityConfig vol_cfg;
  vol_cfg.window = static_cast<std::size_t>(cfg.window);

  QuoteService service(make_provider(cfg), vol_cfg);

  std::vector<std::string> kinds;
  if (cfg.option_type == "both") {
    kinds = {"call", "put"};
  } else {
    kinds = {cfg.option_type};
  }

  QuoteRequest request;
  request.ticker = cfg.ticker;
  request.strike = cfg.strike;
  request.expiry = cfg.expiry;
  request.risk_free_rate = cfg.rate;
  request.model = cfg.model;
  request.lookback_days = cfg.lookback_days;

  const auto outcomes = service.quote_all(request, kinds);

  int exit_code = 0;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    const QuoteOutcome &outcome = outcomes[i];
    request.option_type = kinds[i];
    if (!outcome.ok()) {
      std::cerr << "option_quote: " << to_string(*outcome.error_kind) << ": "
                << outcome.error << "\n";
      exit_code = 1;
    }
    std::cout << to_json_line(outcome, request) << std::endl;
  }
  return exit_code;
}
