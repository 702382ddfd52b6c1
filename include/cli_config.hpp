#pragma once

#include <string>
#include <vector>

struct CliConfig {
  bool test_mode{false};
  bool show_help{false};

  std::string ticker;
  double strike{};
  std::string expiry;
  // call, put или both.
  std::string option_type{"call"};
  double rate{0.05};
  std::string model{"BS"};
  int window{252};
  int lookback_days{365};

  // moex, csv, postgres или synthetic.
  std::string provider{"moex"};
  std::string csv_dir{"data"};
  std::string moex_board{"TQBR"};
  long timeout_ms{15000};
  long connect_timeout_ms{5000};

  std::string pg_conninfo;
  std::string pg_host;
  std::string pg_port;
  std::string pg_user;
  std::string pg_password;
  std::string pg_db;

  std::vector<std::string> errors;
};

// Значения по умолчанию из окружения: PRICER_PROVIDER, PRICER_CSV_DIR,
// MOEX_BOARD, MOEX_TIMEOUT_MS, PG_CONNINFO.
CliConfig config_from_env();

// Флаги командной строки поверх config_from_env(). Ошибки разбора
// складываются в errors.
CliConfig parse_cli(int argc, char **argv);

// Проверка обязательных параметров; дописывает сообщения в cfg.errors.
bool validate(CliConfig &cfg);

// conninfo либо как есть, либо собранная из --pg-host/--pg-user/...
// Пустая строка, если параметров не хватает.
std::string build_conninfo(const CliConfig &cfg);

// KEY=VALUE построчно, '#' - комментарий. Уже заданные переменные
// окружения не перезаписываются.
void load_env_from_file(const std::string &path);

std::string usage();
