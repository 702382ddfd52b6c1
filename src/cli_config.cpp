#include "cli_config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

std::string get_env(const char *name) {
  const char *v = std::getenv(name);
  return (v && *v) ? std::string(v) : std::string{};
}

} // namespace

CliConfig config_from_env() {
  CliConfig cfg;
  if (auto v = get_env("PRICER_PROVIDER"); !v.empty()) {
    cfg.provider = v;
  }
  if (auto v = get_env("PRICER_CSV_DIR"); !v.empty()) {
    cfg.csv_dir = v;
  }
  if (auto v = get_env("MOEX_BOARD"); !v.empty()) {
    cfg.moex_board = v;
  }
  if (auto v = get_env("MOEX_TIMEOUT_MS"); !v.empty()) {
    try {
      cfg.timeout_ms = std::stol(v);
    } catch (const std::exception &) {
      cfg.errors.push_back("MOEX_TIMEOUT_MS is not a number: " + v);
    }
  }
  cfg.pg_conninfo = get_env("PG_CONNINFO");
  return cfg;
}

CliConfig parse_cli(int argc, char **argv) {
  CliConfig cfg = config_from_env();
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_string = [&](std::string &value) {
      if (i + 1 >= argc) {
        cfg.errors.push_back("missing value for " + arg);
        return;
      }
      value = argv[++i];
    };
    auto next_double = [&](double &value) {
      std::string raw;
      next_string(raw);
      if (raw.empty()) {
        return;
      }
      try {
        std::size_t used = 0;
        value = std::stod(raw, &used);
        if (used != raw.size()) {
          throw std::invalid_argument(raw);
        }
      } catch (const std::exception &) {
        cfg.errors.push_back(arg + " expects a number, got '" + raw + "'");
      }
    };
    auto next_long = [&](long &value) {
      std::string raw;
      next_string(raw);
      if (raw.empty()) {
        return;
      }
      try {
        std::size_t used = 0;
        value = std::stol(raw, &used);
        if (used != raw.size()) {
          throw std::invalid_argument(raw);
        }
      } catch (const std::exception &) {
        cfg.errors.push_back(arg + " expects an integer, got '" + raw + "'");
      }
    };
    auto next_int = [&](int &value) {
      long tmp = value;
      next_long(tmp);
      if (tmp < std::numeric_limits<int>::min() ||
          tmp > std::numeric_limits<int>::max()) {
        cfg.errors.push_back(arg + " is out of range: " + std::to_string(tmp));
        return;
      }
      value = static_cast<int>(tmp);
    };

    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
    } else if (arg == "--test") {
      cfg.test_mode = true;
    } else if (arg == "--ticker") {
      next_string(cfg.ticker);
    } else if (arg == "--strike") {
      next_double(cfg.strike);
    } else if (arg == "--expiry") {
      next_string(cfg.expiry);
    } else if (arg == "--type") {
      next_string(cfg.option_type);
    } else if (arg == "--rate") {
      next_double(cfg.rate);
    } else if (arg == "--model") {
      next_string(cfg.model);
    } else if (arg == "--window") {
      next_int(cfg.window);
    } else if (arg == "--lookback-days") {
      next_int(cfg.lookback_days);
    } else if (arg == "--provider") {
      next_string(cfg.provider);
    } else if (arg == "--csv-dir") {
      next_string(cfg.csv_dir);
    } else if (arg == "--moex-board") {
      next_string(cfg.moex_board);
    } else if (arg == "--timeout-ms") {
      next_long(cfg.timeout_ms);
    } else if (arg == "--connect-timeout-ms") {
      next_long(cfg.connect_timeout_ms);
    } else if (arg == "--pg-conninfo") {
      next_string(cfg.pg_conninfo);
    } else if (arg == "--pg-host") {
      next_string(cfg.pg_host);
    } else if (arg == "--pg-port") {
      next_string(cfg.pg_port);
    } else if (arg == "--pg-user") {
      next_string(cfg.pg_user);
    } else if (arg == "--pg-password") {
      next_string(cfg.pg_password);
    } else if (arg == "--pg-db" || arg == "--pg-database") {
      next_string(cfg.pg_db);
    } else {
      cfg.errors.push_back("unknown argument: " + arg);
    }
  }
  if (cfg.test_mode) {
    cfg.provider = "synthetic";
  }
  return cfg;
}

bool validate(CliConfig &cfg) {
  if (cfg.ticker.empty()) {
    cfg.errors.push_back("--ticker is required");
  }
  if (cfg.expiry.empty()) {
    cfg.errors.push_back("--expiry is required");
  }
  if (cfg.strike <= 0.0) {
    cfg.errors.push_back("--strike must be a positive number");
  }
  // Сам тип опциона проверяет QuoteService.
  if (cfg.option_type.empty()) {
    cfg.errors.push_back("--type must not be empty");
  }
  if (cfg.window < 2) {
    cfg.errors.push_back("--window must be at least 2");
  }
  if (cfg.lookback_days <= 0) {
    cfg.errors.push_back("--lookback-days must be positive");
  }
  if (cfg.timeout_ms <= 0 || cfg.connect_timeout_ms <= 0) {
    cfg.errors.push_back("timeouts must be positive");
  }
  if (cfg.provider == "csv") {
    if (cfg.csv_dir.empty()) {
      cfg.errors.push_back("--csv-dir is required for the csv provider");
    }
  } else if (cfg.provider == "postgres") {
    if (build_conninfo(cfg).empty()) {
      cfg.errors.push_back("Missing database connection parameters. "
                           "Provide either --pg-conninfo "
                           "or all of --pg-host, --pg-user, --pg-db");
    }
  } else if (cfg.provider != "moex" && cfg.provider != "synthetic") {
    cfg.errors.push_back("unknown provider: " + cfg.provider);
  }
  return cfg.errors.empty();
}

std::string build_conninfo(const CliConfig &cfg) {
  if (!cfg.pg_conninfo.empty()) {
    return cfg.pg_conninfo;
  }
  if (cfg.pg_host.empty() || cfg.pg_user.empty() || cfg.pg_db.empty()) {
    return {};
  }
  std::string ci =
      "host=" + cfg.pg_host + " user=" + cfg.pg_user + " dbname=" + cfg.pg_db;
  if (!cfg.pg_port.empty())
    ci += " port=" + cfg.pg_port;
  if (!cfg.pg_password.empty())
    ci += " password=" + cfg.pg_password;
  return ci;
}

void load_env_from_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    auto pos = line.find('=');
    if (pos == std::string::npos) {
      continue;
    }
    std::string key = line.substr(0, pos);
    std::string value = line.substr(pos + 1);

    auto trim = [](std::string &s) {
      while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.erase(s.begin());
      }
      while (!s.empty() &&
             (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.pop_back();
      }
    };
    trim(key);
    trim(value);

    if (key.empty()) {
      continue;
    }
    setenv(key.c_str(), value.c_str(), 0);
  }
}

std::string usage() {
  return "Usage: option_quote --ticker T --strike K --expiry YYYY-MM-DD\n"
         "  [--type call|put|both] [--rate 0.05] [--model BS]\n"
         "  [--window 252] [--lookback-days 365]\n"
         "  [--provider moex|csv|postgres|synthetic] [--csv-dir DIR]\n"
         "  [--moex-board TQBR] [--timeout-ms 15000] "
         "[--connect-timeout-ms 5000]\n"
         "  [--pg-conninfo STR | --pg-host H --pg-user U --pg-db D "
         "[--pg-port P] [--pg-password P]]\n"
         "  [--test]\n";
}
