#include "moex_history_client.hpp"

#include "date_utils.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *buffer = static_cast<std::string *>(userdata);
  buffer->append(ptr, size * nmemb);
  return size * nmemb;
}

std::string_view trim(std::string_view token) {
  while (!token.empty() &&
         std::isspace(static_cast<unsigned char>(token.front()))) {
    token.remove_prefix(1);
  }
  while (!token.empty() &&
         std::isspace(static_cast<unsigned char>(token.back()))) {
    token.remove_suffix(1);
  }
  return token;
}

std::string_view unquote(std::string_view token) {
  if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
    token.remove_prefix(1);
    token.remove_suffix(1);
  }
  return token;
}

// Позиция ключа секции ("history", "history.cursor"). Совпадение внутри
// другого ключа не считается: после закрывающей кавычки должно идти ':'.
std::size_t find_section(const std::string &body, std::string_view name) {
  const std::string key = "\"" + std::string(name) + "\"";
  std::size_t pos = body.find(key);
  while (pos != std::string::npos) {
    std::size_t after = pos + key.size();
    while (after < body.size() &&
           std::isspace(static_cast<unsigned char>(body[after]))) {
      ++after;
    }
    if (after < body.size() && body[after] == ':') {
      return pos;
    }
    pos = body.find(key, pos + 1);
  }
  return std::string::npos;
}

// Конец массива, начинающегося с '[' в позиции open; строки в кавычках
// учитываются.
std::size_t matching_bracket(const std::string &body, std::size_t open) {
  int depth = 0;
  bool in_string = false;
  for (std::size_t i = open; i < body.size(); ++i) {
    char c = body[i];
    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '[') {
      ++depth;
    } else if (c == ']') {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::vector<std::string_view> split_row(std::string_view row) {
  std::vector<std::string_view> tokens;
  bool in_string = false;
  std::size_t start = 0;
  for (std::size_t i = 0; i < row.size(); ++i) {
    char c = row[i];
    if (in_string) {
      if (c == '\\') {
        ++i;
      } else if (c == '"') {
        in_string = false;
      }
    } else if (c == '"') {
      in_string = true;
    } else if (c == ',') {
      tokens.push_back(trim(row.substr(start, i - start)));
      start = i + 1;
    }
  }
  auto last = trim(row.substr(start));
  if (!last.empty() || !tokens.empty()) {
    tokens.push_back(last);
  }
  return tokens;
}

std::string_view array_after(const std::string &body, std::size_t section_pos,
                             std::string_view key) {
  const std::string quoted = "\"" + std::string(key) + "\"";
  auto key_pos = body.find(quoted, section_pos);
  if (key_pos == std::string::npos) {
    throw std::runtime_error(std::string(key) + " not found");
  }
  auto open = body.find('[', key_pos);
  if (open == std::string::npos) {
    throw std::runtime_error(std::string(key) + " array malformed");
  }
  auto close = matching_bracket(body, open);
  if (close == std::string::npos) {
    throw std::runtime_error(std::string(key) + " array malformed");
  }
  return std::string_view(body.data() + open + 1, close - open - 1);
}

int find_column_index(const std::vector<std::string_view> &columns,
                      std::string_view column_name) {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (unquote(columns[i]) == column_name) {
      return static_cast<int>(i);
    }
  }
  throw std::runtime_error("column " + std::string(column_name) +
                           " not found");
}

// Строки вида [..],[..] из содержимого массива data.
std::vector<std::string_view> data_rows(std::string_view data) {
  std::vector<std::string_view> rows;
  const std::string buffer(data);
  std::size_t pos = 0;
  while (pos < buffer.size()) {
    auto open = buffer.find('[', pos);
    if (open == std::string::npos) {
      break;
    }
    auto close = matching_bracket(buffer, open);
    if (close == std::string::npos) {
      throw std::runtime_error("data row malformed");
    }
    rows.push_back(data.substr(open + 1, close - open - 1));
    pos = close + 1;
  }
  return rows;
}

std::int64_t parse_int(std::string_view token, const char *what) {
  try {
    return std::stoll(std::string(token));
  } catch (const std::exception &) {
    throw std::runtime_error(std::string(what) + " is not a number: " +
                             std::string(token));
  }
}

} // namespace

MoexHistoryClient::MoexHistoryClient(MoexClientConfig config)
    : config_(std::move(config)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

MoexHistoryClient::~MoexHistoryClient() { curl_global_cleanup(); }

PriceSeries MoexHistoryClient::get_history(const std::string &ticker,
                                           std::int64_t from,
                                           std::int64_t to) {
  PriceSeries series;
  series.ticker = ticker;

  std::int64_t start = 0;
  for (int pages = 0;; ++pages) {
    if (pages >= config_.max_pages) {
      throw std::runtime_error("history paging exceeded " +
                               std::to_string(config_.max_pages) + " pages");
    }
    const auto body = http_get(build_url(ticker, from, to, start));
    HistoryPage page = parse_history_page(body);
    series.points.insert(series.points.end(), page.points.begin(),
                         page.points.end());

    if (page.rows == 0 || page.page_size <= 0) {
      break;
    }
    const std::int64_t next = page.index + page.page_size;
    if (next >= page.total) {
      break;
    }
    // Курсор обязан продвигаться.
    if (next <= start) {
      throw std::runtime_error("history.cursor did not advance");
    }
    start = next;
  }

  const std::int64_t lo = utc_midnight(from);
  const std::int64_t hi = utc_midnight(to);
  series.points.erase(std::remove_if(series.points.begin(),
                                     series.points.end(),
                                     [&](const PricePoint &p) {
                                       return p.timestamp < lo ||
                                              p.timestamp > hi;
                                     }),
                      series.points.end());
  std::stable_sort(series.points.begin(), series.points.end(),
                   [](const PricePoint &a, const PricePoint &b) {
                     return a.timestamp < b.timestamp;
                   });
  return series;
}

std::string MoexHistoryClient::build_url(const std::string &ticker,
                                         std::int64_t from, std::int64_t to,
                                         std::int64_t start) const {
  std::string lower_ticker = ticker;
  for (auto &c : lower_ticker) {
    c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  }
  std::string lower_board = config_.board;
  for (auto &c : lower_board) {
    c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  }
  std::string base = config_.base_url;
  if (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base +
         "/iss/history/engines/stock/markets/shares/boards/" + lower_board +
         "/securities/" + lower_ticker +
         ".json?iss.meta=off&iss.only=history,history.cursor"
         "&history.columns=TRADEDATE,CLOSE&from=" +
         format_iso_date(from) + "&till=" + format_iso_date(to) +
         "&start=" + std::to_string(start);
}

std::string MoexHistoryClient::http_get(const std::string &url) const {
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw std::runtime_error("Failed to init CURL");
  }

  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   config_.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "option_quote/1.0");

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    curl_easy_cleanup(curl);
    throw std::runtime_error("CURL request failed: " +
                             std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_easy_cleanup(curl);

  if (http_code != 200) {
    throw std::runtime_error("HTTP error: " + std::to_string(http_code));
  }

  return response;
}

MoexHistoryClient::HistoryPage
MoexHistoryClient::parse_history_page(const std::string &body) {
  const auto history_pos = find_section(body, "history");
  if (history_pos == std::string::npos) {
    throw std::runtime_error("history section not found");
  }

  const auto columns = split_row(array_after(body, history_pos, "columns"));
  const int date_index = find_column_index(columns, "TRADEDATE");
  const int close_index = find_column_index(columns, "CLOSE");

  HistoryPage page;
  for (auto row : data_rows(array_after(body, history_pos, "data"))) {
    ++page.rows;
    const auto tokens = split_row(row);
    if (static_cast<int>(tokens.size()) <= std::max(date_index, close_index)) {
      throw std::runtime_error("history row has too few columns");
    }

    // Нет сделок за день - CLOSE приходит как null.
    const auto close_token = tokens[close_index];
    if (close_token.empty() || close_token == "null") {
      continue;
    }

    PricePoint point;
    try {
      point.close = std::stod(std::string(close_token));
    } catch (const std::exception &) {
      throw std::runtime_error("CLOSE is not a number: " +
                               std::string(close_token));
    }
    try {
      point.timestamp = parse_iso_date(std::string(unquote(tokens[date_index])));
    } catch (const std::invalid_argument &ex) {
      throw std::runtime_error(std::string("TRADEDATE malformed: ") +
                               ex.what());
    }
    page.points.push_back(point);
  }

  page.index = 0;
  page.total = static_cast<std::int64_t>(page.rows);
  page.page_size = static_cast<std::int64_t>(page.rows);

  const auto cursor_pos = find_section(body, "history.cursor");
  if (cursor_pos != std::string::npos) {
    const auto cursor_columns =
        split_row(array_after(body, cursor_pos, "columns"));
    const auto cursor_rows = data_rows(array_after(body, cursor_pos, "data"));
    if (!cursor_rows.empty()) {
      const auto values = split_row(cursor_rows.front());
      const int index_i = find_column_index(cursor_columns, "INDEX");
      const int total_i = find_column_index(cursor_columns, "TOTAL");
      const int size_i = find_column_index(cursor_columns, "PAGESIZE");
      if (static_cast<int>(values.size()) <=
          std::max({index_i, total_i, size_i})) {
        throw std::runtime_error("history.cursor row malformed");
      }
      page.index = parse_int(values[index_i], "INDEX");
      page.total = parse_int(values[total_i], "TOTAL");
      page.page_size = parse_int(values[size_i], "PAGESIZE");
    }
  }

  return page;
}
