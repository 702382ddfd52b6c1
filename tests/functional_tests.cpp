#include "csv_history_provider.hpp"
#include "date_utils.hpp"
#include "option_pricer.hpp"
#include "quote_report.hpp"
#include "quote_service.hpp"
#include "synthetic_history_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

// 2026-10-19, понедельник.
const std::int64_t kValuationDate = parse_iso_date("2026-10-19");

} // namespace

class FixtureProvider : public MarketDataProvider {
public:
  explicit FixtureProvider(std::vector<double> closes)
      : closes_(std::move(closes)) {}

  PriceSeries get_history(const std::string &ticker, std::int64_t from,
                          std::int64_t to) override {
    ++calls;
    last_from = from;
    last_to = to;
    PriceSeries series;
    series.ticker = ticker;
    std::int64_t ts = to - static_cast<std::int64_t>(closes_.size()) *
                               kSecondsPerDay;
    for (double c : closes_) {
      ts += kSecondsPerDay;
      series.points.push_back(PricePoint{ts, c});
    }
    return series;
  }

  int calls{0};
  std::int64_t last_from{0};
  std::int64_t last_to{0};

private:
  std::vector<double> closes_;
};

class FailingProvider : public MarketDataProvider {
public:
  PriceSeries get_history(const std::string &, std::int64_t,
                          std::int64_t) override {
    throw std::runtime_error("network error");
  }
};

QuoteRequest make_request(const std::string &type) {
  QuoteRequest req;
  req.ticker = "SBER";
  req.strike = 100.0;
  req.expiry = "2027-10-19";
  req.option_type = type;
  req.risk_free_rate = 0.05;
  return req;
}

TEST(QuoteServiceFunctionalTest, PricesCallAndPutFromHistory) {
  std::vector<double> closes = {100.0, 101.0, 99.5, 102.0, 103.5};
  auto provider = std::make_shared<FixtureProvider>(closes);
  QuoteService service(provider);

  auto call = service.quote(make_request("call"), kValuationDate);
  auto put = service.quote(make_request("Put"), kValuationDate);
  ASSERT_TRUE(call.ok()) << call.error;
  ASSERT_TRUE(put.ok()) << put.error;

  EXPECT_EQ(provider->calls, 2);
  EXPECT_EQ(provider->last_to, kValuationDate);
  EXPECT_EQ(provider->last_from, kValuationDate - 365 * kSecondsPerDay);

  const double vol = 0.26814132826515885;
  EXPECT_EQ(call.result.ticker, "SBER");
  EXPECT_DOUBLE_EQ(call.result.spot, 103.5);
  EXPECT_EQ(call.result.days_to_expiry, 365);
  EXPECT_NEAR(call.result.volatility, vol, 1e-12);
  EXPECT_EQ(call.result.observations, 5u);
  EXPECT_EQ(put.result.kind, OptionKind::Put);

  const double T = 1.0;
  EXPECT_NEAR(call.result.price,
              OptionPricer::black_scholes_call(103.5, 100.0, T, 0.05, vol),
              1e-12);
  EXPECT_NEAR(put.result.price - call.result.price,
              100.0 * std::exp(-0.05 * T) - 103.5, 1e-9);
}

TEST(QuoteServiceFunctionalTest, RejectsUnsupportedKindWithoutFetching) {
  auto provider = std::make_shared<FixtureProvider>(std::vector<double>{1, 2, 3});
  QuoteService service(provider);

  auto outcome = service.quote(make_request("straddle"), kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::UnsupportedOptionKind);
  EXPECT_EQ(provider->calls, 0);
}

TEST(QuoteServiceFunctionalTest, BothKindsShareOneFetch) {
  auto provider = std::make_shared<FixtureProvider>(
      std::vector<double>{100.0, 101.0, 99.5, 102.0, 103.5});
  QuoteService service(provider);

  auto outcomes =
      service.quote_all(make_request("call"), {"call", "put"}, kValuationDate);
  ASSERT_EQ(outcomes.size(), 2u);
  ASSERT_TRUE(outcomes[0].ok()) << outcomes[0].error;
  ASSERT_TRUE(outcomes[1].ok()) << outcomes[1].error;
  EXPECT_EQ(provider->calls, 1);

  EXPECT_EQ(outcomes[0].result.kind, OptionKind::Call);
  EXPECT_EQ(outcomes[1].result.kind, OptionKind::Put);
  EXPECT_DOUBLE_EQ(outcomes[0].result.volatility,
                   outcomes[1].result.volatility);
  EXPECT_NEAR(outcomes[1].result.price - outcomes[0].result.price,
              100.0 * std::exp(-0.05) - 103.5, 1e-9);
}

TEST(QuoteServiceFunctionalTest, BadKindFailsAloneInBatch) {
  auto provider = std::make_shared<FixtureProvider>(
      std::vector<double>{100.0, 101.0, 99.5, 102.0, 103.5});
  QuoteService service(provider);

  auto outcomes = service.quote_all(make_request("call"),
                                    {"straddle", "put"}, kValuationDate);
  ASSERT_EQ(outcomes.size(), 2u);
  ASSERT_FALSE(outcomes[0].ok());
  EXPECT_EQ(*outcomes[0].error_kind, PricingErrorKind::UnsupportedOptionKind);
  EXPECT_TRUE(outcomes[1].ok()) << outcomes[1].error;
  EXPECT_EQ(provider->calls, 1);
}

TEST(QuoteServiceFunctionalTest, BatchSharesMarketDataFailure) {
  QuoteService service(std::make_shared<FailingProvider>());
  auto outcomes =
      service.quote_all(make_request("call"), {"call", "put"}, kValuationDate);
  ASSERT_EQ(outcomes.size(), 2u);
  for (const auto &outcome : outcomes) {
    ASSERT_FALSE(outcome.ok());
    EXPECT_EQ(*outcome.error_kind, PricingErrorKind::DataUnavailable);
  }
}

TEST(QuoteServiceFunctionalTest, RejectsUnsupportedModel) {
  QuoteService service(
      std::make_shared<FixtureProvider>(std::vector<double>{1, 2, 3}));
  auto req = make_request("call");
  req.model = "Heston";
  auto outcome = service.quote(req, kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::UnsupportedModel);

  req.model = "bs";
  EXPECT_TRUE(service.quote(req, kValuationDate).ok());
}

TEST(QuoteServiceFunctionalTest, ExpiryMustBeInTheFuture) {
  QuoteService service(
      std::make_shared<FixtureProvider>(std::vector<double>{1, 2, 3}));
  auto req = make_request("call");

  req.expiry = "2026-10-19";
  auto same_day = service.quote(req, kValuationDate);
  ASSERT_FALSE(same_day.ok());
  EXPECT_EQ(*same_day.error_kind, PricingErrorKind::InvalidExpiry);

  req.expiry = "2025-01-01";
  EXPECT_EQ(*service.quote(req, kValuationDate).error_kind,
            PricingErrorKind::InvalidExpiry);

  req.expiry = "19/10/2027";
  EXPECT_EQ(*service.quote(req, kValuationDate).error_kind,
            PricingErrorKind::InvalidExpiry);

  req.expiry = "2026-10-20";
  auto next_day = service.quote(req, kValuationDate);
  ASSERT_TRUE(next_day.ok()) << next_day.error;
  EXPECT_EQ(next_day.result.days_to_expiry, 1);
  EXPECT_NEAR(next_day.result.pricing.request.maturity_years, 1.0 / 365.0,
              1e-15);
}

TEST(QuoteServiceFunctionalTest, EmptyHistoryIsNoDataFound) {
  QuoteService service(std::make_shared<FixtureProvider>(std::vector<double>{}));
  auto outcome = service.quote(make_request("call"), kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::NoDataFound);
  EXPECT_NE(outcome.error.find("SBER"), std::string::npos);
}

TEST(QuoteServiceFunctionalTest, SingleObservationIsInsufficientData) {
  QuoteService service(
      std::make_shared<FixtureProvider>(std::vector<double>{100.0}));
  auto outcome = service.quote(make_request("call"), kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::InsufficientData);
}

TEST(QuoteServiceFunctionalTest, FlatHistoryGivesInvalidInput) {
  // Нулевая волатильность не допускается формулой.
  QuoteService service(std::make_shared<FixtureProvider>(
      std::vector<double>(20, 250.0)));
  auto outcome = service.quote(make_request("call"), kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::InvalidInput);
}

TEST(QuoteServiceFunctionalTest, NonPositiveStrikeIsInvalidInput) {
  QuoteService service(
      std::make_shared<FixtureProvider>(std::vector<double>{1, 2, 3}));
  auto req = make_request("put");
  req.strike = 0.0;
  EXPECT_EQ(*service.quote(req, kValuationDate).error_kind,
            PricingErrorKind::InvalidInput);
}

TEST(QuoteServiceFunctionalTest, ProviderFailureIsDataUnavailable) {
  QuoteService service(std::make_shared<FailingProvider>());
  auto outcome = service.quote(make_request("call"), kValuationDate);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(*outcome.error_kind, PricingErrorKind::DataUnavailable);
  EXPECT_NE(outcome.error.find("network error"), std::string::npos);
}

TEST(QuoteServiceFunctionalTest, WindowLimitsObservationsUsed) {
  std::vector<double> closes = {100.0, 101.0, 99.5, 102.0, 103.5};
  VolatilityConfig cfg;
  cfg.window = 3;
  QuoteService service(std::make_shared<FixtureProvider>(closes), cfg);
  auto outcome = service.quote(make_request("call"), kValuationDate);
  ASSERT_TRUE(outcome.ok()) << outcome.error;
  EXPECT_NEAR(outcome.result.volatility, 0.114678465446019, 1e-12);
  EXPECT_DOUBLE_EQ(outcome.result.spot, 103.5);
}

TEST(QuoteServiceFunctionalTest, JsonLineUsesReportRounding) {
  QuoteService service(std::make_shared<FixtureProvider>(
      std::vector<double>{100.0, 101.0, 99.5, 102.0, 103.5}));
  auto req = make_request("call");
  auto outcome = service.quote(req, kValuationDate);
  ASSERT_TRUE(outcome.ok());

  auto line = to_json_line(outcome, req);
  EXPECT_NE(line.find("\"ticker\":\"SBER\""), std::string::npos);
  EXPECT_NE(line.find("\"option_type\":\"call\""), std::string::npos);
  EXPECT_NE(line.find("\"current_price\":103.50"), std::string::npos);
  EXPECT_NE(line.find("\"days_to_expiry\":365"), std::string::npos);
  EXPECT_NE(line.find("\"volatility\":26.81"), std::string::npos);
  EXPECT_NE(line.find("\"risk_free_rate\":5.00"), std::string::npos);
  EXPECT_NE(line.find("\"status\":\"OK\""), std::string::npos);
}

TEST(SyntheticProviderFunctionalTest, DeterministicWeekdaySeries) {
  SyntheticHistoryProvider provider;
  const auto from = parse_iso_date("2026-10-05");
  const auto to = parse_iso_date("2026-10-18");
  auto a = provider.get_history("SBER", from, to);
  auto b = provider.get_history("SBER", from, to);

  ASSERT_EQ(a.points.size(), 10u);
  ASSERT_EQ(a.points.size(), b.points.size());
  EXPECT_DOUBLE_EQ(a.points.front().close, 100.0);
  for (std::size_t i = 0; i < a.points.size(); ++i) {
    EXPECT_EQ(a.points[i].timestamp, b.points[i].timestamp);
    EXPECT_DOUBLE_EQ(a.points[i].close, b.points[i].close);
    EXPECT_FALSE(is_weekend(a.points[i].timestamp));
    EXPECT_GT(a.points[i].close, 0.0);
    if (i > 0) {
      EXPECT_GT(a.points[i].timestamp, a.points[i - 1].timestamp);
    }
  }
}

TEST(SyntheticProviderFunctionalTest, FeedsQuoteService) {
  QuoteService service(std::make_shared<SyntheticHistoryProvider>());
  auto outcome = service.quote(make_request("put"), kValuationDate);
  ASSERT_TRUE(outcome.ok()) << outcome.error;
  EXPECT_GT(outcome.result.volatility, 0.1);
  EXPECT_LT(outcome.result.volatility, 0.5);
  EXPECT_GT(outcome.result.price, 0.0);
  EXPECT_GT(outcome.result.observations, 250u);
}

TEST(CsvProviderFunctionalTest, ReplaysFileThroughQuoteService) {
  char dir_template[] = "/tmp/option_quote_csvXXXXXX";
  char *dir = mkdtemp(dir_template);
  ASSERT_NE(dir, nullptr);
  const std::string path = std::string(dir) + "/SBER.csv";
  {
    std::ofstream out(path);
    out << "Date,Close\n"
        << "2024-01-02,50.0\n"
        << "2026-10-13,100.0\n"
        << "2026-10-14,101.0\n"
        << "2026-10-15,99.5\n"
        << "2026-10-16,102.0\n"
        << "2026-10-19,103.5\n"
        << "2026-10-20,500.0\n";
  }

  QuoteService service(std::make_shared<CsvHistoryProvider>(dir));
  auto outcome = service.quote(make_request("call"), kValuationDate);

  std::remove(path.c_str());
  rmdir(dir);

  ASSERT_TRUE(outcome.ok()) << outcome.error;
  // Строки вне [valuation - 365d, valuation] отброшены.
  EXPECT_EQ(outcome.result.observations, 5u);
  EXPECT_DOUBLE_EQ(outcome.result.spot, 103.5);
  EXPECT_NEAR(outcome.result.volatility, 0.26814132826515885, 1e-12);
}
