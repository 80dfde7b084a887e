#include "core/generator.h"
#include "fixtures.h"

#include <gtest/gtest.h>

class GeneratorTest : public ::testing::Test {
 protected:
  MarketHours market{MarketHoursConfig{}};
  SymbolInfo tst{1, "TST", "NASDAQ", MarketType::Stock};

  PriceSeries confirmed(Date last) const {
    return make_series(v_closes(), last, 1.0, spiked_volumes());
  }
};

TEST_F(GeneratorTest, ConfirmedBuyWhileMarketOpen) {
  auto now = at("2026-10-19 15:00:00");
  auto verdicts = generate(tst, confirmed(date_of("2026-10-18")),
                           Mode::ConfirmedBuy, now, market);

  ASSERT_EQ(verdicts.size(), 1u);
  auto& v = verdicts[0];
  EXPECT_EQ(v.si.symbol, "TST");
  EXPECT_EQ(v.si.id, 1);
  EXPECT_EQ(v.detector, DetectorType::ConfirmedBuy);
  EXPECT_EQ(v.type, SignalType::Buy);
  EXPECT_EQ(v.strength, Strength::Strong);
  EXPECT_DOUBLE_EQ(v.confidence, 0.95);
  EXPECT_EQ(v.signal_date, date_of("2026-10-19"));
  EXPECT_DOUBLE_EQ(v.price, 98.5);
  ASSERT_TRUE(v.volume);
  EXPECT_DOUBLE_EQ(*v.volume, 1300.0);
  EXPECT_NE(v.reason.find("Signal date: 2026-10-19"), std::string::npos);
}

TEST_F(GeneratorTest, SeventyCandlesAfterTheClose) {
  // 60 drops of 0.25, then +3/-2 alternating: 5/20 cross at -5, RSI 60/97
  std::vector<double> closes;
  double x = 100.0;
  for (int i = 0; i < 70; i++) {
    if (i > 0)
      x += i <= 60 ? -0.25 : ((i - 60) % 2 ? 3.0 : -2.0);
    closes.push_back(x);
  }
  // 5 day average 3900 over 50 day average 3000
  std::vector<double> vols(65, 2900.0);
  vols.insert(vols.end(), 5, 3900.0);

  auto series = make_series(closes, date_of("2026-10-19"), 0.5, vols);
  auto verdicts = generate(tst, series, Mode::ConfirmedBuy,
                           at("2026-10-19 21:00:00"), market);

  ASSERT_EQ(verdicts.size(), 1u);
  auto& v = verdicts[0];
  EXPECT_EQ(v.type, SignalType::Buy);
  EXPECT_EQ(v.strength, Strength::Strong);
  EXPECT_DOUBLE_EQ(v.confidence, 0.95);
  EXPECT_EQ(v.signal_date, date_of("2026-10-19"));
  EXPECT_DOUBLE_EQ(v.price, 92.0);

  EXPECT_EQ(v.details["crossover_offset"], -5);
  EXPECT_NEAR(v.details["volume_ratio"].get<double>(), 1.3, 1e-9);
  EXPECT_NEAR(v.details["rsi"].get<double>(), 6000.0 / 97.0, 1e-9);
  EXPECT_NE(v.reason.find("today's closed candle"), std::string::npos);
}

TEST_F(GeneratorTest, FormingCandleIsNotEvaluated) {
  auto series = confirmed(date_of("2026-10-18"));

  Candle forming;
  forming.datetime = at("2026-10-19 00:00:00");
  forming.open = 98.0;
  forming.close = 10.0;
  forming.high = 99.0;
  forming.low = 9.0;
  forming.volume = 50.0;
  series.push_back(forming);

  auto verdicts = generate(tst, series, Mode::ConfirmedBuy,
                           at("2026-10-19 15:00:00"), market);
  ASSERT_EQ(verdicts.size(), 1u);
  EXPECT_DOUBLE_EQ(verdicts[0].price, 98.5);
  EXPECT_NE(verdicts[0].reason.find("removed"), std::string::npos);
}

TEST_F(GeneratorTest, TodaysClosedCandleAfterClose) {
  auto verdicts = generate(tst, confirmed(date_of("2026-10-19")),
                           Mode::ConfirmedBuy, at("2026-10-19 21:00:00"),
                           market);
  ASSERT_EQ(verdicts.size(), 1u);
  EXPECT_EQ(verdicts[0].signal_date, date_of("2026-10-19"));
}

TEST_F(GeneratorTest, AllModeRunsEveryDetector) {
  auto verdicts = generate(tst, confirmed(date_of("2026-10-18")), Mode::All,
                           at("2026-10-19 15:00:00"), market);

  ASSERT_EQ(verdicts.size(), 2u);
  EXPECT_EQ(verdicts[0].detector, DetectorType::Sma50Trend);
  EXPECT_EQ(verdicts[0].strength, Strength::Weak);
  EXPECT_EQ(verdicts[0].signal_date, date_of("2026-10-19"));
  EXPECT_EQ(verdicts[1].detector, DetectorType::ConfirmedBuy);
}

TEST_F(GeneratorTest, CryptoOnUnknownExchange) {
  SymbolInfo btc{7, "BTC/USDT", "BINANCE", MarketType::Crypto};
  auto verdicts = generate(btc, confirmed(date_of("2026-10-19")),
                           Mode::ConfirmedBuy, at("2026-10-19 15:00:00"),
                           market);
  ASSERT_EQ(verdicts.size(), 1u);
  EXPECT_NE(verdicts[0].reason.find("Unknown exchange"), std::string::npos);
}

TEST_F(GeneratorTest, NothingToEvaluate) {
  auto now = at("2026-10-19 15:00:00");
  EXPECT_TRUE(generate(tst, {}, Mode::All, now, market).empty());

  auto short_series = make_series({1.0, 2.0, 3.0}, date_of("2026-10-18"));
  EXPECT_TRUE(generate(tst, short_series, Mode::All, now, market).empty());
}
