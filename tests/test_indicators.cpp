#include "fixtures.h"
#include "ind/indicators.h"

#include <gtest/gtest.h>

#include <cmath>
#include <numeric>

TEST(SMA, ExactTrailingMean) {
  std::vector<double> xs = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
  SMA sma{xs, 4};

  ASSERT_EQ(sma.values.size(), xs.size());
  for (int i = 0; i < 3; i++)
    EXPECT_TRUE(std::isnan(sma.values[i])) << i;

  for (size_t i = 3; i < xs.size(); i++) {
    auto mean = std::accumulate(xs.begin() + i - 3, xs.begin() + i + 1, 0.0) / 4;
    EXPECT_NEAR(sma.values[i], mean, 1e-12) << i;
  }
}

TEST(SMA, ShortSeriesIsAllNaN) {
  SMA sma{std::vector<double>{1, 2, 3}, 50};
  ASSERT_EQ(sma.values.size(), 3u);
  for (auto v : sma.values)
    EXPECT_TRUE(std::isnan(v));
}

TEST(EMA, Deterministic) {
  auto xs = v_closes();
  EMA a{xs, 20}, b{xs, 20};
  EXPECT_EQ(a.values, b.values);
}

TEST(EMA, FirstValueIsFirstPriceAndConstantStaysPut) {
  std::vector<double> xs(30, 42.0);
  EMA ema{xs, 12};
  for (auto v : ema.values)
    EXPECT_DOUBLE_EQ(v, 42.0);

  EMA ema2{std::vector<double>{10.0, 20.0}, 3};
  EXPECT_DOUBLE_EQ(ema2.values[0], 10.0);
  // weights 1 and 0.5
  EXPECT_NEAR(ema2.values[1], (20.0 + 0.5 * 10.0) / 1.5, 1e-12);
}

TEST(RSI, FlatSeriesIsFifty) {
  RSI rsi{std::vector<double>(30, 100.0)};
  for (int i = 0; i < 14; i++)
    EXPECT_TRUE(std::isnan(rsi.values[i]));
  for (size_t i = 14; i < rsi.values.size(); i++)
    EXPECT_DOUBLE_EQ(rsi.values[i], 50.0);
}

TEST(RSI, OnlyGainsIsHundred) {
  std::vector<double> xs;
  for (int i = 0; i < 30; i++)
    xs.push_back(10.0 + i);
  RSI rsi{xs};
  EXPECT_DOUBLE_EQ(rsi.values.back(), 100.0);
}

TEST(RSI, TooShortIsAllNaN) {
  RSI rsi{std::vector<double>(14, 1.0)};
  for (auto v : rsi.values)
    EXPECT_TRUE(std::isnan(v));
}

TEST(RSI, StaysWithinBounds) {
  std::vector<double> xs;
  for (int i = 0; i < 200; i++)
    xs.push_back(100.0 + 10.0 * std::sin(i * 0.37) + (i % 7) * 0.3);

  RSI rsi{xs};
  for (size_t i = 14; i < xs.size(); i++) {
    EXPECT_GE(rsi.values[i], 0.0);
    EXPECT_LE(rsi.values[i], 100.0);
  }
}

TEST(RSI, KnownValue) {
  // last 14 deltas: six of -0.5, eight of +3
  auto xs = v_closes();
  RSI rsi{xs};
  EXPECT_NEAR(rsi.values.back(), 100.0 - 100.0 / 9.0, 1e-9);
}

TEST(MACD, LineIsFastMinusSlow) {
  auto series = make_series(v_closes(), date_of("2026-10-18"));
  MACD macd{series};
  EMA fast{series, 12}, slow{series, 26};

  for (size_t i = 0; i < series.size(); i++) {
    EXPECT_NEAR(macd.macd_line[i], fast.values[i] - slow.values[i], 1e-12);
    EXPECT_NEAR(macd.histogram[i], macd.macd_line[i] - macd.signal_line()[i],
                1e-12);
  }
}

TEST(Indicators, NegativeIndexReadsFromTheEnd) {
  auto closes = v_closes();
  auto series = make_series(closes, date_of("2026-10-18"), 1.0,
                            spiked_volumes());
  Indicators ind{series, date_of("2026-10-19")};

  EXPECT_EQ(ind.size(), 60u);
  EXPECT_DOUBLE_EQ(ind.close(-1), closes.back());
  EXPECT_DOUBLE_EQ(ind.close(-2), closes[58]);
  EXPECT_DOUBLE_EQ(ind.close(59), closes.back());
  EXPECT_TRUE(ind.has_volume());
  EXPECT_DOUBLE_EQ(ind.vol_avg5(-1), 1300.0);
}

TEST(Indicators, MissingVolumeReadsNaN) {
  auto series = make_series(v_closes(), date_of("2026-10-18"), 1.0,
                            spiked_volumes());
  series[10].volume.reset();

  Indicators ind{series, date_of("2026-10-19")};
  EXPECT_FALSE(ind.has_volume());
  EXPECT_TRUE(std::isnan(ind.vol_avg50(-1)));
  EXPECT_TRUE(std::isnan(ind.volume(10)));
}
