#include "../include/market/asset.hpp"
#include "../include/market/bar.hpp"
#include "../include/util/market_hours.hpp"
#include "../include/util/time_utils.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using namespace fxsig;
using namespace fxsig::market;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "  " << #name << "... ";                                                                          \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

const std::string TEST_FILE = "/tmp/test_fxsignal_bars.csv";

// 2023-11-17 00:00 UTC, a Friday
const int64_t FRIDAY = 1700179200;
const int64_t HOUR = 3600;

// =============================================================================
// Asset classes
// =============================================================================

TEST(asset_class_inference) {
    ASSERT_EQ(infer_asset_class("EURUSD=X"), AssetClass::Forex);
    ASSERT_EQ(infer_asset_class("gbpjpy"), AssetClass::Forex);
    ASSERT_EQ(infer_asset_class("GC=F"), AssetClass::Metal);
    ASSERT_EQ(infer_asset_class("XAUUSD"), AssetClass::Metal);
    ASSERT_EQ(infer_asset_class("BTC-USD"), AssetClass::Crypto);
    ASSERT_EQ(infer_asset_class("ETHUSDT"), AssetClass::Crypto);
    ASSERT_EQ(infer_asset_class("^GSPC"), AssetClass::Index);
}

TEST(asset_class_names) {
    AssetClass all[] = {AssetClass::Forex, AssetClass::Metal, AssetClass::Crypto, AssetClass::Index};
    for (auto ac : all)
        ASSERT_EQ(string_to_asset_class(asset_class_to_string(ac)), ac);
    ASSERT_EQ(string_to_asset_class("fx"), AssetClass::Forex);

    bool thrown = false;
    try {
        string_to_asset_class("bonds");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
}

TEST(pip_factors) {
    ASSERT_NEAR(pip_factor_for("EURUSD=X", AssetClass::Forex), 10000.0, 1e-12);
    ASSERT_NEAR(pip_factor_for("USDJPY=X", AssetClass::Forex), 100.0, 1e-12);
    ASSERT_NEAR(pip_factor_for("GC=F", AssetClass::Metal), 10.0, 1e-12);
}

TEST(contract_specs) {
    AssetSpec fx = asset_spec(AssetClass::Forex);
    ASSERT_NEAR(fx.contract_multiplier, 100000.0, 1e-9);
    ASSERT_NEAR(fx.min_size, fx.size_step, 1e-12);

    AssetSpec metal = asset_spec(AssetClass::Metal);
    ASSERT_NEAR(metal.contract_multiplier, 100.0, 1e-9);
}

// =============================================================================
// Bar files
// =============================================================================

TEST(csv_round_trip) {
    std::vector<Bar> bars;
    for (int i = 0; i < 3; ++i) {
        Bar b;
        b.timestamp = 1700000000 + i * HOUR;
        b.open = 1.1001 + i * 0.0001;
        b.high = b.open + 0.0010;
        b.low = b.open - 0.0010;
        b.close = b.open + 0.0002;
        b.volume = 1234.5;
        bars.push_back(b);
    }
    save_bars_csv(TEST_FILE, bars);

    auto loaded = load_bars_csv(TEST_FILE);
    ASSERT_EQ(loaded.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        ASSERT_EQ(loaded[i].timestamp, bars[i].timestamp);
        ASSERT_NEAR(loaded[i].close, bars[i].close, 1e-9);
        ASSERT_NEAR(loaded[i].volume, 1234.5, 1e-9);
    }
    std::remove(TEST_FILE.c_str());
}

TEST(csv_millisecond_timestamps_and_short_rows) {
    {
        std::ofstream out(TEST_FILE);
        out << "# exported klines\n";
        out << "1700000000000,1.1,1.2,1.0,1.15,10\r\n";
        out << "1700003600000,1.15,1.25\n";
        out << "1700007200000,1.15,1.25,1.1,1.2\n";
    }

    auto bars = load_bars_csv(TEST_FILE);
    ASSERT_EQ(bars.size(), 2u);
    ASSERT_EQ(bars[0].timestamp, 1700000000);
    ASSERT_NEAR(bars[0].volume, 10.0, 1e-12);
    ASSERT_EQ(bars[1].timestamp, 1700007200);
    ASSERT_NEAR(bars[1].volume, 0.0, 1e-12);
    std::remove(TEST_FILE.c_str());
}

TEST(csv_malformed_row_throws) {
    {
        std::ofstream out(TEST_FILE);
        out << "1700000000,1.1,abc,1.0,1.15\n";
    }
    bool thrown = false;
    try {
        load_bars_csv(TEST_FILE);
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown);
    std::remove(TEST_FILE.c_str());
}

TEST(strictly_increasing_check) {
    std::vector<Bar> bars(3);
    bars[0].timestamp = 1;
    bars[1].timestamp = 2;
    bars[2].timestamp = 3;
    ASSERT_TRUE(is_strictly_increasing(bars));
    bars[2].timestamp = 2;
    ASSERT_FALSE(is_strictly_increasing(bars));
}

// =============================================================================
// Trading hours
// =============================================================================

TEST(weekend_session_boundaries) {
    ASSERT_TRUE(util::is_market_open(FRIDAY + 21 * HOUR, AssetClass::Forex));
    ASSERT_FALSE(util::is_market_open(FRIDAY + 22 * HOUR, AssetClass::Forex));
    ASSERT_FALSE(util::is_market_open(FRIDAY + 36 * HOUR, AssetClass::Metal)); // Saturday noon
    ASSERT_FALSE(util::is_market_open(FRIDAY + 69 * HOUR, AssetClass::Forex)); // Sunday 21:00
    ASSERT_TRUE(util::is_market_open(FRIDAY + 70 * HOUR, AssetClass::Forex));  // Sunday 22:00
    ASSERT_TRUE(util::is_market_open(FRIDAY + 82 * HOUR, AssetClass::Index));  // Monday 10:00
}

TEST(crypto_never_closes) {
    for (int h = 0; h < 24 * 7; h += 5)
        ASSERT_TRUE(util::is_market_open(FRIDAY + h * HOUR, AssetClass::Crypto));
}

TEST(utc_formatting) {
    ASSERT_EQ(util::format_utc(1700000000), "2023-11-14 22:13");
    ASSERT_EQ(util::format_utc(0), "1970-01-01 00:00");
}

int main() {
    std::cout << "\n=== Market Data Tests ===\n\n";

    std::cout << "Asset classes:\n";
    RUN_TEST(asset_class_inference);
    RUN_TEST(asset_class_names);
    RUN_TEST(pip_factors);
    RUN_TEST(contract_specs);

    std::cout << "\nBar files:\n";
    RUN_TEST(csv_round_trip);
    RUN_TEST(csv_millisecond_timestamps_and_short_rows);
    RUN_TEST(csv_malformed_row_throws);
    RUN_TEST(strictly_increasing_check);

    std::cout << "\nTrading hours:\n";
    RUN_TEST(weekend_session_boundaries);
    RUN_TEST(crypto_never_closes);
    RUN_TEST(utc_formatting);

    std::cout << "\n=== All tests PASSED! ===\n";
    return 0;
}
