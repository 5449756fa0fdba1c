#include "../../include/indicators/indicator_provider.hpp"

#include <algorithm>
#include <cmath>
#include <deque>

namespace fxsig::indicators {

namespace {

// EMA seeded with the SMA of the first `period` samples
class SeededEma {
public:
    explicit SeededEma(int period) : period_(period), alpha_(2.0 / (period + 1)) {}

    std::optional<double> update(double x) {
        if (count_ < period_) {
            sum_ += x;
            ++count_;
            if (count_ < period_)
                return std::nullopt;
            value_ = sum_ / period_;
            return value_;
        }
        value_ = alpha_ * x + (1 - alpha_) * value_;
        return value_;
    }

private:
    int period_;
    double alpha_;
    int count_ = 0;
    double sum_ = 0;
    double value_ = 0;
};

// Wilder's smoothing: plain average of the first `period` samples, then alpha = 1/period
class WilderAverage {
public:
    explicit WilderAverage(int period) : period_(period) {}

    std::optional<double> update(double x) {
        if (count_ < period_) {
            sum_ += x;
            ++count_;
            if (count_ < period_)
                return std::nullopt;
            value_ = sum_ / period_;
            return value_;
        }
        value_ = (value_ * (period_ - 1) + x) / period_;
        return value_;
    }

private:
    int period_;
    int count_ = 0;
    double sum_ = 0;
    double value_ = 0;
};

class RollingWindow {
public:
    explicit RollingWindow(int size) : size_(static_cast<size_t>(size)) {}

    void push(double x) {
        values_.push_back(x);
        if (values_.size() > size_)
            values_.pop_front();
    }

    bool full() const { return values_.size() == size_; }

    double mean() const {
        double sum = 0;
        for (double v : values_)
            sum += v;
        return sum / static_cast<double>(values_.size());
    }

    // Population standard deviation
    double stddev() const {
        double m = mean();
        double acc = 0;
        for (double v : values_)
            acc += (v - m) * (v - m);
        return std::sqrt(acc / static_cast<double>(values_.size()));
    }

    double max() const { return *std::max_element(values_.begin(), values_.end()); }
    double min() const { return *std::min_element(values_.begin(), values_.end()); }

private:
    size_t size_;
    std::deque<double> values_;
};

double rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0)
        return avg_gain > 0 ? 100.0 : 50.0;
    double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

} // namespace

std::optional<IndicatorSeries> TechnicalIndicatorProvider::compute(const std::vector<market::Bar>& bars) const {
    if (!market::is_strictly_increasing(bars))
        return std::nullopt;

    SeededEma ema_short(config_.ema_short_period);
    SeededEma ema_medium(config_.ema_medium_period);
    SeededEma ema_long(config_.ema_long_period);

    SeededEma macd_fast(config_.macd_fast);
    SeededEma macd_slow(config_.macd_slow);
    SeededEma macd_signal(config_.macd_signal);

    WilderAverage avg_gain(config_.rsi_period);
    WilderAverage avg_loss(config_.rsi_period);
    WilderAverage atr(config_.atr_period);

    WilderAverage tr_smooth(config_.adx_period);
    WilderAverage plus_dm_smooth(config_.adx_period);
    WilderAverage minus_dm_smooth(config_.adx_period);
    WilderAverage adx(config_.adx_period);

    RollingWindow highs(config_.stoch_period);
    RollingWindow lows(config_.stoch_period);
    RollingWindow raw_k(config_.stoch_k_smooth);
    RollingWindow smooth_k(config_.stoch_d_period);

    RollingWindow bb_closes(config_.bb_period);
    RollingWindow volumes(config_.volume_period);

    SeededEma obv_ema(config_.obv_ema_period);
    double obv = 0;

    IndicatorSeries out;
    out.reserve(bars.size());

    for (size_t i = 0; i < bars.size(); ++i) {
        const market::Bar& b = bars[i];
        IndicatorSnapshot ind;

        ind.ema_20 = ema_short.update(b.close);
        ind.ema_50 = ema_medium.update(b.close);
        ind.ema_200 = ema_long.update(b.close);

        auto fast = macd_fast.update(b.close);
        auto slow = macd_slow.update(b.close);
        if (fast && slow) {
            double line = *fast - *slow;
            auto signal = macd_signal.update(line);
            if (signal)
                ind.macd_hist = line - *signal;
        }

        double tr = b.high - b.low;
        if (i > 0) {
            const market::Bar& prev = bars[i - 1];
            tr = std::max({b.high - b.low, std::abs(b.high - prev.close), std::abs(b.low - prev.close)});

            double change = b.close - prev.close;
            auto gain = avg_gain.update(std::max(0.0, change));
            auto loss = avg_loss.update(std::max(0.0, -change));
            if (gain && loss)
                ind.rsi = rsi_from_averages(*gain, *loss);

            // Directional movement
            double up = b.high - prev.high;
            double down = prev.low - b.low;
            double plus_dm = (up > down && up > 0) ? up : 0.0;
            double minus_dm = (down > up && down > 0) ? down : 0.0;

            auto str = tr_smooth.update(tr);
            auto spdm = plus_dm_smooth.update(plus_dm);
            auto smdm = minus_dm_smooth.update(minus_dm);
            if (str && spdm && smdm) {
                double dx = 0.0;
                if (*str > 0) {
                    double plus_di = 100.0 * *spdm / *str;
                    double minus_di = 100.0 * *smdm / *str;
                    if (plus_di + minus_di > 0)
                        dx = 100.0 * std::abs(plus_di - minus_di) / (plus_di + minus_di);
                }
                ind.adx = adx.update(dx);
            }

            if (change > 0)
                obv += b.volume;
            else if (change < 0)
                obv -= b.volume;
        }
        ind.atr = atr.update(tr);

        auto obv_avg = obv_ema.update(obv);
        if (obv_avg)
            ind.obv_trend = obv > *obv_avg ? 1.0 : (obv < *obv_avg ? -1.0 : 0.0);

        // Stochastic %K / %D
        highs.push(b.high);
        lows.push(b.low);
        if (highs.full()) {
            double hh = highs.max();
            double ll = lows.min();
            raw_k.push(hh > ll ? 100.0 * (b.close - ll) / (hh - ll) : 50.0);
            if (raw_k.full()) {
                double k = raw_k.mean();
                ind.stoch_k = k;
                smooth_k.push(k);
                if (smooth_k.full())
                    ind.stoch_d = smooth_k.mean();
            }
        }

        // Bollinger band position
        bb_closes.push(b.close);
        if (bb_closes.full()) {
            double mid = bb_closes.mean();
            double width = 2.0 * config_.bb_std_dev * bb_closes.stddev();
            double lower = mid - width / 2.0;
            ind.bb_position = width > 0 ? (b.close - lower) / width : 0.5;
        }

        volumes.push(b.volume);
        if (volumes.full()) {
            double avg_volume = volumes.mean();
            if (avg_volume > 0)
                ind.volume_ratio = b.volume / avg_volume;
        }

        size_t lookback = static_cast<size_t>(config_.momentum_lookback);
        if (i >= lookback && ind.atr) {
            double score = 0.0;
            if (*ind.atr > 0) {
                score = (b.close - bars[i - lookback].close) / *ind.atr * config_.momentum_scale;
                score = std::clamp(score, -100.0, 100.0);
            }
            ind.momentum_score = score;
        }

        out.push_back({b, ind});
    }

    return out;
}

} // namespace fxsig::indicators
