#pragma once

#include "../strategy/signal.hpp"
#include "../strategy/trade_params.hpp"
#include "../trading/trade.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

namespace fxsig {
namespace external {

/**
 * Notification channel
 *
 * Fire-and-forget: each call returns whether the message was delivered.
 * Callers log a false return or an exception and carry on; trade state
 * never depends on delivery.
 */
class INotifier {
public:
    virtual ~INotifier() = default;

    virtual bool signal_raised(const strategy::TradeParams& params, const strategy::Signal& signal,
                               const std::string& reasoning) = 0;
    virtual bool stop_trailed(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                              double current_price) = 0;
    virtual bool trade_closed(const trading::Trade& trade) = 0;
};

// STRONG / MODERATE / WEAK from ADX, momentum and volume ratio
const char* signal_strength(const indicators::IndicatorSnapshot& ind);

// "EURUSD=X" -> "EUR/USD"; other symbols unchanged
std::string readable_symbol(const std::string& symbol);

// At most 200 chars, no HTML metacharacters
std::string sanitize_reasoning(const std::string& reasoning);

// Drop <tags> for the plain-text fallback
std::string strip_html(const std::string& html);

std::string format_signal_message(const strategy::TradeParams& params, const strategy::Signal& signal,
                                  const std::string& reasoning);
std::string format_stop_trailed_message(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                                        double current_price);
std::string format_trade_closed_message(const trading::Trade& trade);

/**
 * Writes every event to the log only
 */
class LogNotifier : public INotifier {
public:
    bool signal_raised(const strategy::TradeParams& params, const strategy::Signal& signal,
                       const std::string& reasoning) override;
    bool stop_trailed(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                      double current_price) override;
    bool trade_closed(const trading::Trade& trade) override;
};

/**
 * Telegram Bot API sendMessage, HTML parse mode
 *
 * If Telegram rejects the HTML, the message is resent once as plain text.
 */
class TelegramNotifier : public INotifier {
public:
    static constexpr const char* API_URL = "https://api.telegram.org";

    TelegramNotifier(std::string bot_token, std::string chat_id, std::string api_url = API_URL);

    bool signal_raised(const strategy::TradeParams& params, const strategy::Signal& signal,
                       const std::string& reasoning) override;
    bool stop_trailed(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                      double current_price) override;
    bool trade_closed(const trading::Trade& trade) override;

    bool send(const std::string& html);

private:
    std::string bot_token_;
    std::string chat_id_;
    std::string api_url_;
    HttpClient http_;

    bool post_message(const std::string& text, bool html);
};

/**
 * TelegramNotifier when both credentials are set, LogNotifier otherwise
 */
std::unique_ptr<INotifier> make_notifier_from_env();

} // namespace external
} // namespace fxsig
