#include "../../include/external/notifier.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/util/time_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fxsig::external {

using json = nlohmann::json;

const char* signal_strength(const indicators::IndicatorSnapshot& ind) {
    double adx = ind.adx.value_or(0.0);
    double momentum = ind.momentum_score.value_or(0.0);
    double volume_ratio = ind.volume_ratio.value_or(1.0);

    if (adx > 30 && std::abs(momentum) > 40 && volume_ratio > 1.3)
        return "STRONG";
    if (adx > 25 && std::abs(momentum) > 25)
        return "MODERATE";
    return "WEAK";
}

std::string readable_symbol(const std::string& symbol) {
    if (symbol.size() == 8 && symbol.compare(6, 2, "=X") == 0)
        return symbol.substr(0, 3) + "/" + symbol.substr(3, 3);
    return symbol;
}

std::string sanitize_reasoning(const std::string& reasoning) {
    // Cut at 200 bytes, backing off so a multi-byte UTF-8 character stays whole
    size_t cut = std::min<size_t>(reasoning.size(), 200);
    while (cut > 0 && cut < reasoning.size() && (static_cast<unsigned char>(reasoning[cut]) & 0xC0) == 0x80)
        --cut;

    std::string out;
    for (char c : reasoning.substr(0, cut)) {
        if (c == '<' || c == '>')
            continue;
        if (c == '&')
            out += "and";
        else
            out += c;
    }
    return out;
}

std::string strip_html(const std::string& html) {
    std::string out;
    bool in_tag = false;
    for (char c : html) {
        if (c == '<')
            in_tag = true;
        else if (c == '>')
            in_tag = false;
        else if (!in_tag)
            out += c;
    }
    return out;
}

std::string format_signal_message(const strategy::TradeParams& params, const strategy::Signal& signal,
                                  const std::string& reasoning) {
    double pip_factor = market::pip_factor_for(params.symbol, params.asset_class);
    double entry = (params.entry_min + params.entry_max) / 2;
    const char* side = params.direction == Direction::Long ? "BUY" : "SELL";

    std::ostringstream ss;
    ss << std::fixed;
    ss << "<b>" << side << " " << readable_symbol(params.symbol) << "</b>\n\n";
    ss << std::setprecision(5);
    ss << "Entry: <code>" << entry << "</code>\n";
    ss << "SL: <code>" << params.stop_loss << "</code> - " << std::setprecision(0)
       << std::abs(entry - params.stop_loss) * pip_factor << " pips\n";
    ss << std::setprecision(5);
    ss << "TP: <code>" << params.take_profit << "</code> - " << std::setprecision(0)
       << std::abs(entry - params.take_profit) * pip_factor << " pips\n";
    ss << std::setprecision(2);
    ss << "Lot: <code>" << params.position_size << "</code>\n\n";
    ss << std::setprecision(0);
    ss << "Risk: $" << params.risk_amount << " | Reward: $" << params.reward_estimate << "\n";
    ss << "Strength: " << signal_strength(params.indicators) << " | Score: " << std::setprecision(1)
       << signal.score() << "\n";
    ss << std::setprecision(0);
    ss << "ADX: " << params.indicators.adx.value_or(0.0) << " | RSI: " << params.indicators.rsi.value_or(0.0)
       << "\n";
    ss << "Reasons: " << signal.reasons_text(params.direction) << "\n\n";
    ss << "<b>AI:</b> " << sanitize_reasoning(reasoning);
    return ss.str();
}

std::string format_stop_trailed_message(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                                        double current_price) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(5);
    ss << "<b>STOP MOVED " << readable_symbol(trade.symbol) << "</b> ("
       << (trade.is_long() ? "BUY" : "SELL") << ")\n\n";
    ss << "Entry: <code>" << trade.entry_price << "</code>\n";
    ss << "Old SL: <code>" << adjustment.old_stop << "</code>\n";
    ss << "New SL: <code>" << adjustment.new_stop << "</code>\n";
    ss << "Price: <code>" << current_price << "</code>\n\n";
    ss << adjustment.reason;
    return ss.str();
}

std::string format_trade_closed_message(const trading::Trade& trade) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(5);
    ss << "<b>TRADE CLOSED " << readable_symbol(trade.symbol) << "</b> - "
       << trading::trade_state_to_string(trade.state) << "\n\n";
    ss << "Direction: " << (trade.is_long() ? "BUY" : "SELL") << "\n";
    ss << "Entry: <code>" << trade.entry_price << "</code>\n";
    ss << "Exit: <code>" << trade.exit_price << "</code>\n";
    ss << std::showpos << std::setprecision(2) << "P/L: $" << trade.pnl << std::noshowpos << "\n";
    ss << "Reason: " << trading::exit_reason_to_string(trade.exit_reason) << "\n";
    ss << "Trailing stop used: " << (trade.stop_moved_to_breakeven ? "YES" : "NO");
    return ss.str();
}

// =============================================================================
// LogNotifier
// =============================================================================

bool LogNotifier::signal_raised(const strategy::TradeParams& params, const strategy::Signal& signal,
                                const std::string& reasoning) {
    LOG_INFO(External, strip_html(format_signal_message(params, signal, reasoning)));
    return true;
}

bool LogNotifier::stop_trailed(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                               double current_price) {
    LOG_INFO(External, strip_html(format_stop_trailed_message(trade, adjustment, current_price)));
    return true;
}

bool LogNotifier::trade_closed(const trading::Trade& trade) {
    LOG_INFO(External, strip_html(format_trade_closed_message(trade)));
    return true;
}

// =============================================================================
// TelegramNotifier
// =============================================================================

TelegramNotifier::TelegramNotifier(std::string bot_token, std::string chat_id, std::string api_url)
    : bot_token_(std::move(bot_token)), chat_id_(std::move(chat_id)), api_url_(std::move(api_url)), http_(30) {}

bool TelegramNotifier::signal_raised(const strategy::TradeParams& params, const strategy::Signal& signal,
                                     const std::string& reasoning) {
    return send(format_signal_message(params, signal, reasoning));
}

bool TelegramNotifier::stop_trailed(const trading::Trade& trade, const trading::StopAdjustment& adjustment,
                                    double current_price) {
    return send(format_stop_trailed_message(trade, adjustment, current_price));
}

bool TelegramNotifier::trade_closed(const trading::Trade& trade) {
    return send(format_trade_closed_message(trade));
}

bool TelegramNotifier::send(const std::string& html) {
    if (post_message(html, true))
        return true;

    LOG_WARN(External, "Telegram rejected HTML message, retrying as plain text");
    return post_message(strip_html(html), false);
}

bool TelegramNotifier::post_message(const std::string& text, bool html) {
    json payload = {{"chat_id", chat_id_}, {"text", text}};
    if (html)
        payload["parse_mode"] = "HTML";

    std::string url = api_url_ + "/bot" + bot_token_ + "/sendMessage";

    try {
        HttpResponse resp = http_.post(url, payload.dump(), {"Content-Type: application/json"});
        if (resp.status != 200) {
            LOGF_ERROR(External, "Telegram HTTP %ld", resp.status);
            return false;
        }
        json body = json::parse(resp.body);
        return body.value("ok", false);
    } catch (const json::exception& e) {
        LOGF_ERROR(External, "Telegram response parse error: %s", e.what());
    } catch (const std::exception& e) {
        LOGF_ERROR(External, "Telegram send failed: %s", e.what());
    }
    return false;
}

std::unique_ptr<INotifier> make_notifier_from_env() {
    const char* token = std::getenv("TELEGRAM_BOT_TOKEN");
    const char* chat = std::getenv("TELEGRAM_CHAT_ID");
    if (token && chat && *token && *chat) {
        return std::make_unique<TelegramNotifier>(token, chat);
    }

    LOG_WARN(External, "Telegram credentials missing, notifications go to the log only");
    return std::make_unique<LogNotifier>();
}

} // namespace fxsig::external
