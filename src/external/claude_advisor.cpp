#include "../../include/external/advisory.hpp"
#include "../../include/logging/async_logger.hpp"

#include <cstdlib>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace fxsig::external {

using json = nlohmann::json;

ClaudeAdvisor::ClaudeAdvisor(std::string api_key, std::string model, std::string api_url)
    : api_key_(std::move(api_key)), model_(std::move(model)), api_url_(std::move(api_url)), http_(30) {}

AdvisoryDecision ClaudeAdvisor::review(const std::string& symbol, const strategy::Signal& signal,
                                       const strategy::TradeParams& params) {
    std::string body = build_request_json(build_prompt(symbol, signal, params));

    std::vector<std::string> headers = {"Content-Type: application/json", std::string("anthropic-version: ") + API_VERSION,
                                        "x-api-key: " + api_key_};

    try {
        HttpResponse resp = http_.post(api_url_, body, headers);
        if (resp.status != 200) {
            LOGF_ERROR(External, "Advisory HTTP %ld for %s", resp.status, symbol.c_str());
            return {false, "AI Error: HTTP " + std::to_string(resp.status)};
        }
        return parse_response(resp.body);
    } catch (const std::exception& e) {
        LOGF_ERROR(External, "Advisory failed for %s: %s", symbol.c_str(), e.what());
        return {false, std::string("AI Error: ") + e.what()};
    }
}

std::string ClaudeAdvisor::build_prompt(const std::string& symbol, const strategy::Signal& signal,
                                        const strategy::TradeParams& params) {
    const auto& ind = params.indicators;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(5);

    ss << "You are a professional forex risk manager.\n";
    ss << "A technical signal fired for " << symbol << ".\n\n";
    ss << "Signal: " << (params.direction == Direction::Long ? "BUY" : "SELL") << "\n";
    ss << "Score: " << std::setprecision(1) << signal.score() << " (buy " << signal.buy_score << ", sell "
       << signal.sell_score << ")\n";
    ss << "Reasons: " << signal.reasons_text(params.direction) << "\n\n";

    ss << std::setprecision(5);
    ss << "Current price: " << params.entry_price << "\n";
    ss << "Entry zone: " << params.entry_min << " - " << params.entry_max << "\n";
    ss << "Stop loss: " << params.stop_loss << "\n";
    ss << "Take profit: " << params.take_profit << "\n";
    ss << "Position size: " << std::setprecision(2) << params.position_size << " lots\n\n";

    ss << "Indicators:\n";
    for (const auto& [name, value] : ind.named_values()) {
        ss << "  " << name << ": " << std::setprecision(5) << value << "\n";
    }

    ss << "\nConsider current news, scheduled economic events and market sentiment for " << symbol
       << " together with the technical levels.\n";
    ss << "Reply with only a JSON object:\n";
    ss << "{\"approved\": true/false, \"reasoning\": \"max 2 sentences\"}\n";
    return ss.str();
}

std::string ClaudeAdvisor::build_request_json(const std::string& prompt) const {
    json request = {{"model", model_},
                    {"max_tokens", 300},
                    {"messages", json::array({{{"role", "user"}, {"content", prompt}}})}};
    return request.dump();
}

AdvisoryDecision ClaudeAdvisor::parse_response(const std::string& body) {
    json reply = json::parse(body);

    std::string text;
    for (const auto& block : reply.at("content")) {
        if (block.value("type", "") == "text") {
            text += block.at("text").get<std::string>();
        }
    }
    if (text.empty()) {
        throw std::runtime_error("No text block in advisory reply");
    }

    // The model sometimes wraps the object in a markdown fence
    size_t json_start = text.find('{');
    size_t json_end = text.rfind('}');
    if (json_start == std::string::npos || json_end == std::string::npos || json_end < json_start) {
        throw std::runtime_error("No decision object in advisory reply");
    }

    json decision = json::parse(text.substr(json_start, json_end - json_start + 1));

    AdvisoryDecision out;
    out.approved = decision.value("approved", false);
    out.reasoning = decision.value("reasoning", "No reasoning provided.");
    return out;
}

std::unique_ptr<IAdvisor> make_advisor_from_env() {
    const char* key = std::getenv("ANTHROPIC_API_KEY");
    if (!key || !*key) {
        LOG_WARN(External, "No advisory API key, signals are approved without review");
        return std::make_unique<AutoApproveAdvisor>();
    }

    const char* model = std::getenv("FXSIGNAL_ADVISOR_MODEL");
    return std::make_unique<ClaudeAdvisor>(key, model && *model ? model : ClaudeAdvisor::DEFAULT_MODEL);
}

} // namespace fxsig::external
