#pragma once

#include "../strategy/signal.hpp"
#include "../strategy/trade_params.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>

namespace fxsig {
namespace external {

/**
 * Result of an advisory review
 *
 * approved is the only gate. reasoning is opaque audit text passed on to
 * notifications.
 */
struct AdvisoryDecision {
    bool approved = false;
    std::string reasoning;
};

class IAdvisor {
public:
    virtual ~IAdvisor() = default;

    virtual AdvisoryDecision review(const std::string& symbol, const strategy::Signal& signal,
                                    const strategy::TradeParams& params) = 0;
};

/**
 * Used when no advisory key is configured
 */
class AutoApproveAdvisor : public IAdvisor {
public:
    AdvisoryDecision review(const std::string&, const strategy::Signal&, const strategy::TradeParams&) override {
        return {true, "AI validation skipped (no key)"};
    }
};

/**
 * ClaudeAdvisor - asks the Anthropic Messages API to approve a setup
 *
 * The model is told to answer with {"approved": bool, "reasoning": str}.
 * Transport errors, non-200 replies and unparseable answers all reject
 * the signal with reasoning "AI Error: ...".
 */
class ClaudeAdvisor : public IAdvisor {
public:
    static constexpr const char* API_URL = "https://api.anthropic.com/v1/messages";
    static constexpr const char* DEFAULT_MODEL = "claude-sonnet-4-20250514";
    static constexpr const char* API_VERSION = "2023-06-01";

    explicit ClaudeAdvisor(std::string api_key, std::string model = DEFAULT_MODEL, std::string api_url = API_URL);

    AdvisoryDecision review(const std::string& symbol, const strategy::Signal& signal,
                            const strategy::TradeParams& params) override;

    const std::string& model() const { return model_; }

    static std::string build_prompt(const std::string& symbol, const strategy::Signal& signal,
                                    const strategy::TradeParams& params);

    std::string build_request_json(const std::string& prompt) const;

    /**
     * Extract the decision from a Messages API response body
     *
     * @throws std::runtime_error if there is no text block or no decision object
     */
    static AdvisoryDecision parse_response(const std::string& body);

private:
    std::string api_key_;
    std::string model_;
    std::string api_url_;
    HttpClient http_;
};

/**
 * ClaudeAdvisor if ANTHROPIC_API_KEY is set, AutoApproveAdvisor otherwise
 */
std::unique_ptr<IAdvisor> make_advisor_from_env();

} // namespace external
} // namespace fxsig
