#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

#include "config/gateway_config.hpp"
#include "util/clock.hpp"
#include "venues/exchange_connector.hpp"

enum class PreflightState { NotStarted, NetworkChecked, AuthChecked, Passed, Failed };

enum class PreflightDiagnosis { None, Authentication, IpNotWhitelisted, Network, Unknown };

const char* to_cstr(PreflightState s);
const char* to_cstr(PreflightDiagnosis d);

struct PreflightResult {
    PreflightState state{PreflightState::NotStarted};
    PreflightDiagnosis diagnosis{PreflightDiagnosis::None};
    bool network_ok{false};
    bool api_key_ok{false};
    bool ip_allowed{false};
    bool auth_skipped{false};       // no credentials configured
    std::optional<std::int64_t> server_time;
    std::optional<std::string> offending_ip;
    std::string error;
    std::exception_ptr cause;

    bool passed() const { return state == PreflightState::Passed; }
};

// Pulls "1.2.3.4" out of venue text like "... IP 1.2.3.4 not in whitelist".
std::optional<std::string> extract_offending_ip(const std::string& message);

PreflightDiagnosis diagnose(const std::exception_ptr& cause);

// One-shot reachability and credential check run by connect(). Step one hits
// a public endpoint, step two (credentials only) an authenticated one.
class PreflightVerifier {
public:
    PreflightVerifier(IExchangeConnector& connector, const GatewayConfig& cfg,
        IClock& clock = SystemClock::instance());

    // Production: a failure is logged and thrown as NormalizedError.
    // Sandbox: the failure is logged as a warning and returned.
    PreflightResult run();

    PreflightState state() const { return state_; }

private:
    void report(const PreflightResult& result) const;

    IExchangeConnector& connector_;
    const GatewayConfig& cfg_;
    IClock& clock_;
    PreflightState state_{PreflightState::NotStarted};
};
