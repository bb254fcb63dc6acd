#include "preflight/preflight_verifier.hpp"

#include <regex>

#include <spdlog/spdlog.h>

#include "errors/error_taxonomy.hpp"

const char* to_cstr(PreflightState s) {
    switch (s) {
        case PreflightState::NotStarted: return "NOT_STARTED";
        case PreflightState::NetworkChecked: return "NETWORK_CHECKED";
        case PreflightState::AuthChecked: return "AUTH_CHECKED";
        case PreflightState::Passed: return "PASSED";
        case PreflightState::Failed: return "FAILED";
    }
    return "?";
}

const char* to_cstr(PreflightDiagnosis d) {
    switch (d) {
        case PreflightDiagnosis::None: return "none";
        case PreflightDiagnosis::Authentication: return "authentication";
        case PreflightDiagnosis::IpNotWhitelisted: return "ip_not_whitelisted";
        case PreflightDiagnosis::Network: return "network";
        case PreflightDiagnosis::Unknown: return "unknown";
    }
    return "?";
}

std::optional<std::string> extract_offending_ip(const std::string& message) {
    static const std::regex kIp(R"(IP[:\s]+(\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}))",
        std::regex::icase);
    std::smatch m;
    if (std::regex_search(message, m, kIp)) {
        return m[1].str();
    }
    return std::nullopt;
}

PreflightDiagnosis diagnose(const std::exception_ptr& cause) {
    switch (classify(cause)) {
        case ErrorKind::PermissionDenied:
            return PreflightDiagnosis::IpNotWhitelisted;
        case ErrorKind::AuthenticationError:
            return PreflightDiagnosis::Authentication;
        case ErrorKind::NetworkError:
        case ErrorKind::RequestTimeout:
        case ErrorKind::ExchangeNotAvailable:
        case ErrorKind::DDoSProtection:
        case ErrorKind::RateLimitExceeded:
            return PreflightDiagnosis::Network;
        default:
            return PreflightDiagnosis::Unknown;
    }
}

PreflightVerifier::PreflightVerifier(IExchangeConnector& connector, const GatewayConfig& cfg,
    IClock& clock)
    : connector_(connector), cfg_(cfg), clock_(clock) {}

PreflightResult PreflightVerifier::run() {
    const std::string& ex = cfg_.exchange;
    PreflightResult result;
    state_ = PreflightState::NotStarted;
    spdlog::info("[{}] running API preflight check", ex);

    try {
        if (connector_.supports(ConnectorOp::FetchTime)) {
            result.server_time = connector_.fetch_time();
        } else {
            result.server_time = clock_.now_ms();
        }
        result.network_ok = true;
        state_ = PreflightState::NetworkChecked;
        spdlog::info("[{}] network OK, server time {}", ex, *result.server_time);

        if (cfg_.has_credentials()) {
            connector_.fetch_balance();
            result.api_key_ok = true;
            result.ip_allowed = true;
            spdlog::info("[{}] API key valid, IP whitelisted", ex);
        } else {
            result.auth_skipped = true;
            spdlog::warn("[{}] no API key configured, skipping auth check", ex);
        }
        state_ = PreflightState::AuthChecked;
    } catch (...) {
        result.cause = std::current_exception();
    }

    if (!result.cause) {
        state_ = PreflightState::Passed;
        result.state = state_;
        spdlog::info("[{}] preflight check passed", ex);
        return result;
    }

    state_ = PreflightState::Failed;
    result.state = state_;
    result.error = error_message(result.cause);
    result.diagnosis = diagnose(result.cause);
    if (result.diagnosis == PreflightDiagnosis::IpNotWhitelisted ||
        result.diagnosis == PreflightDiagnosis::Authentication) {
        // The venue answered, so the network leg is fine.
        result.network_ok = true;
    }
    if (result.diagnosis == PreflightDiagnosis::IpNotWhitelisted) {
        result.offending_ip = extract_offending_ip(result.error);
    }
    report(result);

    if (cfg_.sandbox) {
        spdlog::warn("[{}] sandbox mode: preflight failed, continuing anyway", ex);
        return result;
    }
    throw normalize_error(result.cause, ex, "preflight");
}

void PreflightVerifier::report(const PreflightResult& r) const {
    const std::string& ex = cfg_.exchange;
    switch (r.diagnosis) {
        case PreflightDiagnosis::IpNotWhitelisted:
            spdlog::error("[{}] preflight failed: IP address not in whitelist: {}", ex, r.error);
            if (r.offending_ip) {
                spdlog::error("[{}]   current server IP: {}", ex, *r.offending_ip);
            }
            spdlog::error("[{}]   add this IP to the API key whitelist in the exchange's API "
                "management page, then restart", ex);
            break;
        case PreflightDiagnosis::Authentication:
            spdlog::error("[{}] preflight failed: invalid API key or insufficient permissions: {}",
                ex, r.error);
            spdlog::error("[{}]   check the key is valid and has trading permission", ex);
            break;
        case PreflightDiagnosis::Network:
            spdlog::error("[{}] preflight failed: network connection failed: {}", ex, r.error);
            spdlog::error("[{}]   check connectivity and proxy settings", ex);
            break;
        default:
            spdlog::error("[{}] preflight failed: unknown error: {}", ex, r.error);
            break;
    }
}
