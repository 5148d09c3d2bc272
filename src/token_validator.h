#pragma once

#include "key_source.h"
#include <string>
#include <set>
#include <memory>
#include <optional>
#include <chrono>
#include <functional>

namespace pyexec {

enum class DenyReason {
    NONE,
    MISSING_TOKEN,
    MALFORMED,
    UNSUPPORTED_ALGORITHM,
    UNKNOWN_KEY,
    BAD_SIGNATURE,
    WRONG_ISSUER,
    WRONG_AUDIENCE,
    EXPIRED,
    NOT_YET_VALID,
    MISSING_SCOPE
};

const char* to_string(DenyReason reason);

// Outcome of a token check. Rejection is a value, not an exception.
struct AuthDecision {
    bool allowed = false;
    DenyReason reason = DenyReason::NONE;
    std::string message;
    std::string subject;
    std::set<std::string> scopes;

    static AuthDecision deny(DenyReason reason, std::string message) {
        AuthDecision decision;
        decision.reason = reason;
        decision.message = std::move(message);
        return decision;
    }
};

struct ValidatorConfig {
    std::string audience;
    std::optional<std::string> issuer;          // Unchecked when unset
    std::string algorithm = "RS256";
    int leeway_seconds = 60;
};

// Verifies compact JWS bearer tokens against a trusted key source. The same
// logic serves production (JWKS) and development (static dev key) modes.
class TokenValidator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    TokenValidator(ValidatorConfig config, std::shared_ptr<KeySource> keys,
                   Clock clock = nullptr);

    AuthDecision validate(const std::string& token, const std::string& required_scope) const;

    // "Bearer <token>" -> token, anything else -> empty
    static std::string extract_bearer(const std::string& authorization_header);

    static bool is_supported_algorithm(const std::string& algorithm);

    const ValidatorConfig& config() const { return config_; }

private:
    bool verify_signature(const std::string& signing_input,
                          const std::string& signature,
                          EVP_PKEY* key) const;

    ValidatorConfig config_;
    std::shared_ptr<KeySource> keys_;
    Clock clock_;
};

} // namespace pyexec
