#include "token_validator.h"
#include "encoding.h"
#include <json/json.h>
#include <openssl/evp.h>
#include <sstream>
#include <vector>
#include <cctype>
#include <cmath>
#include <optional>

namespace pyexec {

namespace {

const EVP_MD* digest_for(const std::string& algorithm) {
    if (algorithm == "RS256") return EVP_sha256();
    if (algorithm == "RS384") return EVP_sha384();
    if (algorithm == "RS512") return EVP_sha512();
    return nullptr;
}

bool parse_json_object(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    return Json::parseFromStream(builder, stream, &out, &errors) && out.isObject();
}

std::string string_member(const Json::Value& object, const char* name) {
    const Json::Value& value = object[name];
    return value.isString() ? value.asString() : "";
}

void add_scopes(const Json::Value& claim, std::set<std::string>& scopes) {
    if (claim.isString()) {
        std::istringstream words(claim.asString());
        std::string scope;
        while (words >> scope) {
            scopes.insert(scope);
        }
    } else if (claim.isArray()) {
        for (const auto& item : claim) {
            if (item.isString()) {
                scopes.insert(item.asString());
            }
        }
    }
}

// 9999-12-31T23:59:59Z; keeps date arithmetic far from int64 limits
constexpr long long MAX_NUMERIC_DATE = 253402300799LL;

// NumericDate claim as whole seconds; nullopt when absent, non-numeric or
// out of range
std::optional<long long> numeric_date(const Json::Value& value) {
    long long seconds;
    if (value.isInt64()) {
        seconds = value.asInt64();
    } else if (value.isDouble() && std::isfinite(value.asDouble()) &&
               std::fabs(value.asDouble()) <= static_cast<double>(MAX_NUMERIC_DATE)) {
        seconds = static_cast<long long>(std::floor(value.asDouble()));
    } else {
        return std::nullopt;
    }
    if (seconds < -MAX_NUMERIC_DATE || seconds > MAX_NUMERIC_DATE) {
        return std::nullopt;
    }
    return seconds;
}

} // namespace

const char* to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::NONE: return "none";
        case DenyReason::MISSING_TOKEN: return "missing_token";
        case DenyReason::MALFORMED: return "malformed";
        case DenyReason::UNSUPPORTED_ALGORITHM: return "unsupported_algorithm";
        case DenyReason::UNKNOWN_KEY: return "unknown_key";
        case DenyReason::BAD_SIGNATURE: return "bad_signature";
        case DenyReason::WRONG_ISSUER: return "wrong_issuer";
        case DenyReason::WRONG_AUDIENCE: return "wrong_audience";
        case DenyReason::EXPIRED: return "expired";
        case DenyReason::NOT_YET_VALID: return "not_yet_valid";
        case DenyReason::MISSING_SCOPE: return "missing_scope";
    }
    return "malformed";
}

TokenValidator::TokenValidator(ValidatorConfig config, std::shared_ptr<KeySource> keys,
                               Clock clock)
    : config_(std::move(config)), keys_(std::move(keys)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool TokenValidator::is_supported_algorithm(const std::string& algorithm) {
    return digest_for(algorithm) != nullptr;
}

std::string TokenValidator::extract_bearer(const std::string& header) {
    static const std::string prefix = "bearer ";
    if (header.size() <= prefix.size()) {
        return "";
    }
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != prefix[i]) {
            return "";
        }
    }
    std::string token = header.substr(prefix.size());
    size_t start = token.find_first_not_of(' ');
    size_t end = token.find_last_not_of(" \r\n");
    if (start == std::string::npos) {
        return "";
    }
    return token.substr(start, end - start + 1);
}

AuthDecision TokenValidator::validate(const std::string& token,
                                      const std::string& required_scope) const {
    if (token.empty()) {
        return AuthDecision::deny(DenyReason::MISSING_TOKEN, "No bearer token supplied");
    }

    // header.payload.signature
    size_t first = token.find('.');
    size_t second = (first == std::string::npos) ? first : token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return AuthDecision::deny(DenyReason::MALFORMED, "Token is not a compact JWS");
    }

    std::string header_b64 = token.substr(0, first);
    std::string payload_b64 = token.substr(first + 1, second - first - 1);
    std::string signature_b64 = token.substr(second + 1);

    std::string header_text, payload_text, signature;
    Json::Value header, claims;
    if (!Encoding::base64url_decode(header_b64, header_text) ||
        !Encoding::base64url_decode(payload_b64, payload_text) ||
        !Encoding::base64url_decode(signature_b64, signature) ||
        !parse_json_object(header_text, header) ||
        !parse_json_object(payload_text, claims)) {
        return AuthDecision::deny(DenyReason::MALFORMED, "Token segments are not valid base64url JSON");
    }

    // Only the configured algorithm is acceptable, never "none" or HMAC
    std::string alg = string_member(header, "alg");
    if (alg != config_.algorithm || !is_supported_algorithm(alg)) {
        return AuthDecision::deny(DenyReason::UNSUPPORTED_ALGORITHM,
                                  "Token algorithm '" + alg + "' is not accepted");
    }

    std::string kid = string_member(header, "kid");
    PublicKey key = keys_ ? keys_->find_key(kid) : nullptr;
    if (!key) {
        return AuthDecision::deny(DenyReason::UNKNOWN_KEY,
                                  "No trusted key for kid '" + kid + "'");
    }

    if (signature.empty() ||
        !verify_signature(header_b64 + "." + payload_b64, signature, key.get())) {
        return AuthDecision::deny(DenyReason::BAD_SIGNATURE, "Token signature does not verify");
    }

    if (config_.issuer) {
        if (!claims["iss"].isString() || claims["iss"].asString() != *config_.issuer) {
            return AuthDecision::deny(DenyReason::WRONG_ISSUER, "Token issuer is not trusted");
        }
    }

    const Json::Value& aud = claims["aud"];
    bool audience_ok = false;
    if (aud.isString()) {
        audience_ok = aud.asString() == config_.audience;
    } else if (aud.isArray()) {
        for (const auto& item : aud) {
            if (item.isString() && item.asString() == config_.audience) {
                audience_ok = true;
                break;
            }
        }
    }
    if (!audience_ok) {
        return AuthDecision::deny(DenyReason::WRONG_AUDIENCE,
                                  "Token audience does not include '" + config_.audience + "'");
    }

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        clock_().time_since_epoch()).count();

    std::optional<long long> exp = numeric_date(claims["exp"]);
    if (!exp) {
        return AuthDecision::deny(DenyReason::MALFORMED, "Token has no usable exp claim");
    }
    if (now > *exp + config_.leeway_seconds) {
        return AuthDecision::deny(DenyReason::EXPIRED, "Token has expired");
    }
    if (claims.isMember("nbf")) {
        std::optional<long long> nbf = numeric_date(claims["nbf"]);
        if (!nbf) {
            return AuthDecision::deny(DenyReason::MALFORMED, "Token has an unusable nbf claim");
        }
        if (now + config_.leeway_seconds < *nbf) {
            return AuthDecision::deny(DenyReason::NOT_YET_VALID, "Token is not valid yet");
        }
    }

    std::set<std::string> scopes;
    add_scopes(claims["scope"], scopes);
    add_scopes(claims["scp"], scopes);
    add_scopes(claims["scopes"], scopes);

    if (!required_scope.empty() && scopes.count(required_scope) == 0) {
        AuthDecision decision = AuthDecision::deny(
            DenyReason::MISSING_SCOPE, "Token lacks the '" + required_scope + "' scope");
        decision.scopes = std::move(scopes);
        return decision;
    }

    AuthDecision decision;
    decision.allowed = true;
    decision.subject = string_member(claims, "sub");
    decision.scopes = std::move(scopes);
    return decision;
}

bool TokenValidator::verify_signature(const std::string& signing_input,
                                      const std::string& signature,
                                      EVP_PKEY* key) const {
    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    if (!md_ctx) {
        return false;
    }

    if (EVP_DigestVerifyInit(md_ctx, nullptr, digest_for(config_.algorithm), nullptr, key) <= 0) {
        EVP_MD_CTX_free(md_ctx);
        return false;
    }

    int result = EVP_DigestVerify(
        md_ctx,
        reinterpret_cast<const unsigned char*>(signature.data()),
        signature.size(),
        reinterpret_cast<const unsigned char*>(signing_input.data()),
        signing_input.size()
    );

    EVP_MD_CTX_free(md_ctx);
    return result == 1;
}

} // namespace pyexec
