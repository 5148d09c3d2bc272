#pragma once

#include "key_source.h"
#include "token_validator.h"
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <optional>

namespace pyexec {

// Claims written into a minted token
struct TokenClaims {
    std::string issuer;
    std::vector<std::string> audience;
    std::string subject;
    std::vector<std::string> scopes;
    std::chrono::system_clock::time_point issued_at;
    std::chrono::system_clock::time_point expires_at;
    std::optional<std::chrono::system_clock::time_point> not_before;
    std::string key_id;
    std::string algorithm = "RS256";
};

// Development-mode signing identity: a local RSA keypair that mints tokens
// the production validator accepts when configured with the public half.
class DevCredentials {
public:
    // Load private.pem/public.pem/token.txt from dir, creating whatever is
    // missing. Existing files are reused so repeated startups are stable; a
    // stored token the validator would now reject is minted again.
    static std::unique_ptr<DevCredentials> bootstrap(const std::string& dir,
                                                     const ValidatorConfig& validator);

    // Generate a new RSA keypair
    static std::unique_ptr<DevCredentials> generate(int bits = 2048);

    // Load identity from private key file (PEM format)
    static std::unique_ptr<DevCredentials> from_keyfile(const std::string& keyfile_path);

    // Sign claims into a compact JWS; empty on failure
    std::string mint_token(const TokenClaims& claims) const;

    // Sign already-serialized header and payload JSON; empty on failure
    std::string sign(const std::string& header_json, const std::string& payload_json,
                     const std::string& algorithm) const;

    // Claims of the long-lived development token, matching the validator's
    // audience, issuer (dev issuer when unset) and algorithm
    static TokenClaims default_claims(const ValidatorConfig& validator);

    std::string public_key_pem() const;
    std::unique_ptr<StaticKeySource> key_source() const;

    // Save private key to file (PEM format, mode 0600)
    bool save_private_key(const std::string& filepath) const;
    bool save_public_key(const std::string& filepath) const;

    // Token loaded or minted by bootstrap()
    const std::string& token() const { return token_; }
    const std::string& public_key_path() const { return public_key_path_; }
    const std::string& token_path() const { return token_path_; }

private:
    explicit DevCredentials(EVP_PKEY* pkey);

    std::shared_ptr<EVP_PKEY> key_;
    std::string token_;
    std::string public_key_path_;
    std::string token_path_;
};

} // namespace pyexec
