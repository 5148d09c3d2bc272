#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <functional>
#include <vector>
#include <openssl/evp.h>
#include "constants.h"

namespace pyexec {

// Shared handle to an OpenSSL public key
using PublicKey = std::shared_ptr<EVP_PKEY>;

PublicKey make_public_key(EVP_PKEY* pkey);

// Source of keys trusted to sign bearer tokens
class KeySource {
public:
    virtual ~KeySource() = default;

    // Key for the token's kid, or nullptr when none is trusted
    virtual PublicKey find_key(const std::string& kid) = 0;

    virtual std::string describe() const = 0;
};

// A single statically configured public key; kid is ignored
class StaticKeySource : public KeySource {
public:
    static std::unique_ptr<StaticKeySource> from_pem_file(const std::string& path);
    static std::unique_ptr<StaticKeySource> from_pem(const std::string& pem);

    PublicKey find_key(const std::string& kid) override;
    std::string describe() const override;

private:
    StaticKeySource(PublicKey key, std::string origin);

    PublicKey key_;
    std::string origin_;
};

// Keys published as a JWKS document by the identity provider. The endpoint
// may be the JWKS itself or an OpenID discovery document naming jwks_uri.
class JwksKeySource : public KeySource {
public:
    using Fetcher = std::function<std::string(const std::string& url)>;

    explicit JwksKeySource(std::string endpoint, Fetcher fetcher = nullptr,
                           std::chrono::seconds refresh_interval =
                               std::chrono::seconds(JWKS_REFRESH_SECONDS));

    PublicKey find_key(const std::string& kid) override;
    std::string describe() const override;

    // Parse RSA signing keys from a JWKS document, keyed by kid
    static std::map<std::string, PublicKey> parse_jwks(const std::string& json);

    // Build an RSA public key from big-endian modulus and exponent
    static PublicKey rsa_key_from_components(const std::vector<unsigned char>& n,
                                             const std::vector<unsigned char>& e);

    size_t fetch_count() const;

private:
    PublicKey lookup_locked(const std::string& kid) const;

    // Network fetch, run without holding mutex_; nullopt on failure
    std::optional<std::map<std::string, PublicKey>> fetch_keys() const;
    std::string resolve_jwks_uri() const;

    std::string endpoint_;
    Fetcher fetcher_;
    std::chrono::seconds refresh_interval_;
    mutable std::mutex mutex_;
    std::condition_variable refreshed_;
    bool refreshing_ = false;
    std::map<std::string, PublicKey> keys_;
    std::chrono::steady_clock::time_point last_fetch_;
    bool fetched_ = false;
    size_t fetch_count_ = 0;
};

} // namespace pyexec
