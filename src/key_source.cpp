#include "key_source.h"
#include "constants.h"
#include "encoding.h"
#include "https_client.h"
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>
#include <openssl/bn.h>
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <iostream>

namespace pyexec {

PublicKey make_public_key(EVP_PKEY* pkey) {
    return PublicKey(pkey, EVP_PKEY_free);
}

// ============================================================================
// StaticKeySource
// ============================================================================

StaticKeySource::StaticKeySource(PublicKey key, std::string origin)
    : key_(std::move(key)), origin_(std::move(origin)) {}

std::unique_ptr<StaticKeySource> StaticKeySource::from_pem_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return nullptr;
    }
    std::stringstream pem;
    pem << file.rdbuf();

    auto source = from_pem(pem.str());
    if (source) {
        source->origin_ = path;
    }
    return source;
}

std::unique_ptr<StaticKeySource> StaticKeySource::from_pem(const std::string& pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return nullptr;
    }

    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        return nullptr;
    }

    // Only RSA keys can verify the RS* algorithms
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
        EVP_PKEY_free(pkey);
        return nullptr;
    }

    return std::unique_ptr<StaticKeySource>(
        new StaticKeySource(make_public_key(pkey), "inline PEM"));
}

PublicKey StaticKeySource::find_key(const std::string& /*kid*/) {
    return key_;
}

std::string StaticKeySource::describe() const {
    return "static key (" + origin_ + ")";
}

// ============================================================================
// JwksKeySource
// ============================================================================

JwksKeySource::JwksKeySource(std::string endpoint, Fetcher fetcher,
                             std::chrono::seconds refresh_interval)
    : endpoint_(std::move(endpoint)), fetcher_(std::move(fetcher)),
      refresh_interval_(refresh_interval) {
    if (!fetcher_) {
        fetcher_ = [](const std::string& url) {
            HttpsClient client;
            HttpsResponse resp = client.get(url);
            if (resp.status_code != 200) {
                throw HttpsError(url + " returned HTTP " + std::to_string(resp.status_code));
            }
            return resp.body;
        };
    }
}

PublicKey JwksKeySource::lookup_locked(const std::string& kid) const {
    if (kid.empty()) {
        // Tokens without kid are accepted only against a single-key set
        return keys_.size() == 1 ? keys_.begin()->second : nullptr;
    }
    auto it = keys_.find(kid);
    return it != keys_.end() ? it->second : nullptr;
}

PublicKey JwksKeySource::find_key(const std::string& kid) {
    std::unique_lock<std::mutex> lock(mutex_);

    PublicKey key = lookup_locked(kid);
    if (key) {
        return key;
    }

    // One fetch at a time; its result may hold the key we are after
    if (refreshing_) {
        refreshed_.wait(lock, [this]() { return !refreshing_; });
        return lookup_locked(kid);
    }

    // Unknown kid: the provider may have rotated keys, refetch at most once
    // per refresh interval
    auto now = std::chrono::steady_clock::now();
    if (fetched_ && now - last_fetch_ < refresh_interval_) {
        return nullptr;
    }
    last_fetch_ = now;
    fetched_ = true;
    fetch_count_++;
    refreshing_ = true;

    // Lookups of cached keys proceed while the network call runs
    lock.unlock();
    auto keys = fetch_keys();
    lock.lock();

    if (keys) {
        keys_ = std::move(*keys);
    }
    refreshing_ = false;
    refreshed_.notify_all();
    return lookup_locked(kid);
}

std::string JwksKeySource::describe() const {
    return "JWKS (" + endpoint_ + ")";
}

size_t JwksKeySource::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_count_;
}

std::string JwksKeySource::resolve_jwks_uri() const {
    static const std::string discovery_suffix = "/.well-known/openid-configuration";
    if (endpoint_.size() < discovery_suffix.size() ||
        endpoint_.compare(endpoint_.size() - discovery_suffix.size(),
                          discovery_suffix.size(), discovery_suffix) != 0) {
        return endpoint_;
    }

    std::string document = fetcher_(endpoint_);
    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(document);
    if (!Json::parseFromStream(builder, stream, &json, &errors) ||
        !json.isObject() || !json["jwks_uri"].isString()) {
        throw std::runtime_error("discovery document has no jwks_uri");
    }
    return json["jwks_uri"].asString();
}

std::optional<std::map<std::string, PublicKey>> JwksKeySource::fetch_keys() const {
    try {
        std::string jwks_uri = resolve_jwks_uri();
        auto keys = parse_jwks(fetcher_(jwks_uri));
        if (keys.empty()) {
            std::cerr << "[Auth] No usable RSA keys at " << jwks_uri << std::endl;
            return std::nullopt;
        }
        std::cout << "[Auth] Loaded " << keys.size() << " signing keys from "
                  << jwks_uri << std::endl;
        return keys;
    } catch (const std::exception& e) {
        std::cerr << "[Auth] Key refresh failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::map<std::string, PublicKey> JwksKeySource::parse_jwks(const std::string& json_text) {
    std::map<std::string, PublicKey> keys;

    Json::Value json;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_text);
    if (!Json::parseFromStream(builder, stream, &json, &errors)) {
        throw std::runtime_error("invalid JWKS JSON: " + errors);
    }
    if (!json.isObject() || !json["keys"].isArray()) {
        throw std::runtime_error("JWKS document has no keys array");
    }

    for (const auto& jwk : json["keys"]) {
        if (!jwk.isObject() || jwk["kty"].asString() != "RSA") {
            continue;
        }
        if (jwk.isMember("use") && jwk["use"].asString() != "sig") {
            continue;
        }
        if (!jwk["n"].isString() || !jwk["e"].isString()) {
            continue;
        }

        std::vector<unsigned char> n, e;
        if (!Encoding::base64url_decode(jwk["n"].asString(), n) ||
            !Encoding::base64url_decode(jwk["e"].asString(), e)) {
            continue;
        }

        PublicKey key = rsa_key_from_components(n, e);
        if (key) {
            keys[jwk.get("kid", "").asString()] = key;
        }
    }

    return keys;
}

PublicKey JwksKeySource::rsa_key_from_components(const std::vector<unsigned char>& n,
                                                 const std::vector<unsigned char>& e) {
    if (n.empty() || e.empty()) {
        return nullptr;
    }

    BIGNUM* bn_n = BN_bin2bn(n.data(), static_cast<int>(n.size()), nullptr);
    BIGNUM* bn_e = BN_bin2bn(e.data(), static_cast<int>(e.size()), nullptr);
    OSSL_PARAM_BLD* bld = OSSL_PARAM_BLD_new();
    OSSL_PARAM* params = nullptr;
    EVP_PKEY_CTX* ctx = nullptr;
    EVP_PKEY* pkey = nullptr;

    if (bn_n && bn_e && bld &&
        OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_N, bn_n) &&
        OSSL_PARAM_BLD_push_BN(bld, OSSL_PKEY_PARAM_RSA_E, bn_e)) {
        params = OSSL_PARAM_BLD_to_param(bld);
    }

    if (params) {
        ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    }
    if (ctx && EVP_PKEY_fromdata_init(ctx) > 0) {
        if (EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) <= 0) {
            pkey = nullptr;
        }
    }

    EVP_PKEY_CTX_free(ctx);
    OSSL_PARAM_free(params);
    OSSL_PARAM_BLD_free(bld);
    BN_free(bn_n);
    BN_free(bn_e);

    return pkey ? make_public_key(pkey) : nullptr;
}

} // namespace pyexec
