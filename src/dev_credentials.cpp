#include "dev_credentials.h"
#include "constants.h"
#include "encoding.h"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/bio.h>
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

long long to_epoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::string compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

const EVP_MD* digest_for(const std::string& algorithm) {
    if (algorithm == "RS384") return EVP_sha384();
    if (algorithm == "RS512") return EVP_sha512();
    return EVP_sha256();
}

} // namespace

DevCredentials::DevCredentials(EVP_PKEY* pkey) : key_(pkey, EVP_PKEY_free) {}

std::unique_ptr<DevCredentials> DevCredentials::generate(int bits) {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!ctx) {
        return nullptr;
    }

    if (EVP_PKEY_keygen_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return nullptr;
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0) {
        EVP_PKEY_CTX_free(ctx);
        return nullptr;
    }

    EVP_PKEY_CTX_free(ctx);

    return std::unique_ptr<DevCredentials>(new DevCredentials(pkey));
}

std::unique_ptr<DevCredentials> DevCredentials::from_keyfile(const std::string& keyfile_path) {
    FILE* fp = fopen(keyfile_path.c_str(), "r");
    if (!fp) {
        return nullptr;
    }

    EVP_PKEY* pkey = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
    fclose(fp);

    if (!pkey) {
        return nullptr;
    }

    // Check if it's RSA
    if (EVP_PKEY_base_id(pkey) != EVP_PKEY_RSA) {
        EVP_PKEY_free(pkey);
        return nullptr;
    }

    return std::unique_ptr<DevCredentials>(new DevCredentials(pkey));
}

std::unique_ptr<DevCredentials> DevCredentials::bootstrap(const std::string& dir,
                                                          const ValidatorConfig& validator) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[Auth] Cannot create dev credential directory " << dir
                  << ": " << ec.message() << std::endl;
        return nullptr;
    }

    std::string private_path = dir + "/private.pem";
    std::string public_path = dir + "/public.pem";
    std::string token_path = dir + "/token.txt";

    std::unique_ptr<DevCredentials> creds;
    bool fresh_key = false;
    if (fs::exists(private_path)) {
        creds = from_keyfile(private_path);
        if (!creds) {
            std::cerr << "[Auth] Unreadable dev private key: " << private_path << std::endl;
            return nullptr;
        }
    } else {
        std::cout << "[Auth] Generating development keypair in " << dir << std::endl;
        creds = generate(DEV_RSA_BITS);
        if (!creds || !creds->save_private_key(private_path)) {
            std::cerr << "[Auth] Failed to create dev private key" << std::endl;
            return nullptr;
        }
        fresh_key = true;
    }

    if (fresh_key || !fs::exists(public_path)) {
        if (!creds->save_public_key(public_path)) {
            std::cerr << "[Auth] Failed to write dev public key" << std::endl;
            return nullptr;
        }
    }

    // A token signed by an older key would never validate
    if (!fresh_key && fs::exists(token_path)) {
        std::ifstream in(token_path);
        std::getline(in, creds->token_);
    }

    // Check the stored token the way requests will be checked
    if (!creds->token_.empty()) {
        ValidatorConfig check = validator;
        if (!check.issuer) {
            check.issuer = DEV_ISSUER;
        }
        std::shared_ptr<KeySource> keys = creds->key_source();
        AuthDecision decision = keys
            ? TokenValidator(check, keys).validate(creds->token_, EXECUTE_SCOPE)
            : AuthDecision::deny(DenyReason::UNKNOWN_KEY, "dev public key unavailable");
        if (!decision.allowed) {
            std::cout << "[Auth] Stored dev token no longer valid (" << to_string(decision.reason)
                      << "), minting a new one" << std::endl;
            creds->token_.clear();
        }
    }

    if (creds->token_.empty()) {
        creds->token_ = creds->mint_token(default_claims(validator));
        std::ofstream out(token_path, std::ios::trunc);
        out << creds->token_ << "\n";
        if (creds->token_.empty() || !out) {
            std::cerr << "[Auth] Failed to write dev token" << std::endl;
            return nullptr;
        }
        chmod(token_path.c_str(), 0600);
    }

    creds->public_key_path_ = public_path;
    creds->token_path_ = token_path;
    return creds;
}

TokenClaims DevCredentials::default_claims(const ValidatorConfig& validator) {
    TokenClaims claims;
    claims.issuer = validator.issuer.value_or(DEV_ISSUER);
    claims.audience = {validator.audience};
    claims.algorithm = validator.algorithm;
    claims.subject = "developer";
    claims.scopes = {EXECUTE_SCOPE};
    claims.issued_at = std::chrono::system_clock::now();
    claims.expires_at = claims.issued_at + std::chrono::seconds(DEV_TOKEN_LIFETIME_SECONDS);
    claims.key_id = DEV_KEY_ID;
    return claims;
}

std::string DevCredentials::mint_token(const TokenClaims& claims) const {
    Json::Value header;
    header["alg"] = claims.algorithm;
    header["typ"] = "JWT";
    if (!claims.key_id.empty()) {
        header["kid"] = claims.key_id;
    }

    Json::Value payload;
    payload["iss"] = claims.issuer;
    if (claims.audience.size() == 1) {
        payload["aud"] = claims.audience.front();
    } else {
        Json::Value aud(Json::arrayValue);
        for (const auto& a : claims.audience) {
            aud.append(a);
        }
        payload["aud"] = aud;
    }
    if (!claims.subject.empty()) {
        payload["sub"] = claims.subject;
    }
    std::string scope;
    for (const auto& s : claims.scopes) {
        if (!scope.empty()) scope += " ";
        scope += s;
    }
    payload["scope"] = scope;
    payload["iat"] = static_cast<Json::Int64>(to_epoch(claims.issued_at));
    payload["exp"] = static_cast<Json::Int64>(to_epoch(claims.expires_at));
    if (claims.not_before) {
        payload["nbf"] = static_cast<Json::Int64>(to_epoch(*claims.not_before));
    }

    return sign(compact_json(header), compact_json(payload), claims.algorithm);
}

std::string DevCredentials::sign(const std::string& header_json, const std::string& payload_json,
                                 const std::string& algorithm) const {
    std::string signing_input = Encoding::base64url_encode(header_json) + "." +
                                Encoding::base64url_encode(payload_json);

    // Create signing context
    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    if (!md_ctx) {
        return "";
    }

    if (EVP_DigestSignInit(md_ctx, nullptr, digest_for(algorithm), nullptr, key_.get()) <= 0) {
        EVP_MD_CTX_free(md_ctx);
        return "";
    }

    size_t sig_len = 0;
    if (EVP_DigestSign(md_ctx, nullptr, &sig_len,
                       reinterpret_cast<const unsigned char*>(signing_input.data()),
                       signing_input.size()) <= 0) {
        EVP_MD_CTX_free(md_ctx);
        return "";
    }

    std::vector<unsigned char> signature(sig_len);
    if (EVP_DigestSign(md_ctx, signature.data(), &sig_len,
                       reinterpret_cast<const unsigned char*>(signing_input.data()),
                       signing_input.size()) <= 0) {
        EVP_MD_CTX_free(md_ctx);
        return "";
    }

    EVP_MD_CTX_free(md_ctx);

    return signing_input + "." + Encoding::base64url_encode(signature.data(), sig_len);
}

std::string DevCredentials::public_key_pem() const {
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return "";
    }
    if (PEM_write_bio_PUBKEY(bio, key_.get()) <= 0) {
        BIO_free(bio);
        return "";
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, len);
    BIO_free(bio);
    return pem;
}

std::unique_ptr<StaticKeySource> DevCredentials::key_source() const {
    return StaticKeySource::from_pem(public_key_pem());
}

bool DevCredentials::save_private_key(const std::string& filepath) const {
    FILE* fp = fopen(filepath.c_str(), "w");
    if (!fp) {
        return false;
    }
    chmod(filepath.c_str(), 0600);

    int result = PEM_write_PrivateKey(fp, key_.get(), nullptr, nullptr, 0, nullptr, nullptr);

    fclose(fp);
    return result > 0;
}

bool DevCredentials::save_public_key(const std::string& filepath) const {
    std::string pem = public_key_pem();
    if (pem.empty()) {
        return false;
    }
    std::ofstream out(filepath, std::ios::trunc);
    out << pem;
    return static_cast<bool>(out);
}

} // namespace pyexec
