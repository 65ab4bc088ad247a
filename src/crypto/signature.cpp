// AEGIS - Update Signature Verification Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/crypto/signature.h"
#include "aegis/core/hex.h"
#include "aegis/util/logging.h"

#include <memory>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace aegis {
namespace crypto {

namespace {

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Decode hex of an exact size; nullopt on malformed input
std::optional<Bytes> DecodeFixed(const std::string& hex, size_t size) {
    if (hex.length() != size * 2) {
        return std::nullopt;
    }
    try {
        return HexToBytes(hex);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

PKeyPtr LoadPublicKey(const std::string& publicKey) {
    auto raw = DecodeFixed(publicKey, ed25519::PUBLIC_KEY_SIZE);
    if (!raw) {
        return nullptr;
    }
    return PKeyPtr(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               raw->data(), raw->size()));
}

PKeyPtr LoadPrivateKey(const std::string& privateKey) {
    auto raw = DecodeFixed(privateKey, ed25519::PRIVATE_KEY_SIZE);
    if (!raw) {
        return nullptr;
    }
    return PKeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                raw->data(), raw->size()));
}

std::optional<std::string> ExportPublicKey(EVP_PKEY* key) {
    Bytes raw(ed25519::PUBLIC_KEY_SIZE);
    size_t len = raw.size();
    if (EVP_PKEY_get_raw_public_key(key, raw.data(), &len) != 1 ||
        len != ed25519::PUBLIC_KEY_SIZE) {
        return std::nullopt;
    }
    return BytesToHex(raw);
}

void LogOpenSSLError(const char* operation) {
    unsigned long err = ERR_get_error();
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    LOG_ERROR(util::LogCategory::CRYPTO) << operation << " failed: " << buf;
}

} // namespace

// ============================================================================
// Ed25519Verifier
// ============================================================================

bool Ed25519Verifier::Verify(const std::string& data,
                             const std::string& signature,
                             const std::string& publicKey) const {
    auto sig = DecodeFixed(signature, ed25519::SIGNATURE_SIZE);
    if (!sig) {
        LOG_DEBUG(util::LogCategory::CRYPTO) << "Malformed signature encoding";
        return false;
    }

    PKeyPtr key = LoadPublicKey(publicKey);
    if (!key) {
        LOG_DEBUG(util::LogCategory::CRYPTO) << "Malformed public key";
        return false;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        LogOpenSSLError("EVP_DigestVerifyInit");
        return false;
    }

    int rc = EVP_DigestVerify(ctx.get(), sig->data(), sig->size(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              data.size());
    if (rc != 1) {
        // A bad signature leaves an error on the queue; drop it
        ERR_clear_error();
        return false;
    }
    return true;
}

// ============================================================================
// Key Generation and Signing
// ============================================================================

std::optional<KeyPair> GenerateEd25519KeyPair() {
    PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        LogOpenSSLError("EVP_PKEY_keygen_init");
        return std::nullopt;
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        LogOpenSSLError("EVP_PKEY_keygen");
        return std::nullopt;
    }
    PKeyPtr key(raw);

    Bytes priv(ed25519::PRIVATE_KEY_SIZE);
    size_t privLen = priv.size();
    if (EVP_PKEY_get_raw_private_key(key.get(), priv.data(), &privLen) != 1 ||
        privLen != ed25519::PRIVATE_KEY_SIZE) {
        LogOpenSSLError("EVP_PKEY_get_raw_private_key");
        return std::nullopt;
    }

    auto pub = ExportPublicKey(key.get());
    if (!pub) {
        LogOpenSSLError("EVP_PKEY_get_raw_public_key");
        return std::nullopt;
    }

    KeyPair pair;
    pair.publicKey = *pub;
    pair.privateKey = BytesToHex(priv);
    return pair;
}

std::optional<std::string> DeriveEd25519PublicKey(const std::string& privateKey) {
    PKeyPtr key = LoadPrivateKey(privateKey);
    if (!key) {
        return std::nullopt;
    }
    return ExportPublicKey(key.get());
}

std::optional<std::string> SignEd25519(const std::string& data,
                                       const std::string& privateKey) {
    PKeyPtr key = LoadPrivateKey(privateKey);
    if (!key) {
        LOG_WARN(util::LogCategory::CRYPTO) << "Cannot sign: malformed private key";
        return std::nullopt;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        LogOpenSSLError("EVP_DigestSignInit");
        return std::nullopt;
    }

    Bytes sig(ed25519::SIGNATURE_SIZE);
    size_t sigLen = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sigLen,
                       reinterpret_cast<const unsigned char*>(data.data()),
                       data.size()) != 1) {
        LogOpenSSLError("EVP_DigestSign");
        return std::nullopt;
    }
    sig.resize(sigLen);
    return BytesToHex(sig);
}

bool IsValidEd25519PublicKey(const std::string& publicKey) {
    return LoadPublicKey(publicKey) != nullptr;
}

} // namespace crypto
} // namespace aegis
