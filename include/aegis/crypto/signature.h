// AEGIS - Update Signature Verification
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Signature verification is the collaborator the update pipeline consults
// before any package code is trusted. The production scheme is Ed25519
// (RFC 8032) through OpenSSL's EVP interface. Keys and signatures are
// carried as lowercase hex of their raw encodings.

#ifndef AEGIS_CRYPTO_SIGNATURE_H
#define AEGIS_CRYPTO_SIGNATURE_H

#include <cstddef>
#include <optional>
#include <string>

namespace aegis {
namespace crypto {

// ============================================================================
// Ed25519 Constants
// ============================================================================

namespace ed25519 {
    /// Raw public key size
    constexpr size_t PUBLIC_KEY_SIZE = 32;

    /// Raw private key (seed) size
    constexpr size_t PRIVATE_KEY_SIZE = 32;

    /// Signature size
    constexpr size_t SIGNATURE_SIZE = 64;
}

// ============================================================================
// Signature Verifier
// ============================================================================

/**
 * Abstract signature check used by the update pipeline.
 *
 * Implementations must be deterministic and must not have side effects
 * visible to the controller. Malformed inputs are a verification failure,
 * never an exception.
 */
class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    /**
     * Verify a detached signature.
     * @param data Signed message (the package code)
     * @param signature Hex-encoded signature
     * @param publicKey Hex-encoded public key
     * @return true if the signature is valid for data under publicKey
     */
    virtual bool Verify(const std::string& data,
                        const std::string& signature,
                        const std::string& publicKey) const = 0;
};

/// Ed25519 verifier backed by OpenSSL
class Ed25519Verifier : public ISignatureVerifier {
public:
    bool Verify(const std::string& data,
                const std::string& signature,
                const std::string& publicKey) const override;
};

// ============================================================================
// Key Generation and Signing
// ============================================================================

/// Hex-encoded Ed25519 key pair
struct KeyPair {
    std::string publicKey;
    std::string privateKey;
};

/// Generate a fresh key pair from the OpenSSL CSPRNG
std::optional<KeyPair> GenerateEd25519KeyPair();

/// Derive the public key for a hex-encoded private key
std::optional<std::string> DeriveEd25519PublicKey(const std::string& privateKey);

/// Sign data with a hex-encoded private key, returning a hex signature
std::optional<std::string> SignEd25519(const std::string& data,
                                       const std::string& privateKey);

/// Check that a hex string decodes to a well-formed Ed25519 public key
bool IsValidEd25519PublicKey(const std::string& publicKey);

} // namespace crypto
} // namespace aegis

#endif // AEGIS_CRYPTO_SIGNATURE_H
