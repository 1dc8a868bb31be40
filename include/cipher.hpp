#pragma once

#include "secure_memory.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

// Authenticated symmetric encryption for room broadcasts.
//
// Every payload carries its own random nonce, a detached 16-byte tag and the
// issue time. Both suites use a 256-bit key, so a room key does not depend on
// the suite; the suite is fixed per key and recorded in each payload.
enum class CipherSuite {
    Aes256Gcm,          // 12-byte IV, wire tag "A256GCM"
    XChaCha20Poly1305,  // 24-byte nonce, wire tag "XC20P"
};

constexpr std::size_t kSessionKeyBytes = 32;
constexpr std::size_t kAuthTagBytes = 16;

// "auto" prefers AES-256-GCM when the CPU supports it.
// Throws std::invalid_argument for unknown names and std::runtime_error when
// "aes256gcm" is requested on hardware that cannot run it.
CipherSuite resolveCipherSuite(const std::string& name);
const char* cipherTag(CipherSuite suite);
// Inverse of cipherTag. Throws DecryptionError for unknown tags.
CipherSuite suiteFromTag(const std::string& tag);
std::size_t nonceBytes(CipherSuite suite);

struct SessionKey {
    SecureKey key;
    CipherSuite suite = CipherSuite::XChaCha20Poly1305;
    std::int64_t createdAtMs = 0;
    std::string roomId;
};

struct EncryptedPayload {
    std::string iv;   // base64
    std::string data; // base64 ciphertext
    std::string tag;  // base64 authentication tag
    std::int64_t ts = 0;
    std::string alg;
};

// Fresh random key, independent per room.
SessionKey generateSessionKey(const std::string& roomId, CipherSuite suite);

EncryptedPayload encrypt(const nlohmann::json& value, const SessionKey& key);

// Throws DecryptionError on any malformed field, suite mismatch or tag failure.
nlohmann::json decrypt(const EncryptedPayload& payload, const SessionKey& key);

// Replay window: the payload was issued no later than now and no earlier than
// now - maxAgeMs.
bool isPayloadFresh(const EncryptedPayload& payload, std::int64_t maxAgeMs, std::int64_t nowMs);
bool isPayloadFresh(const EncryptedPayload& payload, std::int64_t maxAgeMs);

std::string encodeBase64(const unsigned char* data, std::size_t len);
std::vector<unsigned char> decodeBase64(const std::string& text);

// Truncated SHA-256 hex digest for correlating identifiers in logs.
std::string hashForLogging(const std::string& value);

void to_json(nlohmann::json& j, const EncryptedPayload& payload);
void from_json(const nlohmann::json& j, EncryptedPayload& payload);

} // namespace tr
