#include "cipher.hpp"

#include "clock.hpp"
#include "errors.hpp"
#include "secure_random.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace tr {

namespace {

static_assert(crypto_aead_aes256gcm_KEYBYTES == kSessionKeyBytes, "AES-256-GCM key size");
static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == kSessionKeyBytes,
              "XChaCha20-Poly1305 key size");
static_assert(crypto_aead_aes256gcm_ABYTES == kAuthTagBytes, "AES-256-GCM tag size");
static_assert(crypto_aead_xchacha20poly1305_ietf_ABYTES == kAuthTagBytes,
              "XChaCha20-Poly1305 tag size");

bool aesAvailable() {
    ensureSodiumReady();
    return crypto_aead_aes256gcm_is_available() != 0;
}

std::vector<unsigned char> decodeField(const std::string& text, const char* field) {
    try {
        return decodeBase64(text);
    } catch (const std::invalid_argument&) {
        throw DecryptionError(std::string("payload field is not valid base64: ") + field);
    }
}

} // namespace

CipherSuite resolveCipherSuite(const std::string& name) {
    if (name == "auto") {
        return aesAvailable() ? CipherSuite::Aes256Gcm : CipherSuite::XChaCha20Poly1305;
    }
    if (name == "aes256gcm") {
        if (!aesAvailable()) {
            throw std::runtime_error("AES-256-GCM is not supported on this CPU; use xchacha20poly1305 or auto");
        }
        return CipherSuite::Aes256Gcm;
    }
    if (name == "xchacha20poly1305") {
        ensureSodiumReady();
        return CipherSuite::XChaCha20Poly1305;
    }
    throw std::invalid_argument("unknown cipher suite: " + name);
}

CipherSuite suiteFromTag(const std::string& tag) {
    if (tag == "A256GCM") {
        return CipherSuite::Aes256Gcm;
    }
    if (tag == "XC20P") {
        return CipherSuite::XChaCha20Poly1305;
    }
    throw DecryptionError("unknown payload algorithm");
}

const char* cipherTag(CipherSuite suite) {
    return suite == CipherSuite::Aes256Gcm ? "A256GCM" : "XC20P";
}

std::size_t nonceBytes(CipherSuite suite) {
    return suite == CipherSuite::Aes256Gcm ? crypto_aead_aes256gcm_NPUBBYTES
                                           : crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
}

SessionKey generateSessionKey(const std::string& roomId, CipherSuite suite) {
    ensureSodiumReady();
    SessionKey out;
    out.key = SecureKey(kSessionKeyBytes);
    randombytes_buf(out.key.data(), out.key.size());
    out.suite = suite;
    out.createdAtMs = nowMillis();
    out.roomId = roomId;
    return out;
}

EncryptedPayload encrypt(const nlohmann::json& value, const SessionKey& key) {
    if (key.key.size() != kSessionKeyBytes) {
        throw std::invalid_argument("session key has wrong length");
    }

    std::string plaintext = value.dump();
    std::vector<std::uint8_t> nonce = secureRandomBytes(nonceBytes(key.suite));
    std::vector<unsigned char> ciphertext(plaintext.size());
    unsigned char tag[kAuthTagBytes];
    unsigned long long tagLen = 0;

    const auto* message = reinterpret_cast<const unsigned char*>(plaintext.data());
    int rc = 0;
    if (key.suite == CipherSuite::Aes256Gcm) {
        rc = crypto_aead_aes256gcm_encrypt_detached(ciphertext.data(), tag, &tagLen,
                                                    message, plaintext.size(),
                                                    nullptr, 0, nullptr,
                                                    nonce.data(), key.key.data());
    } else {
        rc = crypto_aead_xchacha20poly1305_ietf_encrypt_detached(ciphertext.data(), tag, &tagLen,
                                                                 message, plaintext.size(),
                                                                 nullptr, 0, nullptr,
                                                                 nonce.data(), key.key.data());
    }
    secureZero(plaintext.data(), plaintext.size());
    if (rc != 0 || tagLen != kAuthTagBytes) {
        throw std::runtime_error("authenticated encryption failed");
    }

    EncryptedPayload out;
    out.iv = encodeBase64(nonce.data(), nonce.size());
    out.data = encodeBase64(ciphertext.data(), ciphertext.size());
    out.tag = encodeBase64(tag, sizeof(tag));
    out.ts = nowMillis();
    out.alg = cipherTag(key.suite);
    return out;
}

nlohmann::json decrypt(const EncryptedPayload& payload, const SessionKey& key) {
    if (key.key.size() != kSessionKeyBytes) {
        throw DecryptionError("session key has wrong length");
    }
    CipherSuite suite = suiteFromTag(payload.alg);
    if (suite != key.suite) {
        throw DecryptionError("payload algorithm does not match session key");
    }

    auto nonce = decodeField(payload.iv, "iv");
    auto ciphertext = decodeField(payload.data, "data");
    auto tag = decodeField(payload.tag, "tag");
    if (nonce.size() != nonceBytes(suite)) {
        throw DecryptionError("payload nonce has wrong length");
    }
    if (tag.size() != kAuthTagBytes) {
        throw DecryptionError("payload tag has wrong length");
    }

    std::string plaintext(ciphertext.size(), '\0');
    auto* out = reinterpret_cast<unsigned char*>(&plaintext[0]);
    int rc = 0;
    if (suite == CipherSuite::Aes256Gcm) {
        if (!aesAvailable()) {
            throw DecryptionError("AES-256-GCM is not supported on this CPU");
        }
        rc = crypto_aead_aes256gcm_decrypt_detached(out, nullptr,
                                                    ciphertext.data(), ciphertext.size(),
                                                    tag.data(), nullptr, 0,
                                                    nonce.data(), key.key.data());
    } else {
        rc = crypto_aead_xchacha20poly1305_ietf_decrypt_detached(out, nullptr,
                                                                 ciphertext.data(), ciphertext.size(),
                                                                 tag.data(), nullptr, 0,
                                                                 nonce.data(), key.key.data());
    }
    if (rc != 0) {
        secureZero(&plaintext[0], plaintext.size());
        throw DecryptionError("authentication tag verification failed");
    }

    try {
        nlohmann::json value = nlohmann::json::parse(plaintext);
        secureZero(&plaintext[0], plaintext.size());
        return value;
    } catch (const nlohmann::json::parse_error&) {
        secureZero(&plaintext[0], plaintext.size());
        throw DecryptionError("decrypted payload is not valid JSON");
    }
}

bool isPayloadFresh(const EncryptedPayload& payload, std::int64_t maxAgeMs, std::int64_t nowMs) {
    std::int64_t age = nowMs - payload.ts;
    return age >= 0 && age <= maxAgeMs;
}

bool isPayloadFresh(const EncryptedPayload& payload, std::int64_t maxAgeMs) {
    return isPayloadFresh(payload, maxAgeMs, nowMillis());
}

std::string encodeBase64(const unsigned char* data, std::size_t len) {
    ensureSodiumReady();
    const std::size_t encodedLen = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out(encodedLen, '\0');
    sodium_bin2base64(&out[0], out.size(), data, len, sodium_base64_VARIANT_ORIGINAL);
    // sodium writes a trailing NUL that is counted in ENCODED_LEN.
    out.resize(encodedLen - 1);
    return out;
}

std::vector<unsigned char> decodeBase64(const std::string& text) {
    ensureSodiumReady();
    std::vector<unsigned char> out(text.size() / 4 * 3 + 3);
    std::size_t binLen = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &binLen, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != text.data() + text.size()) {
        throw std::invalid_argument("invalid base64 input");
    }
    out.resize(binLen);
    return out;
}

std::string hashForLogging(const std::string& value) {
    ensureSodiumReady();
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest, reinterpret_cast<const unsigned char*>(value.data()), value.size());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < 8; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

void to_json(nlohmann::json& j, const EncryptedPayload& payload) {
    j = nlohmann::json{ { "iv", payload.iv },
                        { "data", payload.data },
                        { "tag", payload.tag },
                        { "ts", payload.ts },
                        { "alg", payload.alg } };
}

void from_json(const nlohmann::json& j, EncryptedPayload& payload) {
    payload.iv = j.at("iv").get<std::string>();
    payload.data = j.at("data").get<std::string>();
    payload.tag = j.at("tag").get<std::string>();
    payload.ts = j.at("ts").get<std::int64_t>();
    payload.alg = j.value("alg", std::string{});
}

} // namespace tr
