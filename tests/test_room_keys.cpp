#include "cipher.hpp"
#include "errors.hpp"
#include "room_keys.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "room_keys_test failure: " << msg << std::endl;
    std::exit(1);
}

template <typename Fn>
bool throwsDecryptionError(Fn fn) {
    try {
        fn();
    } catch (const tr::DecryptionError&) {
        return true;
    }
    return false;
}

void flipFirstChar(std::string& base64) {
    base64[0] = base64[0] == 'A' ? 'B' : 'A';
}

} // namespace

int main() {
    using namespace tr;

    const CipherSuite suite = resolveCipherSuite("xchacha20poly1305");
    if (resolveCipherSuite("auto") != CipherSuite::Aes256Gcm &&
        resolveCipherSuite("auto") != CipherSuite::XChaCha20Poly1305) {
        fail("auto did not resolve to a known suite");
    }
    try {
        resolveCipherSuite("rot13");
        fail("unknown cipher name accepted");
    } catch (const std::invalid_argument&) {
    }

    // Cipher layer.
    SessionKey key = generateSessionKey("ROOM01", suite);
    if (key.key.size() != kSessionKeyBytes || key.roomId != "ROOM01") {
        fail("session key has wrong shape");
    }
    SessionKey other = generateSessionKey("ROOM02", suite);
    if (std::equal(key.key.data(), key.key.data() + kSessionKeyBytes, other.key.data())) {
        fail("two rooms received the same key");
    }

    nlohmann::json value = nlohmann::json::array({ 101.5, 0.0, 42.25 });
    EncryptedPayload first = encrypt(value, key);
    EncryptedPayload second = encrypt(value, key);
    if (first.iv == second.iv) {
        fail("nonce reused across encryptions");
    }
    if (first.alg != "XC20P" || decodeBase64(first.iv).size() != nonceBytes(suite)) {
        fail("payload does not describe its suite");
    }
    if (decrypt(first, key) != value) {
        fail("decrypt did not return the encrypted value");
    }
    if (!throwsDecryptionError([&] { decrypt(first, other); })) {
        fail("wrong key decrypted a payload");
    }

    EncryptedPayload tampered = first;
    flipFirstChar(tampered.data);
    if (!throwsDecryptionError([&] { decrypt(tampered, key); })) {
        fail("tampered ciphertext authenticated");
    }
    tampered = first;
    flipFirstChar(tampered.tag);
    if (!throwsDecryptionError([&] { decrypt(tampered, key); })) {
        fail("tampered tag authenticated");
    }
    tampered = first;
    tampered.iv = "not base64!";
    if (!throwsDecryptionError([&] { decrypt(tampered, key); })) {
        fail("malformed nonce accepted");
    }
    tampered = first;
    tampered.alg = "A256GCM";
    if (!throwsDecryptionError([&] { decrypt(tampered, key); })) {
        fail("suite mismatch accepted");
    }

    if (!isPayloadFresh(first, 30000, first.ts + 30000) || !isPayloadFresh(first, 30000, first.ts)) {
        fail("payload inside the window reported stale");
    }
    if (isPayloadFresh(first, 30000, first.ts + 30001)) {
        fail("expired payload reported fresh");
    }
    if (isPayloadFresh(first, 30000, first.ts - 1)) {
        fail("future-dated payload reported fresh");
    }

    nlohmann::json wire = first;
    if (wire.at("alg") != "XC20P" || wire.get<EncryptedPayload>().data != first.data) {
        fail("payload JSON form lost fields");
    }

    // Room key registry.
    RoomKeyRegistry registry(suite);
    const RoomKeys& keys = registry.initializeRoomKeys("ROOM01", { "TCS", "GOLD", "BTC", "GOLD" });
    const std::vector<std::string> expectedSymbols{ "BTC", "GOLD", "TCS" };
    if (keys.symbols != expectedSymbols) {
        fail("symbols not sorted and deduplicated");
    }
    for (std::size_t i = 0; i < expectedSymbols.size(); ++i) {
        if (keys.assetIndexMap.at(expectedSymbols[i]) != static_cast<int>(i)) {
            fail("asset index map does not match symbol order");
        }
    }
    if (registry.status("ROOM01").state != KeyState::Ready || !registry.hasRoomKeys("ROOM01")) {
        fail("room keys not ready after initialization");
    }

    PriceSnapshot snapshot{ { "GOLD", 1850.5 }, { "TCS", 3200.0 }, { "UNKNOWN", 9.0 } };
    auto payload = registry.encryptPriceData("ROOM01", snapshot);
    if (!payload) {
        fail("encryptPriceData returned nothing for a keyed room");
    }
    std::vector<double> dense = registry.decryptPriceData("ROOM01", *payload);
    if (dense.size() != 3 || dense[0] != 0.0 || std::abs(dense[1] - 1850.5) > 1e-9 ||
        std::abs(dense[2] - 3200.0) > 1e-9) {
        fail("dense price array is wrong");
    }

    if (registry.encryptPriceData("NOPE00", snapshot)) {
        fail("encryptPriceData produced a payload for a room without keys");
    }
    try {
        registry.decryptPriceData("NOPE00", *payload);
        fail("decryptPriceData accepted a room without keys");
    } catch (const std::invalid_argument&) {
    }

    auto exchanged = registry.sessionKeyForExchange("ROOM01");
    if (!exchanged || decodeBase64(*exchanged).size() != kSessionKeyBytes) {
        fail("exchanged session key has wrong length");
    }

    registry.initializeRoomKeys("ROOM02", { "BTC" });
    auto otherRoom = registry.encryptPriceData("ROOM02", snapshot);
    if (!throwsDecryptionError([&] { registry.decryptPriceData("ROOM01", *otherRoom); })) {
        fail("one room's key decrypted another room's payload");
    }

    if (!registry.cleanupRoomKeys("ROOM01")) {
        fail("cleanup reported no keys for a keyed room");
    }
    if (registry.hasRoomKeys("ROOM01") || registry.sessionKeyForExchange("ROOM01") ||
        registry.encryptPriceData("ROOM01", snapshot)) {
        fail("key material survived cleanup");
    }
    if (registry.cleanupRoomKeys("ROOM01")) {
        fail("second cleanup reported keys");
    }

    registry.markFailed("ROOM02", "price repository offline");
    KeyStatus status = registry.status("ROOM02");
    if (status.state != KeyState::Failed || status.reason != "price repository offline" ||
        registry.hasRoomKeys("ROOM02")) {
        fail("markFailed did not discard keys and record the reason");
    }

    registry.initializeRoomKeys("ROOM03", { "BTC" });
    registry.cleanupAll();
    if (registry.activeRoomCount() != 0 || registry.status("ROOM02").state != KeyState::Uninitialized) {
        fail("cleanupAll left state behind");
    }

    std::cout << "room_keys_test passed" << std::endl;
    return 0;
}
