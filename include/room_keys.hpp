#pragma once

#include "cipher.hpp"
#include "price_source.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tr {

// Session key plus the symbol <-> index bijection for one room.
struct RoomKeys {
    SessionKey sessionKey;
    std::map<std::string, int> assetIndexMap;
    std::vector<std::string> symbols; // sorted; position == index
};

enum class KeyState { Uninitialized, Ready, Failed };

struct KeyStatus {
    KeyState state = KeyState::Uninitialized;
    std::string reason; // set when Failed
};

const char* keyStateName(KeyState state);

// Sole owner of room key material. Keys are destroyed, never archived.
class RoomKeyRegistry {
public:
    explicit RoomKeyRegistry(CipherSuite suite);
    ~RoomKeyRegistry();

    RoomKeyRegistry(const RoomKeyRegistry&) = delete;
    RoomKeyRegistry& operator=(const RoomKeyRegistry&) = delete;

    // Replaces any keys the room already had.
    const RoomKeys& initializeRoomKeys(const std::string& roomId, std::vector<std::string> symbols);

    // Dense price array sized to the room's symbol count, zero where the
    // snapshot has no price. nullopt when the room has no keys.
    std::optional<EncryptedPayload> encryptPriceData(const std::string& roomId,
                                                     const PriceSnapshot& snapshot) const;

    // Throws std::invalid_argument if the room has no keys, DecryptionError
    // if the payload does not authenticate.
    std::vector<double> decryptPriceData(const std::string& roomId, const EncryptedPayload& payload) const;

    std::optional<std::string> sessionKeyForExchange(const std::string& roomId) const;
    std::optional<std::map<std::string, int>> assetIndexMapping(const std::string& roomId) const;
    std::optional<std::vector<std::string>> roomSymbols(const std::string& roomId) const;

    bool hasRoomKeys(const std::string& roomId) const;
    std::size_t activeRoomCount() const { return keys_.size(); }

    void markFailed(const std::string& roomId, const std::string& reason);
    KeyStatus status(const std::string& roomId) const;

    CipherSuite suite() const { return suite_; }

    bool cleanupRoomKeys(const std::string& roomId);
    void cleanupAll();

private:
    CipherSuite suite_;
    std::unordered_map<std::string, RoomKeys> keys_;
    std::unordered_map<std::string, std::string> failures_;
};

} // namespace tr
