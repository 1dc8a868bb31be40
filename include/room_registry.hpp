#pragma once

#include "errors.hpp"
#include "life_events.hpp"
#include "random_source.hpp"
#include "room.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tr {

constexpr std::size_t kRoomCodeLength = 6;
constexpr const char* kRoomCodeAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr int kMaxRoomCodeAttempts = 1000;
constexpr std::size_t kMinPlayersToStart = 2;

struct LeaveResult {
    std::string roomCode;
    bool wasHost = false;
    bool roomDeleted = false;
    bool resumed = false; // the leaver was the last player holding a quiz or intro pause
    std::vector<std::string> remaining; // roster after removal, before any deletion
};

enum class ClockOutcome { NoRoom, NotRunning, Advanced, Terminal };

struct ClockStep {
    ClockOutcome outcome = ClockOutcome::NoRoom;
    int year = 0;
    int month = 0;
};

struct TriggeredLifeEvent {
    std::string playerId;
    LifeEvent event;
    double postPocketCash = 0.0;
};

// Single owner of room and player state. Rooms are stored by code and
// players are indexed to their room by id; nothing holds a Room across
// calls. Not synchronized: callers run on one executor.
class RoomRegistry {
public:
    using RoomDeletedListener = std::function<void(const std::string& roomCode)>;

    RoomRegistry(RandomSource& rng,
                 LifeEventGenerator& lifeEvents,
                 double startingCash = 100000.0,
                 int totalYears = 20);

    Outcome<std::string> createRoom(const std::string& hostId, const std::string& hostName);
    Outcome<Room> joinRoom(const std::string& roomCode, const std::string& playerId, const std::string& playerName);
    // nullopt when the player is not in a room.
    std::optional<LeaveResult> leaveRoom(const std::string& playerId);

    // Checks everything startGame checks plus host authority, without
    // mutating the room.
    RoomError validateStart(const std::string& roomCode, const std::string& requesterId) const;
    RoomError startGame(const std::string& roomCode, const AdminSettings& settings);
    bool applyInitialState(const std::string& roomCode, const InitialGameState& initial);
    bool generateLifeEventsForRoom(const std::string& roomCode, int eventsCount);

    bool updatePlayerState(const std::string& playerId, double networth, const PortfolioBreakdown& breakdown);
    std::vector<PlayerInfo> getLeaderboard(const std::string& roomCode) const;

    bool markQuizStarted(const std::string& playerId, const std::string& category);
    // True exactly when this call empties the wait list and resumes the room.
    bool markQuizCompleted(const std::string& playerId, const std::string& category);
    bool markIntroCompleted(const std::string& playerId);
    bool togglePause(const std::string& roomCode);

    ClockStep advanceClock(const std::string& roomCode);
    bool endGame(const std::string& roomCode);
    std::vector<TriggeredLifeEvent> applyLifeEvents(const std::string& roomCode, int year, int month);

    std::size_t cleanupOldRooms(std::int64_t maxAgeMs, std::int64_t nowMs);
    bool deleteRoom(const std::string& roomCode);
    void setRoomDeletedListener(RoomDeletedListener listener);

    const Room* findRoom(const std::string& roomCode) const;
    std::optional<std::string> roomOf(const std::string& playerId) const;
    std::vector<std::string> roster(const std::string& roomCode) const;
    std::size_t roomCount() const { return rooms_.size(); }
    std::vector<std::string> allRoomCodes() const;

    int totalYears() const { return totalYears_; }
    double startingCash() const { return startingCash_; }

private:
    std::string generateRoomCode();
    Room* roomFor(const std::string& playerId);
    static PlayerInfo makePlayer(const std::string& id, const std::string& name, bool isHost, double cash);

    RandomSource& rng_;
    LifeEventGenerator& lifeEvents_;
    double startingCash_;
    int totalYears_;
    std::unordered_map<std::string, Room> rooms_;
    std::unordered_map<std::string, std::string> playerToRoom_;
    RoomDeletedListener onRoomDeleted_;
};

} // namespace tr
