#pragma once

#include "config.hpp"
#include "message_sink.hpp"
#include "price_source.hpp"
#include "room_keys.hpp"
#include "room_registry.hpp"
#include "session_store.hpp"
#include "valuation.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

namespace tr {

enum class TickResult { NoRoom, NotRunning, Paused, Skipped, Advanced, Ended };

const char* tickResultName(TickResult result);

// A client's net worth submission. Holdings are optional; without them the
// claim only refreshes the leaderboard.
struct NetworthClaim {
    double networth = 0.0;
    PortfolioBreakdown breakdown;
    bool hasHoldings = false;
    double pocketCash = 0.0;
    double savingsBalance = 0.0;
    std::vector<FixedDeposit> fixedDeposits;
    Holdings holdings;
};

// Drives every room's clock and fans out room events. All handlers and timer
// callbacks run on one strand, so a room's state is never touched by two
// callbacks at once. Room and player state is changed only through the
// RoomRegistry; key material only through the RoomKeyRegistry.
//
// Handlers return the direct response for the requester: {"success": true,
// ...} or {"success": false, "error": <message>}.
class SessionCoordinator {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    SessionCoordinator(boost::asio::io_context& io,
                       RoomRegistry& rooms,
                       RoomKeyRegistry& keys,
                       PriceSource& prices,
                       SessionStore& store,
                       MessageSink& sink,
                       CoordinatorConfig config);
    ~SessionCoordinator();

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    Strand& strand() { return strand_; }
    const CoordinatorConfig& config() const { return config_; }

    // Starts the idle-room sweep; stop() cancels every timer and destroys
    // all room keys. No timer is armed after stop().
    void start();
    void stop();

    nlohmann::json createRoom(const std::string& playerId, const std::string& playerName);
    nlohmann::json joinRoom(const std::string& playerId, const std::string& roomCode, const std::string& playerName);
    nlohmann::json leaveRoom(const std::string& playerId);
    void disconnect(const std::string& playerId);
    nlohmann::json startGame(const std::string& playerId,
                             const AdminSettings& settings,
                             const std::optional<InitialGameState>& initial);
    nlohmann::json togglePause(const std::string& playerId);
    nlohmann::json updatePlayerState(const std::string& playerId, double networth, const PortfolioBreakdown& breakdown);
    nlohmann::json quizStarted(const std::string& playerId, const std::string& category);
    nlohmann::json quizFinished(const std::string& playerId, const std::string& category);
    nlohmann::json introCompleted(const std::string& playerId);
    nlohmann::json requestKeyExchange(const std::string& playerId);
    nlohmann::json submitNetworth(const std::string& playerId, const NetworthClaim& claim);

    // Installs the recurring month timer; the period is clamped to
    // [1, kMaxDurationMs]. Periods missed while the strand was busy are
    // dropped, not replayed.
    void startTimeProgression(const std::string& roomCode, std::int64_t monthDurationMs);
    // One scheduled firing, also callable directly.
    TickResult runTick(const std::string& roomCode);

    // Coalesces leaderboard broadcasts per room into one trailing send per
    // window; the send reads the leaderboard when it fires.
    void requestLeaderboard(const std::string& roomCode);

    bool isTicking(const std::string& roomCode) const;
    bool leaderboardPending(const std::string& roomCode) const;

private:
    struct RoomRuntime {
        explicit RoomRuntime(boost::asio::io_context& io)
            : tickTimer(io)
            , leaderboardTimer(io) {}

        boost::asio::steady_timer tickTimer;
        boost::asio::steady_timer leaderboardTimer;
        std::chrono::milliseconds monthDuration{ 0 };
        std::chrono::steady_clock::time_point nextTickAt;
        bool ticking = false;
        bool tickInFlight = false;
        bool leaderboardPending = false;
        std::optional<PriceSnapshot> lastPrices;
    };
    using RuntimePtr = std::shared_ptr<RoomRuntime>;

    RuntimePtr runtimeFor(const std::string& roomCode);
    RuntimePtr findRuntime(const std::string& roomCode) const;
    void onRoomDeleted(const std::string& roomCode);
    void stopTicking(const std::string& roomCode);
    void scheduleTick(const std::string& roomCode, const RuntimePtr& rt);
    void scheduleSweep();

    bool initializeMarketData(const std::string& roomCode, const nlohmann::json& selectedAssets, int startYear);
    int calendarYear(const Room& room, int simulatedYear) const;
    void sendPriceTick(const std::string& roomCode,
                       const std::vector<std::string>& recipients,
                       int year,
                       int month,
                       const PriceSnapshot& snapshot);
    void finishGame(const std::string& roomCode, int finalYear, int finalMonth);
    nlohmann::json keyExchangePayload(const std::string& roomCode) const;

    void broadcast(const std::string& roomCode, const std::string& event, const nlohmann::json& payload);
    void sendTo(const std::vector<std::string>& playerIds, const std::string& event, const nlohmann::json& payload);
    void broadcastLeaderboardNow(const std::string& roomCode);
    nlohmann::json leaderboardJson(const std::string& roomCode) const;

    boost::asio::io_context& io_;
    Strand strand_;
    RoomRegistry& rooms_;
    RoomKeyRegistry& keys_;
    PriceSource& prices_;
    SessionStore& store_;
    MessageSink& sink_;
    CoordinatorConfig config_;
    boost::asio::steady_timer sweepTimer_;
    bool running_ = false;
    bool stopped_ = false;
    std::unordered_map<std::string, RuntimePtr> runtimes_;
};

nlohmann::json errorResponse(RoomError error);

} // namespace tr
