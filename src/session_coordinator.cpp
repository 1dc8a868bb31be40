#include "session_coordinator.hpp"

#include "clock.hpp"
#include "errors.hpp"

#include <algorithm>
#include <utility>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/error.hpp>

#include <spdlog/spdlog.h>

namespace tr {

namespace {

constexpr const char* kHostLeftMessage = "Host left the game. Room closed.";

nlohmann::json pausedPayload(const GameState& state) {
    const char* reason = pauseReasonName(state.pauseReason);
    nlohmann::json payload{ { "reason", reason ? nlohmann::json(reason) : nlohmann::json() } };
    if (state.pauseReason == PauseReason::Quiz) {
        payload["playersWaitingForQuiz"] = state.playersWaitingForQuiz;
    } else if (state.pauseReason == PauseReason::Intro) {
        payload["playersWaitingForIntro"] = state.playersWaitingForIntro;
    }
    return payload;
}

struct InFlightGuard {
    explicit InFlightGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~InFlightGuard() { flag_ = false; }
    bool& flag_;
};

} // namespace

const char* tickResultName(TickResult result) {
    switch (result) {
    case TickResult::NoRoom:
        return "no-room";
    case TickResult::NotRunning:
        return "not-running";
    case TickResult::Paused:
        return "paused";
    case TickResult::Skipped:
        return "skipped";
    case TickResult::Advanced:
        return "advanced";
    case TickResult::Ended:
        return "ended";
    }
    return "unknown";
}

nlohmann::json errorResponse(RoomError error) {
    return nlohmann::json{ { "success", false }, { "error", describe(error) } };
}

SessionCoordinator::SessionCoordinator(boost::asio::io_context& io,
                                       RoomRegistry& rooms,
                                       RoomKeyRegistry& keys,
                                       PriceSource& prices,
                                       SessionStore& store,
                                       MessageSink& sink,
                                       CoordinatorConfig config)
    : io_(io)
    , strand_(boost::asio::make_strand(io))
    , rooms_(rooms)
    , keys_(keys)
    , prices_(prices)
    , store_(store)
    , sink_(sink)
    , config_(std::move(config))
    , sweepTimer_(io) {
    rooms_.setRoomDeletedListener([this](const std::string& roomCode) { onRoomDeleted(roomCode); });
}

SessionCoordinator::~SessionCoordinator() {
    rooms_.setRoomDeletedListener(nullptr);
    stop();
}

void SessionCoordinator::start() {
    running_ = true;
    scheduleSweep();
}

void SessionCoordinator::stop() {
    running_ = false;
    stopped_ = true;
    sweepTimer_.cancel();
    for (auto& entry : runtimes_) {
        entry.second->ticking = false;
        entry.second->leaderboardPending = false;
        entry.second->tickTimer.cancel();
        entry.second->leaderboardTimer.cancel();
    }
    runtimes_.clear();
    keys_.cleanupAll();
}

void SessionCoordinator::scheduleSweep() {
    sweepTimer_.expires_after(std::chrono::milliseconds(config_.roomSweepIntervalMs));
    sweepTimer_.async_wait(boost::asio::bind_executor(strand_, [this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        if (ec) {
            spdlog::error("Room sweep timer failed: {}", ec.message());
            return;
        }
        rooms_.cleanupOldRooms(config_.roomMaxAgeMs, nowMillis());
        scheduleSweep();
    }));
}

SessionCoordinator::RuntimePtr SessionCoordinator::runtimeFor(const std::string& roomCode) {
    auto it = runtimes_.find(roomCode);
    if (it != runtimes_.end()) {
        return it->second;
    }
    auto rt = std::make_shared<RoomRuntime>(io_);
    runtimes_.emplace(roomCode, rt);
    return rt;
}

SessionCoordinator::RuntimePtr SessionCoordinator::findRuntime(const std::string& roomCode) const {
    auto it = runtimes_.find(roomCode);
    return it == runtimes_.end() ? nullptr : it->second;
}

void SessionCoordinator::onRoomDeleted(const std::string& roomCode) {
    auto it = runtimes_.find(roomCode);
    if (it != runtimes_.end()) {
        RuntimePtr rt = it->second;
        rt->ticking = false;
        rt->leaderboardPending = false;
        rt->tickTimer.cancel();
        rt->leaderboardTimer.cancel();
        rt->lastPrices.reset();
        runtimes_.erase(it);
    }
    keys_.cleanupRoomKeys(roomCode);
}

void SessionCoordinator::stopTicking(const std::string& roomCode) {
    RuntimePtr rt = findRuntime(roomCode);
    if (rt && rt->ticking) {
        rt->ticking = false;
        rt->tickTimer.cancel();
        spdlog::debug("Room {}: time progression stopped", roomCode);
    }
}

bool SessionCoordinator::isTicking(const std::string& roomCode) const {
    RuntimePtr rt = findRuntime(roomCode);
    return rt && rt->ticking;
}

bool SessionCoordinator::leaderboardPending(const std::string& roomCode) const {
    RuntimePtr rt = findRuntime(roomCode);
    return rt && rt->leaderboardPending;
}

void SessionCoordinator::broadcast(const std::string& roomCode, const std::string& event, const nlohmann::json& payload) {
    sendTo(rooms_.roster(roomCode), event, payload);
}

void SessionCoordinator::sendTo(const std::vector<std::string>& playerIds,
                                const std::string& event,
                                const nlohmann::json& payload) {
    for (const auto& id : playerIds) {
        sink_.sendToPlayer(id, event, payload);
    }
}

nlohmann::json SessionCoordinator::leaderboardJson(const std::string& roomCode) const {
    return nlohmann::json{ { "players", rooms_.getLeaderboard(roomCode) } };
}

void SessionCoordinator::requestLeaderboard(const std::string& roomCode) {
    if (stopped_ || rooms_.findRoom(roomCode) == nullptr) {
        return;
    }
    RuntimePtr rt = runtimeFor(roomCode);
    if (rt->leaderboardPending) {
        return;
    }
    rt->leaderboardPending = true;
    rt->leaderboardTimer.expires_after(std::chrono::milliseconds(config_.leaderboardWindowMs));
    rt->leaderboardTimer.async_wait(
        boost::asio::bind_executor(strand_, [this, roomCode, rt](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || !rt->leaderboardPending) {
                return;
            }
            rt->leaderboardPending = false;
            if (ec) {
                spdlog::error("Room {}: leaderboard timer failed: {}", roomCode, ec.message());
                return;
            }
            broadcast(roomCode, "leaderboardUpdate", leaderboardJson(roomCode));
        }));
}

void SessionCoordinator::broadcastLeaderboardNow(const std::string& roomCode) {
    RuntimePtr rt = findRuntime(roomCode);
    if (rt && rt->leaderboardPending) {
        rt->leaderboardPending = false;
        rt->leaderboardTimer.cancel();
    }
    broadcast(roomCode, "leaderboardUpdate", leaderboardJson(roomCode));
}

nlohmann::json SessionCoordinator::createRoom(const std::string& playerId, const std::string& playerName) {
    if (rooms_.roomOf(playerId)) {
        leaveRoom(playerId);
    }
    auto created = rooms_.createRoom(playerId, playerName);
    if (!created) {
        return errorResponse(created.error());
    }
    const std::string& code = created.value();
    sink_.sendToPlayer(playerId, "roomCreated", { { "roomId", code }, { "hostId", playerId } });
    return nlohmann::json{ { "success", true }, { "roomId", code }, { "hostId", playerId } };
}

nlohmann::json SessionCoordinator::joinRoom(const std::string& playerId,
                                            const std::string& roomCode,
                                            const std::string& playerName) {
    auto current = rooms_.roomOf(playerId);
    if (current && *current == roomCode) {
        return errorResponse(RoomError::PlayerAlreadyPresent);
    }
    if (current) {
        leaveRoom(playerId);
    }

    auto joined = rooms_.joinRoom(roomCode, playerId, playerName);
    if (!joined) {
        return errorResponse(joined.error());
    }
    const Room& room = joined.value();

    nlohmann::json settings = room.adminSettings ? nlohmann::json(*room.adminSettings) : nlohmann::json();
    nlohmann::json snapshot{ { "roomId", roomCode }, { "players", room.players }, { "adminSettings", settings } };
    sink_.sendToPlayer(playerId, "roomJoined", snapshot);

    std::vector<std::string> others;
    for (const auto& p : room.players) {
        if (p.id != playerId) {
            others.push_back(p.id);
        }
    }
    if (const PlayerInfo* newcomer = room.findPlayer(playerId)) {
        sendTo(others, "playerJoined", { { "player", *newcomer } });
    }
    requestLeaderboard(roomCode);

    snapshot["success"] = true;
    return snapshot;
}

nlohmann::json SessionCoordinator::leaveRoom(const std::string& playerId) {
    auto left = rooms_.leaveRoom(playerId);
    if (!left) {
        return errorResponse(RoomError::NotInRoom);
    }

    sendTo(left->remaining, "playerLeft", { { "playerId", playerId } });
    if (left->roomDeleted) {
        if (left->wasHost) {
            sendTo(left->remaining, "error", { { "message", kHostLeftMessage } });
        }
        spdlog::info("Room {} closed after {} left", left->roomCode, left->wasHost ? "host" : "last player");
    } else {
        if (left->resumed) {
            broadcast(left->roomCode, "gameResumed", nlohmann::json::object());
        }
        requestLeaderboard(left->roomCode);
    }
    return nlohmann::json{ { "success", true }, { "roomId", left->roomCode } };
}

void SessionCoordinator::disconnect(const std::string& playerId) {
    if (rooms_.roomOf(playerId)) {
        leaveRoom(playerId);
    }
}

bool SessionCoordinator::initializeMarketData(const std::string& roomCode,
                                              const nlohmann::json& selectedAssets,
                                              int startYear) {
    std::vector<std::string> symbols = gameSymbols(selectedAssets);

    try {
        prices_.preloadPricesForGame(symbols, startYear, config_.totalYears);
    } catch (const std::exception& ex) {
        spdlog::warn("Room {}: price preload failed, continuing without warm cache: {}", roomCode, ex.what());
    }

    keys_.initializeRoomKeys(roomCode, symbols);

    PriceSnapshot first;
    try {
        first = prices_.getPricesForDate(symbols, startYear, 1);
    } catch (const std::exception& ex) {
        keys_.markFailed(roomCode, ex.what());
        spdlog::error("Room {}: market data initialization failed: {}", roomCode, ex.what());
        return false;
    }
    if (first.empty()) {
        keys_.markFailed(roomCode, "no prices for the starting month");
        spdlog::error("Room {}: no prices available for {}-01", roomCode, startYear);
        return false;
    }

    runtimeFor(roomCode)->lastPrices = std::move(first);
    return true;
}

nlohmann::json SessionCoordinator::startGame(const std::string& playerId,
                                             const AdminSettings& settings,
                                             const std::optional<InitialGameState>& initial) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const std::string roomCode = *code;

    RoomError err = rooms_.validateStart(roomCode, playerId);
    if (err != RoomError::None) {
        return errorResponse(err);
    }

    const Room* room = rooms_.findRoom(roomCode);
    nlohmann::json selectedAssets = room->gameState.selectedAssets;
    if (initial && !initial->selectedAssets.is_null()) {
        selectedAssets = initial->selectedAssets;
    }
    if (!selectedAssets.is_object() || settings.gameStartYear <= 0 || settings.gameStartYear > kMaxCalendarYear) {
        spdlog::warn("Room {}: start rejected, missing asset selection or start year", roomCode);
        return errorResponse(RoomError::InvalidConfiguration);
    }
    if (settings.monthDurationMs && (*settings.monthDurationMs < 1 || *settings.monthDurationMs > kMaxDurationMs)) {
        spdlog::warn("Room {}: start rejected, month duration {} ms out of range", roomCode, *settings.monthDurationMs);
        return errorResponse(RoomError::InvalidConfiguration);
    }

    if (!initializeMarketData(roomCode, selectedAssets, settings.gameStartYear)) {
        return errorResponse(RoomError::MarketDataUnavailable);
    }

    err = rooms_.startGame(roomCode, settings);
    if (err != RoomError::None) {
        keys_.cleanupRoomKeys(roomCode);
        return errorResponse(err);
    }
    if (initial) {
        rooms_.applyInitialState(roomCode, *initial);
    }
    const int eventsCount = clampEventsCount(settings.eventsCount.value_or(config_.defaultEventsCount));
    rooms_.generateLifeEventsForRoom(roomCode, eventsCount);

    room = rooms_.findRoom(roomCode);
    broadcast(roomCode, "gameStarted", { { "gameState", room->gameState }, { "adminSettings", settings } });
    if (room->gameState.paused) {
        broadcast(roomCode, "gamePaused", pausedPayload(room->gameState));
    }
    requestLeaderboard(roomCode);
    startTimeProgression(roomCode, settings.monthDurationMs.value_or(config_.monthDurationMs));

    return nlohmann::json{ { "success", true } };
}

nlohmann::json SessionCoordinator::togglePause(const std::string& playerId) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const Room* room = rooms_.findRoom(*code);
    if (room->hostId != playerId) {
        return errorResponse(RoomError::NotHost);
    }
    if (!rooms_.togglePause(*code)) {
        return errorResponse(RoomError::PauseLocked);
    }

    room = rooms_.findRoom(*code);
    if (room->gameState.paused) {
        broadcast(*code, "gamePaused", pausedPayload(room->gameState));
    } else {
        broadcast(*code, "gameResumed", nlohmann::json::object());
    }
    return nlohmann::json{ { "success", true }, { "paused", room->gameState.paused } };
}

nlohmann::json SessionCoordinator::updatePlayerState(const std::string& playerId,
                                                     double networth,
                                                     const PortfolioBreakdown& breakdown) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const Room* room = rooms_.findRoom(*code);
    if (!room->gameState.started) {
        return errorResponse(RoomError::GameNotRunning);
    }
    if (!rooms_.updatePlayerState(playerId, networth, breakdown)) {
        return errorResponse(RoomError::GameNotRunning);
    }
    requestLeaderboard(*code);
    return nlohmann::json{ { "success", true } };
}

nlohmann::json SessionCoordinator::quizStarted(const std::string& playerId, const std::string& category) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    if (!rooms_.markQuizStarted(playerId, category)) {
        return errorResponse(RoomError::GameNotRunning);
    }

    const Room* room = rooms_.findRoom(*code);
    broadcast(*code, "quizTriggered", { { "playerId", playerId }, { "quizCategory", category } });
    broadcast(*code, "gamePaused", pausedPayload(room->gameState));
    return nlohmann::json{ { "success", true } };
}

nlohmann::json SessionCoordinator::quizFinished(const std::string& playerId, const std::string& category) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const bool resumed = rooms_.markQuizCompleted(playerId, category);

    const Room* room = rooms_.findRoom(*code);
    broadcast(*code, "quizCompleted", { { "playerId", playerId }, { "quizCategory", category } });
    if (resumed) {
        broadcast(*code, "gameResumed", nlohmann::json::object());
    } else if (room->gameState.pauseReason == PauseReason::Quiz) {
        broadcast(*code, "gamePaused", pausedPayload(room->gameState));
    }
    return nlohmann::json{ { "success", true }, { "resumed", resumed } };
}

nlohmann::json SessionCoordinator::introCompleted(const std::string& playerId) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const bool resumed = rooms_.markIntroCompleted(playerId);

    const Room* room = rooms_.findRoom(*code);
    if (resumed) {
        broadcast(*code, "gameResumed", nlohmann::json::object());
    } else if (room->gameState.pauseReason == PauseReason::Intro) {
        broadcast(*code, "gamePaused", pausedPayload(room->gameState));
    }
    return nlohmann::json{ { "success", true }, { "resumed", resumed } };
}

nlohmann::json SessionCoordinator::keyExchangePayload(const std::string& roomCode) const {
    auto sessionKey = keys_.sessionKeyForExchange(roomCode);
    auto mapping = keys_.assetIndexMapping(roomCode);
    auto symbols = keys_.roomSymbols(roomCode);
    if (!sessionKey || !mapping || !symbols) {
        return nlohmann::json();
    }
    return nlohmann::json{ { "sessionKey", *sessionKey },
                           { "assetMapping", *mapping },
                           { "symbols", *symbols },
                           { "alg", cipherTag(keys_.suite()) },
                           { "maxAgeMs", config_.payloadMaxAgeMs } };
}

nlohmann::json SessionCoordinator::requestKeyExchange(const std::string& playerId) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    nlohmann::json exchange = keyExchangePayload(*code);
    if (exchange.is_null()) {
        KeyStatus status = keys_.status(*code);
        spdlog::debug("Room {}: key exchange requested while keys are {}", *code, keyStateName(status.state));
        return errorResponse(RoomError::KeysUnavailable);
    }

    sink_.sendToPlayer(playerId, "keyExchange", exchange);

    const Room* room = rooms_.findRoom(*code);
    if (room->gameState.started && !room->gameState.ended) {
        RuntimePtr rt = runtimeFor(*code);
        const int year = room->gameState.currentYear;
        const int month = room->gameState.currentMonth;
        if (!rt->lastPrices) {
            try {
                rt->lastPrices = prices_.getPricesForDate(*keys_.roomSymbols(*code), calendarYear(*room, year), month);
            } catch (const std::exception& ex) {
                spdlog::warn("Room {}: catch-up price fetch failed: {}", *code, ex.what());
            }
        }
        if (rt->lastPrices) {
            sendPriceTick(*code, { playerId }, year, month, *rt->lastPrices);
        }
    }

    exchange["success"] = true;
    return exchange;
}

nlohmann::json SessionCoordinator::submitNetworth(const std::string& playerId, const NetworthClaim& claim) {
    auto code = rooms_.roomOf(playerId);
    if (!code) {
        return errorResponse(RoomError::NotInRoom);
    }
    const Room* room = rooms_.findRoom(*code);
    if (room->gameState.started && rooms_.updatePlayerState(playerId, claim.networth, claim.breakdown)) {
        requestLeaderboard(*code);
    }

    nlohmann::json response{ { "success", true }, { "accepted", true }, { "validation", nullptr } };
    RuntimePtr rt = findRuntime(*code);
    if (!claim.hasHoldings || !rt || !rt->lastPrices) {
        return response;
    }

    room = rooms_.findRoom(*code);
    SelectedAssets selected;
    if (room->gameState.selectedAssets.is_object()) {
        selected = room->gameState.selectedAssets.get<SelectedAssets>();
    }
    ValidationResult result = fullValidation(claim.networth,
                                             claim.breakdown,
                                             claim.pocketCash,
                                             claim.savingsBalance,
                                             claim.fixedDeposits,
                                             claim.holdings,
                                             *rt->lastPrices,
                                             selected,
                                             room->gameState.currentYear,
                                             room->gameState.currentMonth);
    if (!result.valid) {
        spdlog::warn("Room {}: player {} claimed net worth {:.2f}, server computed {:.2f} ({:.2f}% off)",
                     *code,
                     hashForLogging(playerId),
                     result.clientNetworth,
                     result.serverNetworth,
                     result.deviation);
    }
    response["serverNetworth"] = result.serverNetworth;
    response["validation"] = result;
    return response;
}

void SessionCoordinator::startTimeProgression(const std::string& roomCode, std::int64_t monthDurationMs) {
    if (stopped_) {
        return;
    }
    RuntimePtr rt = runtimeFor(roomCode);
    if (rt->ticking) {
        rt->tickTimer.cancel();
    }
    rt->monthDuration = std::chrono::milliseconds(std::clamp<std::int64_t>(monthDurationMs, 1, kMaxDurationMs));
    rt->ticking = true;
    rt->nextTickAt = std::chrono::steady_clock::now() + rt->monthDuration;
    spdlog::info("Room {}: time progression every {} ms", roomCode, rt->monthDuration.count());
    scheduleTick(roomCode, rt);
}

void SessionCoordinator::scheduleTick(const std::string& roomCode, const RuntimePtr& rt) {
    rt->tickTimer.expires_at(rt->nextTickAt);
    rt->tickTimer.async_wait(
        boost::asio::bind_executor(strand_, [this, roomCode, rt](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || !rt->ticking) {
                return;
            }
            if (ec) {
                spdlog::error("Room {}: tick timer failed: {}", roomCode, ec.message());
                rt->ticking = false;
                return;
            }

            runTick(roomCode);
            if (!rt->ticking) {
                return;
            }

            const auto now = std::chrono::steady_clock::now();
            rt->nextTickAt += rt->monthDuration;
            while (rt->nextTickAt <= now) {
                rt->nextTickAt += rt->monthDuration;
            }
            scheduleTick(roomCode, rt);
        }));
}

int SessionCoordinator::calendarYear(const Room& room, int simulatedYear) const {
    if (!room.adminSettings || room.adminSettings->gameStartYear <= 0) {
        return simulatedYear;
    }
    return room.adminSettings->gameStartYear + simulatedYear - 1;
}

void SessionCoordinator::sendPriceTick(const std::string& roomCode,
                                       const std::vector<std::string>& recipients,
                                       int year,
                                       int month,
                                       const PriceSnapshot& snapshot) {
    auto payload = keys_.encryptPriceData(roomCode, snapshot);
    if (!payload) {
        spdlog::debug("Room {}: no session key, price tick not sent", roomCode);
        return;
    }
    sendTo(recipients, "priceTick", { { "year", year }, { "month", month }, { "payload", *payload } });
}

TickResult SessionCoordinator::runTick(const std::string& roomCode) {
    const Room* room = rooms_.findRoom(roomCode);
    if (room == nullptr) {
        stopTicking(roomCode);
        return TickResult::NoRoom;
    }
    if (!room->gameState.started || room->gameState.ended) {
        stopTicking(roomCode);
        return TickResult::NotRunning;
    }

    RuntimePtr rt = runtimeFor(roomCode);
    if (rt->tickInFlight) {
        spdlog::warn("Room {}: previous tick still running, skipping", roomCode);
        return TickResult::Skipped;
    }
    if (room->gameState.paused) {
        return TickResult::Paused;
    }
    InFlightGuard guard(rt->tickInFlight);

    ClockStep step = rooms_.advanceClock(roomCode);
    if (step.outcome == ClockOutcome::Terminal) {
        finishGame(roomCode, step.year, step.month);
        return TickResult::Ended;
    }
    if (step.outcome != ClockOutcome::Advanced) {
        stopTicking(roomCode);
        return TickResult::NotRunning;
    }

    room = rooms_.findRoom(roomCode);
    auto symbols = keys_.roomSymbols(roomCode);
    if (symbols) {
        try {
            PriceSnapshot snapshot = prices_.getPricesForDate(*symbols, calendarYear(*room, step.year), step.month);
            rt->lastPrices = snapshot;
            sendPriceTick(roomCode, rooms_.roster(roomCode), step.year, step.month, snapshot);
        } catch (const std::exception& ex) {
            spdlog::error("Room {}: price fetch for year {} month {} failed, tick sent without prices: {}",
                          roomCode,
                          step.year,
                          step.month,
                          ex.what());
        }
    } else {
        spdlog::warn("Room {}: no session key, skipping price tick", roomCode);
    }

    broadcast(roomCode, "timeProgression", { { "year", step.year }, { "month", step.month } });

    for (const auto& fired : rooms_.applyLifeEvents(roomCode, step.year, step.month)) {
        sink_.sendToPlayer(fired.playerId,
                           "lifeEventTriggered",
                           { { "event", fired.event }, { "postPocketCash", fired.postPocketCash } });
    }

    room = rooms_.findRoom(roomCode);
    if (room != nullptr) {
        broadcast(roomCode, "gameStateUpdate", { { "gameState", room->gameState } });
    }
    spdlog::debug("Room {}: advanced to year {} month {}", roomCode, step.year, step.month);
    return TickResult::Advanced;
}

void SessionCoordinator::finishGame(const std::string& roomCode, int finalYear, int finalMonth) {
    stopTicking(roomCode);
    rooms_.endGame(roomCode);

    broadcastLeaderboardNow(roomCode);
    broadcast(roomCode, "gameEnded", { { "finalYear", finalYear }, { "finalMonth", finalMonth } });

    const Room* room = rooms_.findRoom(roomCode);
    nlohmann::json settings = room->adminSettings ? nlohmann::json(*room->adminSettings) : nlohmann::json();
    const std::int64_t completedAt = nowMillis();

    std::vector<SessionRecord> fallback;
    bool persisted = true;
    for (const auto& p : rooms_.getLeaderboard(roomCode)) {
        SessionRecord record;
        record.roomId = roomCode;
        record.playerId = p.id;
        record.playerName = p.name;
        record.finalNetworth = p.networth;
        record.breakdown = p.portfolioBreakdown;
        record.adminSettings = settings;
        record.completedAtMs = completedAt;
        fallback.push_back(record);
        try {
            store_.finalizeSession(std::move(record));
        } catch (const std::exception& ex) {
            persisted = false;
            spdlog::error("Room {}: failed to persist a session record: {}", roomCode, ex.what());
        }
    }

    std::vector<SessionRecord> records;
    if (persisted) {
        try {
            records = store_.readLatestByPlayer(roomCode);
        } catch (const std::exception& ex) {
            persisted = false;
            spdlog::error("Room {}: failed to read back session records: {}", roomCode, ex.what());
        }
    }
    if (!persisted) {
        records = std::move(fallback);
    }
    broadcast(roomCode, "finalLeaderboard", { { "records", records } });

    RuntimePtr rt = findRuntime(roomCode);
    if (rt) {
        rt->lastPrices.reset();
    }
    keys_.cleanupRoomKeys(roomCode);
    spdlog::info("Room {}: finalized {} player record(s)", roomCode, records.size());
}

} // namespace tr
