#include "room_registry.hpp"

#include "clock.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace tr {

namespace {

bool eraseId(std::vector<std::string>& ids, const std::string& id) {
    auto it = std::find(ids.begin(), ids.end(), id);
    if (it == ids.end()) {
        return false;
    }
    ids.erase(it);
    return true;
}

void resume(GameState& state) {
    state.paused = false;
    state.pauseReason = PauseReason::None;
    state.playersWaitingForQuiz.clear();
    state.playersWaitingForIntro.clear();
}

} // namespace

RoomRegistry::RoomRegistry(RandomSource& rng, LifeEventGenerator& lifeEvents, double startingCash, int totalYears)
    : rng_(rng)
    , lifeEvents_(lifeEvents)
    , startingCash_(startingCash)
    , totalYears_(totalYears) {
    if (totalYears_ <= 0) {
        throw std::invalid_argument("totalYears must be positive");
    }
}

std::string RoomRegistry::generateRoomCode() {
    const std::size_t alphabetSize = std::strlen(kRoomCodeAlphabet);
    for (int attempt = 0; attempt < kMaxRoomCodeAttempts; ++attempt) {
        std::string code;
        code.reserve(kRoomCodeLength);
        for (std::size_t i = 0; i < kRoomCodeLength; ++i) {
            code.push_back(kRoomCodeAlphabet[rng_.below(static_cast<std::uint32_t>(alphabetSize))]);
        }
        if (rooms_.count(code) == 0) {
            return code;
        }
    }
    throw std::runtime_error("Unable to allocate a unique room code");
}

PlayerInfo RoomRegistry::makePlayer(const std::string& id, const std::string& name, bool isHost, double cash) {
    PlayerInfo player;
    player.id = id;
    player.name = name;
    player.isHost = isHost;
    player.networth = cash;
    player.portfolioBreakdown.cash = cash;
    return player;
}

Room* RoomRegistry::roomFor(const std::string& playerId) {
    auto idx = playerToRoom_.find(playerId);
    if (idx == playerToRoom_.end()) {
        return nullptr;
    }
    auto it = rooms_.find(idx->second);
    return it == rooms_.end() ? nullptr : &it->second;
}

Outcome<std::string> RoomRegistry::createRoom(const std::string& hostId, const std::string& hostName) {
    if (playerToRoom_.count(hostId) != 0) {
        return Outcome<std::string>::failure(RoomError::PlayerAlreadyPresent);
    }

    Room room;
    room.code = generateRoomCode();
    room.hostId = hostId;
    room.players.push_back(makePlayer(hostId, hostName, true, 0.0));
    room.createdAtMs = nowMillis();

    const std::string code = room.code;
    rooms_.emplace(code, std::move(room));
    playerToRoom_[hostId] = code;
    spdlog::info("Room {} created", code);
    return Outcome<std::string>::success(code);
}

Outcome<Room> RoomRegistry::joinRoom(const std::string& roomCode,
                                     const std::string& playerId,
                                     const std::string& playerName) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return Outcome<Room>::failure(RoomError::RoomNotFound);
    }
    Room& room = it->second;
    if (room.gameState.ended) {
        return Outcome<Room>::failure(RoomError::GameEnded);
    }
    if (room.gameState.started) {
        return Outcome<Room>::failure(RoomError::GameAlreadyStarted);
    }
    if (room.findPlayer(playerId) != nullptr || playerToRoom_.count(playerId) != 0) {
        return Outcome<Room>::failure(RoomError::PlayerAlreadyPresent);
    }

    room.players.push_back(makePlayer(playerId, playerName, false, startingCash_));
    playerToRoom_[playerId] = roomCode;
    spdlog::debug("Room {}: player joined ({} players)", roomCode, room.players.size());
    return Outcome<Room>::success(room);
}

std::optional<LeaveResult> RoomRegistry::leaveRoom(const std::string& playerId) {
    auto idx = playerToRoom_.find(playerId);
    if (idx == playerToRoom_.end()) {
        return std::nullopt;
    }
    const std::string code = idx->second;
    playerToRoom_.erase(idx);

    auto it = rooms_.find(code);
    if (it == rooms_.end()) {
        return std::nullopt;
    }
    Room& room = it->second;

    LeaveResult result;
    result.roomCode = code;
    result.wasHost = room.hostId == playerId;

    room.players.erase(std::remove_if(room.players.begin(),
                                      room.players.end(),
                                      [&](const PlayerInfo& p) { return p.id == playerId; }),
                       room.players.end());
    room.gameState.lifeEvents.erase(playerId);
    for (const auto& p : room.players) {
        result.remaining.push_back(p.id);
    }

    GameState& state = room.gameState;
    if (state.pauseReason == PauseReason::Quiz && eraseId(state.playersWaitingForQuiz, playerId) &&
        state.playersWaitingForQuiz.empty()) {
        resume(state);
        result.resumed = true;
    } else if (state.pauseReason == PauseReason::Intro && eraseId(state.playersWaitingForIntro, playerId) &&
               state.playersWaitingForIntro.empty()) {
        resume(state);
        result.resumed = true;
    }

    if (result.wasHost || room.players.empty()) {
        deleteRoom(code);
        result.roomDeleted = true;
        result.resumed = false;
    }
    return result;
}

RoomError RoomRegistry::validateStart(const std::string& roomCode, const std::string& requesterId) const {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return RoomError::RoomNotFound;
    }
    const Room& room = it->second;
    if (room.hostId != requesterId) {
        return RoomError::NotHost;
    }
    if (room.gameState.ended) {
        return RoomError::GameEnded;
    }
    if (room.gameState.started) {
        return RoomError::GameAlreadyStarted;
    }
    if (room.players.size() < kMinPlayersToStart) {
        return RoomError::NotEnoughPlayers;
    }
    return RoomError::None;
}

RoomError RoomRegistry::startGame(const std::string& roomCode, const AdminSettings& settings) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return RoomError::RoomNotFound;
    }
    Room& room = it->second;
    if (room.gameState.ended) {
        return RoomError::GameEnded;
    }
    if (room.gameState.started) {
        return RoomError::GameAlreadyStarted;
    }
    if (room.players.size() < kMinPlayersToStart) {
        return RoomError::NotEnoughPlayers;
    }

    room.adminSettings = settings;
    GameState& state = room.gameState;
    state.started = true;
    state.currentYear = 1;
    state.currentMonth = 1;
    resume(state);

    if (settings.initialPocketCash > 0.0) {
        for (auto& p : room.players) {
            if (!p.isHost) {
                p.portfolioBreakdown = PortfolioBreakdown{};
                p.portfolioBreakdown.cash = settings.initialPocketCash;
                p.networth = settings.initialPocketCash;
            }
        }
    }

    if (settings.enableIntro) {
        for (const auto& p : room.players) {
            if (!p.isHost) {
                state.playersWaitingForIntro.push_back(p.id);
            }
        }
        if (!state.playersWaitingForIntro.empty()) {
            state.paused = true;
            state.pauseReason = PauseReason::Intro;
        }
    }

    spdlog::info("Room {}: game started with {} players (start year {})",
                 roomCode,
                 room.players.size(),
                 settings.gameStartYear);
    return RoomError::None;
}

bool RoomRegistry::applyInitialState(const std::string& roomCode, const InitialGameState& initial) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return false;
    }
    GameState& state = it->second.gameState;
    if (!initial.selectedAssets.is_null()) {
        state.selectedAssets = initial.selectedAssets;
    }
    if (!initial.assetUnlockSchedule.is_null()) {
        state.assetUnlockSchedule = initial.assetUnlockSchedule;
    }
    if (!initial.yearlyQuotes.is_null()) {
        state.yearlyQuotes = initial.yearlyQuotes;
    }
    if (!initial.quizQuestionIndices.is_null()) {
        state.quizQuestionIndices = initial.quizQuestionIndices;
    }
    return true;
}

bool RoomRegistry::generateLifeEventsForRoom(const std::string& roomCode, int eventsCount) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return false;
    }
    Room& room = it->second;

    std::map<std::string, std::vector<LifeEvent>> mapping;
    for (const auto& p : room.players) {
        try {
            mapping[p.id] = lifeEvents_.generate(eventsCount, room.gameState.assetUnlockSchedule);
        } catch (const std::exception& ex) {
            spdlog::warn("Room {}: life event generation failed for one player: {}", roomCode, ex.what());
            mapping[p.id] = {};
        }
    }
    room.gameState.lifeEvents = std::move(mapping);
    return true;
}

bool RoomRegistry::updatePlayerState(const std::string& playerId,
                                     double networth,
                                     const PortfolioBreakdown& breakdown) {
    Room* room = roomFor(playerId);
    if (room == nullptr || room->gameState.ended) {
        return false;
    }
    PlayerInfo* player = room->findPlayer(playerId);
    if (player == nullptr) {
        return false;
    }
    player->networth = networth;
    player->portfolioBreakdown = breakdown;
    return true;
}

std::vector<PlayerInfo> RoomRegistry::getLeaderboard(const std::string& roomCode) const {
    std::vector<PlayerInfo> board;
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return board;
    }
    for (const auto& p : it->second.players) {
        if (!p.isHost) {
            board.push_back(p);
        }
    }
    std::stable_sort(board.begin(), board.end(), [](const PlayerInfo& a, const PlayerInfo& b) {
        return a.networth > b.networth;
    });
    return board;
}

bool RoomRegistry::markQuizStarted(const std::string& playerId, const std::string& category) {
    Room* room = roomFor(playerId);
    if (room == nullptr || !room->gameState.started || room->gameState.ended) {
        return false;
    }
    PlayerInfo* player = room->findPlayer(playerId);
    if (player == nullptr) {
        return false;
    }
    player->quizStatus.currentQuiz = category;
    player->quizStatus.isCompleted = false;

    GameState& state = room->gameState;
    state.playersWaitingForIntro.clear();
    state.paused = true;
    state.pauseReason = PauseReason::Quiz;
    if (std::find(state.playersWaitingForQuiz.begin(), state.playersWaitingForQuiz.end(), playerId) ==
        state.playersWaitingForQuiz.end()) {
        state.playersWaitingForQuiz.push_back(playerId);
    }
    return true;
}

bool RoomRegistry::markQuizCompleted(const std::string& playerId, const std::string& category) {
    Room* room = roomFor(playerId);
    if (room == nullptr) {
        return false;
    }
    PlayerInfo* player = room->findPlayer(playerId);
    if (player == nullptr) {
        return false;
    }
    if (player->quizStatus.currentQuiz && *player->quizStatus.currentQuiz != category) {
        spdlog::debug("Room {}: quiz completion category differs from the started one", room->code);
    }
    player->quizStatus.currentQuiz.reset();
    player->quizStatus.isCompleted = true;

    GameState& state = room->gameState;
    if (state.pauseReason != PauseReason::Quiz || !eraseId(state.playersWaitingForQuiz, playerId)) {
        return false;
    }
    if (!state.playersWaitingForQuiz.empty()) {
        return false;
    }
    resume(state);
    return true;
}

bool RoomRegistry::markIntroCompleted(const std::string& playerId) {
    Room* room = roomFor(playerId);
    if (room == nullptr) {
        return false;
    }
    GameState& state = room->gameState;
    if (state.pauseReason != PauseReason::Intro || !eraseId(state.playersWaitingForIntro, playerId)) {
        return false;
    }
    if (!state.playersWaitingForIntro.empty()) {
        return false;
    }
    resume(state);
    return true;
}

bool RoomRegistry::togglePause(const std::string& roomCode) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return false;
    }
    GameState& state = it->second.gameState;
    if (!state.started || state.ended || state.pauseReason == PauseReason::Quiz) {
        return false;
    }
    if (state.pauseReason == PauseReason::Intro) {
        resume(state);
        return true;
    }
    state.paused = !state.paused;
    state.pauseReason = state.paused ? PauseReason::Manual : PauseReason::None;
    return true;
}

ClockStep RoomRegistry::advanceClock(const std::string& roomCode) {
    ClockStep step;
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return step;
    }
    GameState& state = it->second.gameState;
    if (!state.started || state.ended) {
        step.outcome = ClockOutcome::NotRunning;
        return step;
    }

    int year = state.currentYear;
    int month = state.currentMonth + 1;
    if (month > 12) {
        month = 1;
        ++year;
    }
    if (year > totalYears_) {
        step.outcome = ClockOutcome::Terminal;
        step.year = year - 1;
        step.month = 12;
        return step;
    }

    state.currentYear = year;
    state.currentMonth = month;
    step.outcome = ClockOutcome::Advanced;
    step.year = year;
    step.month = month;
    return step;
}

bool RoomRegistry::endGame(const std::string& roomCode) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end() || it->second.gameState.ended) {
        return false;
    }
    GameState& state = it->second.gameState;
    state.started = false;
    state.ended = true;
    resume(state);
    spdlog::info("Room {}: game ended at year {} month {}", roomCode, state.currentYear, state.currentMonth);
    return true;
}

std::vector<TriggeredLifeEvent> RoomRegistry::applyLifeEvents(const std::string& roomCode, int year, int month) {
    std::vector<TriggeredLifeEvent> fired;
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return fired;
    }
    Room& room = it->second;

    for (auto& p : room.players) {
        auto events = room.gameState.lifeEvents.find(p.id);
        if (events == room.gameState.lifeEvents.end()) {
            continue;
        }
        for (auto& ev : events->second) {
            if (ev.triggered || ev.gameYear != year || ev.gameMonth != month) {
                continue;
            }
            ev.triggered = true;
            p.portfolioBreakdown.cash += ev.amount;
            p.networth += ev.amount;
            fired.push_back(TriggeredLifeEvent{ p.id, ev, p.portfolioBreakdown.cash });
        }
    }
    if (!fired.empty()) {
        spdlog::info("Room {}: {} life event(s) applied at year {} month {}", roomCode, fired.size(), year, month);
    }
    return fired;
}

std::size_t RoomRegistry::cleanupOldRooms(std::int64_t maxAgeMs, std::int64_t nowMs) {
    std::vector<std::string> stale;
    for (const auto& entry : rooms_) {
        if (!entry.second.gameState.started && nowMs - entry.second.createdAtMs > maxAgeMs) {
            stale.push_back(entry.first);
        }
    }
    for (const auto& code : stale) {
        deleteRoom(code);
    }
    if (!stale.empty()) {
        spdlog::info("Swept {} idle room(s)", stale.size());
    }
    return stale.size();
}

bool RoomRegistry::deleteRoom(const std::string& roomCode) {
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return false;
    }
    for (const auto& p : it->second.players) {
        auto idx = playerToRoom_.find(p.id);
        if (idx != playerToRoom_.end() && idx->second == roomCode) {
            playerToRoom_.erase(idx);
        }
    }
    rooms_.erase(it);
    spdlog::info("Room {} deleted", roomCode);
    if (onRoomDeleted_) {
        onRoomDeleted_(roomCode);
    }
    return true;
}

void RoomRegistry::setRoomDeletedListener(RoomDeletedListener listener) {
    onRoomDeleted_ = std::move(listener);
}

const Room* RoomRegistry::findRoom(const std::string& roomCode) const {
    auto it = rooms_.find(roomCode);
    return it == rooms_.end() ? nullptr : &it->second;
}

std::optional<std::string> RoomRegistry::roomOf(const std::string& playerId) const {
    auto it = playerToRoom_.find(playerId);
    if (it == playerToRoom_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> RoomRegistry::roster(const std::string& roomCode) const {
    std::vector<std::string> ids;
    auto it = rooms_.find(roomCode);
    if (it == rooms_.end()) {
        return ids;
    }
    for (const auto& p : it->second.players) {
        ids.push_back(p.id);
    }
    return ids;
}

std::vector<std::string> RoomRegistry::allRoomCodes() const {
    std::vector<std::string> codes;
    codes.reserve(rooms_.size());
    for (const auto& entry : rooms_) {
        codes.push_back(entry.first);
    }
    std::sort(codes.begin(), codes.end());
    return codes;
}

} // namespace tr
