#pragma once

#include "portfolio.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

struct QuizStatus {
    std::optional<std::string> currentQuiz;
    bool isCompleted = false;
};

struct PlayerInfo {
    std::string id;
    std::string name;
    bool isHost = false;
    bool isReady = false;
    double networth = 0.0;
    PortfolioBreakdown portfolioBreakdown;
    QuizStatus quizStatus;
};

// Frozen into the room when the game starts.
struct AdminSettings {
    std::vector<std::string> selectedCategories;
    int gameStartYear = 0;
    bool hideCurrentYear = false;
    double initialPocketCash = 0.0;
    double recurringIncome = 0.0;
    bool enableQuiz = true;
    bool enableIntro = false;
    std::optional<int> eventsCount;
    std::optional<std::int64_t> monthDurationMs;
};

enum class LifeEventType { Gain, Loss };

struct LifeEvent {
    std::string id;
    LifeEventType type = LifeEventType::Gain;
    std::string message;
    double amount = 0.0; // signed
    int gameYear = 1;
    int gameMonth = 1;
    bool triggered = false;
};

enum class PauseReason { None, Quiz, Manual, Intro };

// nullptr for None.
const char* pauseReasonName(PauseReason reason);

struct GameState {
    bool started = false;
    bool ended = false;
    bool paused = false;
    PauseReason pauseReason = PauseReason::None;
    int currentYear = 1;
    int currentMonth = 1;
    std::vector<std::string> playersWaitingForQuiz;
    std::vector<std::string> playersWaitingForIntro;

    // Stored and forwarded, never interpreted here.
    nlohmann::json selectedAssets;
    nlohmann::json assetUnlockSchedule;
    nlohmann::json yearlyQuotes;
    nlohmann::json quizQuestionIndices;

    std::map<std::string, std::vector<LifeEvent>> lifeEvents;
};

// Shared state a host may supply with startGame.
struct InitialGameState {
    nlohmann::json selectedAssets;
    nlohmann::json assetUnlockSchedule;
    nlohmann::json yearlyQuotes;
    nlohmann::json quizQuestionIndices;
};

struct Room {
    std::string code;
    std::string hostId;
    std::vector<PlayerInfo> players; // join order
    std::optional<AdminSettings> adminSettings;
    GameState gameState;
    std::int64_t createdAtMs = 0;

    const PlayerInfo* findPlayer(const std::string& playerId) const;
    PlayerInfo* findPlayer(const std::string& playerId);
};

void to_json(nlohmann::json& j, const QuizStatus& status);
void to_json(nlohmann::json& j, const PlayerInfo& player);
void to_json(nlohmann::json& j, const AdminSettings& settings);
void from_json(const nlohmann::json& j, AdminSettings& settings);
void to_json(nlohmann::json& j, const LifeEvent& event);
// Per-player life events are private and are left out of the serialized state.
void to_json(nlohmann::json& j, const GameState& state);
void from_json(const nlohmann::json& j, InitialGameState& initial);

} // namespace tr
