#pragma once

#include "session_coordinator.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tr {

// Maps inbound client messages {"event", "data", "id"?} onto coordinator
// handlers. Must run on the coordinator's strand.
class MessageRouter {
public:
    explicit MessageRouter(SessionCoordinator& coordinator);

    // {"id", "response"} when the message carried an id, nullopt otherwise.
    std::optional<nlohmann::json> dispatch(const std::string& playerId, const nlohmann::json& message);

    // Parses one line of text first; unparseable input answers with an
    // error and id null.
    std::optional<nlohmann::json> dispatchText(const std::string& playerId, const std::string& line);

    void disconnect(const std::string& playerId);

private:
    nlohmann::json handle(const std::string& playerId, const std::string& event, const nlohmann::json& data);

    SessionCoordinator& coordinator_;
};

// Builds a NetworthClaim from a submitNetworth payload. Holdings are
// validated only when "holdings" is present.
NetworthClaim parseNetworthClaim(const nlohmann::json& data);

} // namespace tr
