#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace tr {

// Outbound delivery to a single connected player. Unknown or disconnected
// players are ignored by implementations.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void sendToPlayer(const std::string& playerId, const std::string& event, const nlohmann::json& payload) = 0;
};

} // namespace tr
