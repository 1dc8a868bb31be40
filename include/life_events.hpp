#pragma once

#include "random_source.hpp"
#include "room.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

// Produces a player's life-event schedule. May throw; callers isolate
// failures per player.
class LifeEventGenerator {
public:
    virtual ~LifeEventGenerator() = default;
    virtual std::vector<LifeEvent> generate(int count, const nlohmann::json& unlockSchedule) = 0;
};

// Draws from a fixed pool of gains and losses, one event per (year, month)
// slot, keeping month 1 of every unlock year free. Result is sorted by
// (year, month).
class DefaultLifeEventGenerator : public LifeEventGenerator {
public:
    DefaultLifeEventGenerator(RandomSource& rng, int totalYears);
    std::vector<LifeEvent> generate(int count, const nlohmann::json& unlockSchedule) override;

private:
    int randomYear();
    int randomMonth();

    RandomSource& rng_;
    int totalYears_;
};

} // namespace tr
