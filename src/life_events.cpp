#include "life_events.hpp"

#include "clock.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace tr {

namespace {

struct PoolEntry {
    const char* message;
    double amount;
};

const PoolEntry kEventPool[] = {
    { "Diwali bonus from company", 50000 },
    { "Freelance project bonus", 40000 },
    { "Side business profit", 35000 },
    { "Performance bonus at work", 45000 },
    { "Tax refund received", 25000 },
    { "Sold old items online", 15000 },
    { "Investment dividend received", 30000 },
    { "House robbery during Diwali", -30000 },
    { "Family medical emergency", -75000 },
    { "Vehicle repair after monsoon", -20000 },
    { "Wedding shopping expenses", -50000 },
    { "Health insurance deductible", -25000 },
    { "Home repairs after flooding", -45000 },
    { "Laptop suddenly stopped working", -50000 },
    { "Legal fees for property dispute", -40000 },
    { "AC breakdown in peak summer", -10000 },
    { "Parent hospitalization costs", -80000 },
    { "Car accident - insurance excess", -22000 },
    { "Stolen mobile phone", -12000 },
    { "Urgent home appliance replacement", -28000 },
    { "Child school fees increase", -50000 },
    { "Unexpected tax liability", -30000 },
    { "Emergency dental treatment", -18000 },
    { "Bike accident repair", -14000 },
    { "Flooding damaged furniture", -40000 },
    { "Friend wedding gift expected", -10000 },
    { "Pet medical emergency", -10000 },
};

constexpr std::size_t kPoolSize = sizeof(kEventPool) / sizeof(kEventPool[0]);
constexpr int kMaxRerolls = 50;

using Slot = std::pair<int, int>;

// Unlock schedules are keyed by game year; each unlock happens in month 1.
std::set<Slot> disallowedSlots(const nlohmann::json& unlockSchedule) {
    std::set<Slot> out;
    if (!unlockSchedule.is_object()) {
        return out;
    }
    for (auto it = unlockSchedule.begin(); it != unlockSchedule.end(); ++it) {
        std::size_t consumed = 0;
        try {
            int year = std::stoi(it.key(), &consumed);
            if (consumed == it.key().size()) {
                out.emplace(year, 1);
            }
        } catch (const std::logic_error&) {
            // Non-numeric keys do not name a year.
        }
    }
    return out;
}

} // namespace

DefaultLifeEventGenerator::DefaultLifeEventGenerator(RandomSource& rng, int totalYears)
    : rng_(rng)
    , totalYears_(totalYears) {
    if (totalYears_ <= 0) {
        throw std::invalid_argument("totalYears must be positive");
    }
}

int DefaultLifeEventGenerator::randomYear() {
    return static_cast<int>(rng_.below(static_cast<std::uint32_t>(totalYears_))) + 1;
}

int DefaultLifeEventGenerator::randomMonth() {
    return static_cast<int>(rng_.below(12)) + 1;
}

std::vector<LifeEvent> DefaultLifeEventGenerator::generate(int count, const nlohmann::json& unlockSchedule) {
    std::vector<LifeEvent> events;
    if (count <= 0) {
        return events;
    }

    const std::set<Slot> disallowed = disallowedSlots(unlockSchedule);
    std::set<Slot> taken;
    std::set<std::string> usedMessages;

    int attempts = 0;
    while (static_cast<int>(events.size()) < count && attempts < count * 20) {
        ++attempts;

        const PoolEntry& candidate = kEventPool[rng_.below(static_cast<std::uint32_t>(kPoolSize))];
        if (usedMessages.count(candidate.message) != 0 && usedMessages.size() < kPoolSize) {
            continue;
        }

        Slot slot{ randomYear(), randomMonth() };
        int rerolls = 0;
        while ((disallowed.count(slot) != 0 || taken.count(slot) != 0) && rerolls < kMaxRerolls) {
            slot = Slot{ randomYear(), randomMonth() };
            ++rerolls;
        }
        if (rerolls >= kMaxRerolls) {
            // Walk forward to the next free month of the drawn year.
            slot = Slot{ randomYear(), randomMonth() };
            for (int shift = 0; shift < 12 && (disallowed.count(slot) != 0 || taken.count(slot) != 0); ++shift) {
                slot.second = slot.second % 12 + 1;
            }
            if (disallowed.count(slot) != 0 || taken.count(slot) != 0) {
                continue;
            }
        }

        LifeEvent event;
        event.id = std::to_string(nowMillis()) + "-" + secureRandomHex(3);
        event.type = candidate.amount >= 0 ? LifeEventType::Gain : LifeEventType::Loss;
        event.message = candidate.message;
        event.amount = candidate.amount;
        event.gameYear = slot.first;
        event.gameMonth = slot.second;
        events.push_back(std::move(event));

        taken.insert(slot);
        usedMessages.insert(candidate.message);
    }

    std::sort(events.begin(), events.end(), [](const LifeEvent& a, const LifeEvent& b) {
        if (a.gameYear != b.gameYear) {
            return a.gameYear < b.gameYear;
        }
        return a.gameMonth < b.gameMonth;
    });
    return events;
}

} // namespace tr
