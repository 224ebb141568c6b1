// src/sim/ActivityFeed.h
#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

#include "sim/Components.h"

namespace promenade::sim {

struct FeedEntry {
    enum class Kind { Decision, Chat };

    Kind        kind = Kind::Decision;
    double      time = 0.0;
    AgentId     agent = 0;
    AgentId     partner = 0;    // Chat only
    std::string text;           // thought, or "A: ... / B: ..." for chats
    std::string intent;         // Decision only
};

// Bounded log of reasoning-service output for display. The global ring keeps
// the newest `capacity` entries; each agent keeps its last `perAgent` thoughts.
class ActivityFeed {
public:
    explicit ActivityFeed(std::size_t capacity = 200, std::size_t perAgent = 10);

    void AddDecision(double time, AgentId agent, const std::string& thought, const std::string& intent);
    void AddChat(double time, AgentId a, AgentId b, const std::string& aLine, const std::string& bLine);

    [[nodiscard]] const std::deque<FeedEntry>& Entries() const noexcept { return entries_; }
    [[nodiscard]] std::vector<std::string> ThoughtsOf(AgentId agent) const;

private:
    void Push(FeedEntry e);

    std::size_t capacity_;
    std::size_t perAgent_;
    std::deque<FeedEntry> entries_;
    std::unordered_map<AgentId, std::deque<std::string>> thoughts_;
};

} // namespace promenade::sim
