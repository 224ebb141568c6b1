// src/sim/ActivityFeed.cpp
#include "sim/ActivityFeed.h"

#include <spdlog/spdlog.h>

namespace promenade::sim {

ActivityFeed::ActivityFeed(std::size_t capacity, std::size_t perAgent)
    : capacity_(capacity), perAgent_(perAgent)
{
}

void ActivityFeed::Push(FeedEntry e)
{
    if (capacity_ == 0) return;
    if (entries_.size() >= capacity_)
        entries_.pop_front();
    entries_.push_back(std::move(e));
}

void ActivityFeed::AddDecision(double time, AgentId agent, const std::string& thought, const std::string& intent)
{
    spdlog::info("[A{}] {} -> {}", agent, thought, intent);

    if (!thought.empty() && perAgent_ > 0) {
        auto& hist = thoughts_[agent];
        if (hist.size() >= perAgent_)
            hist.pop_front();
        hist.push_back(thought);
    }

    FeedEntry e;
    e.kind = FeedEntry::Kind::Decision;
    e.time = time;
    e.agent = agent;
    e.text = thought;
    e.intent = intent;
    Push(std::move(e));
}

void ActivityFeed::AddChat(double time, AgentId a, AgentId b, const std::string& aLine, const std::string& bLine)
{
    spdlog::info("[chat A{} <-> A{}] \"{}\" / \"{}\"", a, b, aLine, bLine);

    FeedEntry e;
    e.kind = FeedEntry::Kind::Chat;
    e.time = time;
    e.agent = a;
    e.partner = b;
    e.text = aLine + " / " + bLine;
    Push(std::move(e));
}

std::vector<std::string> ActivityFeed::ThoughtsOf(AgentId agent) const
{
    auto it = thoughts_.find(agent);
    if (it == thoughts_.end()) return {};
    return { it->second.begin(), it->second.end() };
}

} // namespace promenade::sim
