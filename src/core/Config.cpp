#include "core/Config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace promenade::core {

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view Trimmed(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <class Int>
static bool ParseInt(std::string_view sv, Int& out) noexcept
{
    sv = Trimmed(sv);

    Int v = 0;
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || begin == end)
        return false;

    out = v;
    return true;
}

static bool ParseFloat(std::string_view sv, float& out)
{
    sv = Trimmed(sv);
    if (sv.empty())
        return false;

    // strtof needs a terminated buffer; values are short.
    const std::string tmp(sv);
    char* end = nullptr;
    const float v = std::strtof(tmp.c_str(), &end);
    if (end != tmp.c_str() + tmp.size())
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = Trimmed(sv);

    // Common INI boolean tokens (case-insensitive):
    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

bool ApplyConfigValue(SimConfig& cfg, std::string_view key, std::string_view v)
{
    key = Trimmed(key);

    if (key == "seed")                 return ParseInt(v, cfg.seed);
    if (key == "agents")               return ParseInt(v, cfg.agents);
    if (key == "eligible_fraction")    return ParseFloat(v, cfg.eligibleFraction);
    if (key == "max_eligible_agents")  return ParseInt(v, cfg.maxEligibleAgents);
    if (key == "speed_multiplier")     return ParseFloat(v, cfg.speedMultiplier);
    if (key == "need_eval_period_s")   return ParseFloat(v, cfg.needEvalPeriod);
    if (key == "need_rate_scale")      return ParseFloat(v, cfg.needRateScale);
    if (key == "activation_threshold") return ParseFloat(v, cfg.activationThreshold);
    if (key == "satisfy_decrement")    return ParseFloat(v, cfg.satisfyDecrement);
    if (key == "idle_replan_s")        return ParseFloat(v, cfg.idleReplanSeconds);
    if (key == "cell_m")               return ParseFloat(v, cfg.cellMeters);
    if (key == "path_workers")         return ParseInt(v, cfg.pathWorkers);
    if (key == "meet_distance")        return ParseFloat(v, cfg.meetDistance);
    if (key == "meet_time_s")          return ParseFloat(v, cfg.meetSeconds);
    if (key == "brain_enabled")        return ParseBool(v, cfg.brainEnabled);
    if (key == "brain_timeout_ms")     return ParseInt(v, cfg.brainTimeoutMs);
    if (key == "batch_size")           return ParseInt(v, cfg.batchSize);
    if (key == "max_qps")              return ParseFloat(v, cfg.maxQps);
    if (key == "jitter_min_s")         return ParseFloat(v, cfg.jitterMinSeconds);
    if (key == "jitter_max_s")         return ParseFloat(v, cfg.jitterMaxSeconds);
    if (key == "metrics_flush_s")      return ParseFloat(v, cfg.metricsFlushSeconds);
    if (key == "brain_url")
    {
        const auto t = Trimmed(v);
        if (t.empty())
            return false;
        cfg.brainUrl.assign(t);
        return true;
    }

    return false;
}

bool LoadConfig(SimConfig& cfg, const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f)
        return false;

    std::ostringstream oss;
    oss << f.rdbuf();
    std::istringstream iss(oss.str());

    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        // Comments / empty
        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';' || tmp[0] == '[') continue;

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments, e.g.:
        //   max_qps=4        # requests per second
        //   batch_size=32    ; agents per decide call
        // brain_url is exempt from "//" so http:// survives.
        {
            std::size_t cut = std::string::npos;
            auto consider = [&](std::size_t p)
            {
                if (p == std::string::npos) return;
                if (cut == std::string::npos || p < cut) cut = p;
            };

            consider(v.find('#'));
            consider(v.find(';'));
            if (k != "brain_url")
                consider(v.find("//"));

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (!ApplyConfigValue(cfg, k, v))
            spdlog::warn("LoadConfig: {}:{} ignoring '{}={}'", path.string(), lineNo, k, v);
    }

    return true;
}

bool SaveConfig(const SimConfig& cfg, const std::filesystem::path& path)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                          path.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    std::ostringstream oss;
    oss << "seed="                 << cfg.seed << "\n";
    oss << "agents="               << cfg.agents << "\n";
    oss << "eligible_fraction="    << cfg.eligibleFraction << "\n";
    oss << "max_eligible_agents="  << cfg.maxEligibleAgents << "\n";
    oss << "speed_multiplier="     << cfg.speedMultiplier << "\n";
    oss << "need_eval_period_s="   << cfg.needEvalPeriod << "\n";
    oss << "need_rate_scale="      << cfg.needRateScale << "\n";
    oss << "activation_threshold=" << cfg.activationThreshold << "\n";
    oss << "satisfy_decrement="    << cfg.satisfyDecrement << "\n";
    oss << "idle_replan_s="        << cfg.idleReplanSeconds << "\n";
    oss << "cell_m="               << cfg.cellMeters << "\n";
    oss << "path_workers="         << cfg.pathWorkers << "\n";
    oss << "meet_distance="        << cfg.meetDistance << "\n";
    oss << "meet_time_s="          << cfg.meetSeconds << "\n";
    oss << "brain_enabled="        << (cfg.brainEnabled ? 1 : 0) << "\n";
    oss << "brain_url="            << cfg.brainUrl << "\n";
    oss << "brain_timeout_ms="     << cfg.brainTimeoutMs << "\n";
    oss << "batch_size="           << cfg.batchSize << "\n";
    oss << "max_qps="              << cfg.maxQps << "\n";
    oss << "jitter_min_s="         << cfg.jitterMinSeconds << "\n";
    oss << "jitter_max_s="         << cfg.jitterMaxSeconds << "\n";
    oss << "metrics_flush_s="      << cfg.metricsFlushSeconds << "\n";

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("SaveConfig: cannot open {} for writing", path.string());
        return false;
    }
    f << oss.str();
    return static_cast<bool>(f);
}

} // namespace promenade::core
