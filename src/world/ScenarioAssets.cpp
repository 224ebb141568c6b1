#include "world/ScenarioAssets.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace promenade::world {

using nlohmann::json;

namespace {

std::optional<Poi> ParsePoi(const json& e, const NavGrid& grid, std::size_t index)
{
    if (!e.is_object() || !e.contains("ix") || !e.contains("iy") ||
        !e["ix"].is_number() || !e["iy"].is_number()) {
        spdlog::warn("pois[{}]: missing grid position, skipped", index);
        return std::nullopt;
    }

    Poi p;
    const std::string type = e.value("type", std::string{});
    if (auto cat = parse_category(type)) {
        p.category = *cat;
    } else {
        spdlog::debug("pois[{}]: unknown type '{}', using other", index, type);
        p.category = PoiCategory::Other;
    }

    const pf::IVec2 raw{ e["ix"].get<int>(), e["iy"].get<int>() };
    p.cell = grid.NearestWalkable(raw);

    if (e.contains("name") && e["name"].is_string())
        p.name = e["name"].get<std::string>();
    p.added = e.value("added", false);
    return p;
}

} // namespace

NeedBiases BuildNeedBiases(const PoiRegistry& pois, const NeedBiases& tagged)
{
    NeedBiases bias = tagged;
    if (bias.empty()) {
        for (const Poi& p : pois) {
            if (!p.added) continue;
            float& b = bias[std::string(to_string(p.category))];
            b = std::max(0.2f, b + 0.2f);
        }
    }
    for (auto& [cat, w] : bias)
        w = std::clamp(w, 0.0f, 1.0f);
    return bias;
}

ScenarioAssets ParseScenario(const json& doc, const NavGrid& grid, std::string id)
{
    const json* list = nullptr;
    NeedBiases tagged;

    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object() && doc.contains("pois") && doc["pois"].is_array()) {
        list = &doc["pois"];
        if (doc.contains("tags") && doc["tags"].is_object()) {
            const json& tags = doc["tags"];
            if (tags.contains("bias") && tags["bias"].is_object()) {
                for (const auto& [k, v] : tags["bias"].items()) {
                    if (v.is_number())
                        tagged[k] = v.get<float>();
                }
            }
        }
    } else {
        throw std::runtime_error("Scenario '" + id + "': expected a POI array or {pois:[...]}");
    }

    std::vector<Poi> pois;
    pois.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        if (auto p = ParsePoi((*list)[i], grid, i))
            pois.push_back(std::move(*p));
    }

    ScenarioAssets out;
    out.id = std::move(id);
    out.pois = PoiRegistry(std::move(pois));
    out.biases = BuildNeedBiases(out.pois, tagged);
    return out;
}

ScenarioAssets LoadScenario(const std::filesystem::path& poisFile, const NavGrid& grid, std::string id)
{
    std::ifstream in(poisFile, std::ios::binary);
    if (!in)
        throw std::runtime_error("Failed to open POIs: " + poisFile.string());

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed POIs " + poisFile.string() + ": " + e.what());
    }

    auto assets = ParseScenario(doc, grid, std::move(id));
    spdlog::info("Scenario '{}': {} POIs from {}", assets.id, assets.pois.size(), poisFile.string());
    return assets;
}

} // namespace promenade::world
