#include "trailnav/nav/NavConfig.hpp"
#include "trailnav/core/Log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace trailnav::nav {

namespace {
    // NOTE: SaveNavConfig always writes the latest version. Older files are read
    // key-by-key, so a missing section just keeps defaults.
    constexpr int kNavConfigSchemaVersion = 1;

    constexpr std::size_t kMaxConfigBytes = 1024u * 1024u;

    double ClampD(double v, double lo, double hi) noexcept {
        if (!(v >= lo)) return lo; // also catches NaN
        if (v > hi) return hi;
        return v;
    }

    std::int32_t ClampI(std::int32_t v, std::int32_t lo, std::int32_t hi) noexcept {
        return std::clamp(v, lo, hi);
    }

    bool ReadFileToString(const std::filesystem::path& p, std::string& out)
    {
        out.clear();
        std::ifstream f(p, std::ios::binary);
        if (!f) return false;
        std::ostringstream oss;
        oss << f.rdbuf();
        out = oss.str();
        if (out.size() > kMaxConfigBytes) {
            out.clear();
            return false;
        }
        return !out.empty();
    }

    void ReadNumber(const nlohmann::json& obj, const char* key, double& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_number())
            dst = it->get<double>();
    }

    void ReadInt(const nlohmann::json& obj, const char* key, std::int32_t& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_number_integer())
            dst = static_cast<std::int32_t>(std::clamp<std::int64_t>(it->get<std::int64_t>(), INT32_MIN, INT32_MAX));
    }

    void ReadBool(const nlohmann::json& obj, const char* key, bool& dst)
    {
        if (auto it = obj.find(key); it != obj.end() && it->is_boolean())
            dst = it->get<bool>();
    }

    const nlohmann::json* Section(const nlohmann::json& j, const char* key)
    {
        if (auto it = j.find(key); it != j.end() && it->is_object())
            return &*it;
        return nullptr;
    }
}

void ClampNavConfig(NavConfig& c) noexcept
{
    c.nodeSpacing       = ClampD(c.nodeSpacing, 0.25, 64.0);
    c.searchRadius      = ClampD(c.searchRadius, 1.0, 100000.0);
    c.connectionRange   = ClampD(c.connectionRange, 1.0, 1024.0);
    c.roadCost          = ClampD(c.roadCost, 0.0, 1.0e9);
    c.roadEdgeDiscount  = ClampD(c.roadEdgeDiscount, 0.0, 1.0);
    c.roadNearestWeight = ClampD(c.roadNearestWeight, 0.0, 1.0);

    c.cheapNodeThreshold      = ClampD(c.cheapNodeThreshold, 0.0, 1.0e9);
    c.expensiveNodeMultiplier = ClampD(c.expensiveNodeMultiplier, 1.0, 1.0e6);
    c.offRoadMultiplier       = ClampD(c.offRoadMultiplier, 1.0, 1.0e6);
    c.verticalDiffThreshold   = ClampD(c.verticalDiffThreshold, 0.0, 256.0);
    c.verticalPenalty         = ClampD(c.verticalPenalty, 0.0, 1.0e6);

    c.maxInteriorDistance = ClampD(c.maxInteriorDistance, 0.0, 1024.0);
    c.exitSearchRange     = ClampI(c.exitSearchRange, 1, 256);
    c.exitVerticalScan    = ClampI(c.exitVerticalScan, 0, 16);
    c.maxExitCandidates   = ClampI(c.maxExitCandidates, 1, 64);
    c.minExitClearance    = ClampD(c.minExitClearance, 0.0, 64.0);

    c.maxVerticalStep = ClampD(c.maxVerticalStep, 0.1, 64.0);
}

bool LoadNavConfig(NavConfig& cfg, const std::filesystem::path& file)
{
    std::string text;
    if (!ReadFileToString(file, text))
    {
        // Missing file is normal: the caller keeps defaults.
        std::error_code ec;
        if (std::filesystem::exists(file, ec))
            logsys::get()->warn("LoadNavConfig: failed to read {}", file.string());
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        logsys::get()->warn("LoadNavConfig: {} is not a JSON object", file.string());
        return false;
    }

    if (auto it = j.find("version"); it != j.end() && it->is_number_integer()
        && it->get<int>() > kNavConfigSchemaVersion)
    {
        logsys::get()->info("LoadNavConfig: {} has newer version {}, reading known keys only",
                            file.string(), it->get<int>());
    }

    NavConfig tmp = cfg;

    if (const auto* g = Section(j, "graph"))
    {
        ReadNumber(*g, "nodeSpacing", tmp.nodeSpacing);
        ReadNumber(*g, "searchRadius", tmp.searchRadius);
        ReadNumber(*g, "connectionRange", tmp.connectionRange);
        ReadNumber(*g, "roadCost", tmp.roadCost);
        ReadNumber(*g, "roadEdgeDiscount", tmp.roadEdgeDiscount);
        ReadNumber(*g, "roadNearestWeight", tmp.roadNearestWeight);
    }

    if (const auto* s = Section(j, "search"))
    {
        ReadNumber(*s, "cheapNodeThreshold", tmp.cheapNodeThreshold);
        ReadNumber(*s, "expensiveNodeMultiplier", tmp.expensiveNodeMultiplier);
        ReadNumber(*s, "offRoadMultiplier", tmp.offRoadMultiplier);
        ReadNumber(*s, "verticalDiffThreshold", tmp.verticalDiffThreshold);
        ReadNumber(*s, "verticalPenalty", tmp.verticalPenalty);
    }

    if (const auto* i = Section(j, "interior"))
    {
        ReadNumber(*i, "maxInteriorDistance", tmp.maxInteriorDistance);
        ReadInt(*i, "exitSearchRange", tmp.exitSearchRange);
        ReadInt(*i, "exitVerticalScan", tmp.exitVerticalScan);
        ReadInt(*i, "maxExitCandidates", tmp.maxExitCandidates);
        ReadNumber(*i, "minExitClearance", tmp.minExitClearance);
    }

    if (const auto* sm = Section(j, "smoothing"))
        ReadNumber(*sm, "maxVerticalStep", tmp.maxVerticalStep);

    if (const auto* d = Section(j, "debug"))
        ReadBool(*d, "trace", tmp.trace);

    ClampNavConfig(tmp);
    cfg = tmp;
    return true;
}

bool SaveNavConfig(const NavConfig& cfg, const std::filesystem::path& file)
{
    std::error_code ec;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            logsys::get()->error("SaveNavConfig: create_directories failed for {} ({}: {})",
                                 file.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    nlohmann::json j;
    j["version"] = kNavConfigSchemaVersion;
    j["graph"] = {
        {"nodeSpacing", cfg.nodeSpacing},
        {"searchRadius", cfg.searchRadius},
        {"connectionRange", cfg.connectionRange},
        {"roadCost", cfg.roadCost},
        {"roadEdgeDiscount", cfg.roadEdgeDiscount},
        {"roadNearestWeight", cfg.roadNearestWeight},
    };
    j["search"] = {
        {"cheapNodeThreshold", cfg.cheapNodeThreshold},
        {"expensiveNodeMultiplier", cfg.expensiveNodeMultiplier},
        {"offRoadMultiplier", cfg.offRoadMultiplier},
        {"verticalDiffThreshold", cfg.verticalDiffThreshold},
        {"verticalPenalty", cfg.verticalPenalty},
    };
    j["interior"] = {
        {"maxInteriorDistance", cfg.maxInteriorDistance},
        {"exitSearchRange", cfg.exitSearchRange},
        {"exitVerticalScan", cfg.exitVerticalScan},
        {"maxExitCandidates", cfg.maxExitCandidates},
        {"minExitClearance", cfg.minExitClearance},
    };
    j["smoothing"] = { {"maxVerticalStep", cfg.maxVerticalStep} };
    j["debug"] = { {"trace", cfg.trace} };

    const std::string text = j.dump(2);

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        logsys::get()->error("SaveNavConfig: cannot open {}", file.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace trailnav::nav
