#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("sway")) {
            auto& s = j["sway"];
            if (s.contains("socket")) cfg.sway.socket = s["socket"].get<std::string>();
        }

        if (j.contains("probe")) {
            auto& p = j["probe"];
            if (p.contains("poll_interval_ms")) {
                auto ms = std::clamp<int64_t>(p["poll_interval_ms"].get<int64_t>(),
                                              Probe::MIN_POLL_INTERVAL_MS,
                                              Probe::MAX_POLL_INTERVAL_MS);
                cfg.probe.poll_interval_ms = static_cast<uint32_t>(ms);
            }
            if (p.contains("format")) cfg.probe.format = p["format"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.probe.format != "text" && cfg.probe.format != "json") {
        std::println(stderr, "config: unknown probe.format '{}', using text", cfg.probe.format);
        cfg.probe.format = "text";
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
