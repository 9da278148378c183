#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Sway {
        std::string socket;  // empty: $SWAYSOCK / $I3SOCK
    } sway;

    struct Probe {
        static constexpr uint32_t MIN_POLL_INTERVAL_MS = 50;
        static constexpr uint32_t MAX_POLL_INTERVAL_MS = 60000;

        uint32_t poll_interval_ms = 500;
        std::string format = "text";  // "text" or "json"
    } probe;

    static Config load(const std::string& path);
    static Config load_default();
};
