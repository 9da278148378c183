#include "config.hpp"
#include "platform/platform.hpp"
#include "secure_input.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void on_signal(int) {
    g_running.store(false, std::memory_order_relaxed);
}

struct Snapshot {
    std::optional<std::string> window_class;
    std::optional<std::string> title;
    std::optional<std::string> executable;
    std::optional<SecureInputHolder> secure_input;

    bool same_window(const Snapshot& other) const {
        return window_class == other.window_class && title == other.title &&
               executable == other.executable;
    }

    bool same_holder(const Snapshot& other) const {
        if (secure_input.has_value() != other.secure_input.has_value()) return false;
        if (!secure_input) return true;
        return secure_input->path == other.secure_input->path;
    }
};

Snapshot take_snapshot(const SystemManager& system, const SecureInputResolver& secure) {
    return Snapshot{
        .window_class = system.get_current_window_class(),
        .title = system.get_current_window_title(),
        .executable = system.get_current_window_executable(),
        .secure_input = secure.get_secure_input_holder(),
    };
}

nlohmann::json to_json(const Snapshot& s) {
    auto opt = [](const std::optional<std::string>& v) -> nlohmann::json {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    };

    nlohmann::json j = {
        {"class", opt(s.window_class)},
        {"title", opt(s.title)},
        {"executable", opt(s.executable)},
        {"secure_input", nullptr},
    };
    if (s.secure_input) {
        j["secure_input"] = {{"name", s.secure_input->name}, {"path", s.secure_input->path}};
    }
    return j;
}

void print_window(const Snapshot& s, bool as_json) {
    if (as_json) {
        std::println("{}", to_json(s).dump());
        return;
    }
    std::println("class:      {}", s.window_class.value_or("-"));
    std::println("title:      {}", s.title.value_or("-"));
    std::println("executable: {}", s.executable.value_or("-"));
}

void print_secure_input(const Snapshot& s, bool as_json) {
    if (as_json) return;  // part of the JSON object already
    if (s.secure_input) {
        std::println("secure input is held by {} ({})", s.secure_input->name,
                     s.secure_input->path);
    } else {
        std::println("secure input: not held");
    }
}

void watch(const SystemManager& system, const SecureInputResolver& secure,
           const Config& config, bool as_json, bool verbose) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto interval = std::chrono::milliseconds(config.probe.poll_interval_ms);
    if (verbose) {
        std::println(stderr, "[appsense] Polling every {}ms", config.probe.poll_interval_ms);
    }

    std::optional<Snapshot> last;
    while (g_running.load(std::memory_order_relaxed)) {
        auto now = take_snapshot(system, secure);

        bool window_changed = !last || !now.same_window(*last);
        bool holder_changed = !last || !now.same_holder(*last);

        if (as_json) {
            if (window_changed || holder_changed) print_window(now, true);
        } else {
            if (window_changed) print_window(now, false);
            if (holder_changed) {
                if (now.secure_input) {
                    print_secure_input(now, false);
                } else if (last) {
                    std::println("secure input released");
                }
            }
        }
        std::fflush(stdout);

        last = std::move(now);
        std::this_thread::sleep_for(interval);
    }

    if (verbose) std::println(stderr, "[appsense] Stopped");
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool watch_mode = false;
    bool json_flag = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--watch" || arg == "-w") {
            watch_mode = true;
        } else if (arg == "--json" || arg == "-j") {
            json_flag = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: appsense-probe [options]");
            std::println("Options:");
            std::println("  -w, --watch         Poll and report changes until interrupted");
            std::println("  -j, --json          Print JSON instead of text");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 2;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    bool as_json = json_flag || config.probe.format == "json";

    auto bridge = make_native_bridge(config);
    auto system = make_system_manager(*bridge);
    SecureInputResolver secure(*bridge);

    if (watch_mode) {
        watch(*system, secure, config, as_json, verbose);
        return 0;
    }

    auto snapshot = take_snapshot(*system, secure);
    if (verbose && !snapshot.window_class) {
        std::println(stderr, "[appsense] No foreground application reported");
    }
    print_window(snapshot, as_json);
    print_secure_input(snapshot, as_json);
    return 0;
}
