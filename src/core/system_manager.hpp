#pragma once

#include <optional>
#include <string>

struct WindowIdentity {
    std::string window_class;  // stable app identifier, e.g. "com.googlecode.iterm2" or "kitty"
    std::string executable;    // bundle or binary path
};

// Foreground application queries used for rule matching. Nothing here throws:
// an unavailable answer is std::nullopt so the caller's loop keeps running.
class SystemManager {
public:
    virtual ~SystemManager() = default;

    // Identifier suitable for matching; not necessarily a literal title.
    virtual std::optional<std::string> get_current_window_title() const = 0;
    virtual std::optional<std::string> get_current_window_class() const = 0;
    virtual std::optional<std::string> get_current_window_executable() const = 0;

    // Absent only when neither class nor executable could be determined.
    std::optional<WindowIdentity> get_current_window() const;
};
