#pragma once

#include "platform/native_bridge.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct SecureInputHolder {
    std::string name;  // bundle name, or the path when there is none
    std::string path;
};

// Answers "who is holding secure keyboard input right now". Every call asks
// the OS again; callers poll.
class SecureInputResolver {
public:
    explicit SecureInputResolver(NativeBridge& bridge) : bridge_(bridge) {}

    std::optional<int64_t> holder_pid() const;
    std::optional<SecureInputHolder> get_secure_input_holder() const;

    // Name of the first ".app" or ".bundle" directory on `path`, e.g.
    // "/Applications/iTerm.app/Contents/MacOS/iTerm2" -> "iTerm".
    static std::optional<std::string> app_name_from_path(std::string_view path);

private:
    NativeBridge& bridge_;
};
