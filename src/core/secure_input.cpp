#include "secure_input.hpp"

#include "bridge_buffer.hpp"

#include <regex>

namespace {

constexpr int64_t kNoPid = -1;

// Unicode White_Space code points.
bool is_space(uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

// Decodes the code point starting at `i` of already validated UTF-8.
uint32_t decode_at(std::string_view s, size_t i, size_t& width) {
    auto c = static_cast<unsigned char>(s[i]);
    uint32_t cp;
    if (c < 0x80) {
        width = 1;
        return c;
    } else if ((c & 0xE0) == 0xC0) {
        width = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        width = 3;
        cp = c & 0x0F;
    } else {
        width = 4;
        cp = c & 0x07;
    }
    for (size_t k = 1; k < width && i + k < s.size(); k++) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    }
    return cp;
}

std::string_view trim(std::string_view s) {
    size_t width = 0;
    while (!s.empty() && is_space(decode_at(s, 0, width))) {
        s.remove_prefix(width);
    }
    while (!s.empty()) {
        size_t start = s.size() - 1;
        while (start > 0 && (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) start--;
        if (!is_space(decode_at(s, start, width))) break;
        s.remove_suffix(s.size() - start);
    }
    return s;
}

const std::regex& bundle_regex() {
    static const std::regex re(R"(/([^/]+)\.(app|bundle)/)");
    return re;
}

} // namespace

std::optional<int64_t> SecureInputResolver::holder_pid() const {
    int64_t pid = kNoPid;
    if (bridge_.secure_input_process(&pid) <= 0) return std::nullopt;
    if (pid <= 0) return std::nullopt;
    return pid;
}

std::optional<SecureInputHolder> SecureInputResolver::get_secure_input_holder() const {
    auto pid = holder_pid();
    if (!pid) return std::nullopt;

    auto raw = read_bridge_string<kPathBufferSize>([this, pid](char* buf, int32_t size) {
        return bridge_.path_from_pid(*pid, buf, size);
    });
    if (!raw) return std::nullopt;

    auto trimmed = trim(*raw);
    if (trimmed.empty()) return std::nullopt;

    std::string path(trimmed);
    auto name = app_name_from_path(path);
    return SecureInputHolder{
        .name = name.value_or(path),
        .path = path,
    };
}

std::optional<std::string> SecureInputResolver::app_name_from_path(std::string_view path) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(path.begin(), path.end(), match, bundle_regex())) {
        return std::nullopt;
    }
    return match[1].str();
}
