#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

// Identifiers, bundle paths and window titles.
inline constexpr size_t kIdentifierBufferSize = 250;

// Full filesystem paths. Must be at least the OS maximum path length
// (PROC_PIDPATHINFO_MAXSIZE on macOS, PATH_MAX on Linux): proc_pidpath fails
// outright on a smaller buffer instead of truncating.
inline constexpr size_t kPathBufferSize = 4096;

bool is_valid_utf8(std::string_view bytes);

// Runs a bridge call against a zeroed stack buffer of Capacity bytes and
// decodes the result. `call` receives (char* buffer, int32_t capacity) and
// returns the bridge status. A status <= 0, a status that leaves no room for
// the terminator, a buffer with no terminator, or undecodable text is absent.
template <size_t Capacity, typename Call>
std::optional<std::string> read_bridge_string(Call&& call) {
    static_assert(Capacity > 0);

    std::array<char, Capacity> buffer{};
    int32_t status = call(buffer.data(), static_cast<int32_t>(buffer.size()));
    if (status <= 0 || static_cast<size_t>(status) >= Capacity) return std::nullopt;

    // No terminator means the value was cut off.
    size_t len = ::strnlen(buffer.data(), buffer.size());
    if (len == Capacity) return std::nullopt;
    std::string_view bytes(buffer.data(), len);
    if (!is_valid_utf8(bytes)) return std::nullopt;

    return std::string(bytes);
}
