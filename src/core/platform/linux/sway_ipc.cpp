#include "platform/linux/sway_ipc.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayIpc::SwayIpc(std::string socket_path) : socket_path_(std::move(socket_path)) {}

SwayIpc::~SwayIpc() {
    disconnect();
}

std::string SwayIpc::resolve_socket_path() const {
    if (!socket_path_.empty()) return socket_path_;
    if (const char* sway = std::getenv("SWAYSOCK")) return sway;
    if (const char* i3 = std::getenv("I3SOCK")) return i3;
    return {};
}

bool SwayIpc::connect() {
    disconnect();

    auto path = resolve_socket_path();
    if (path.empty()) {
        if (!reported_failure_) std::println(stderr, "sway: no IPC socket ($SWAYSOCK not set)");
        reported_failure_ = true;
        return false;
    }

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (!reported_failure_) {
            std::println(stderr, "sway: connect to {} failed: {}", path, std::strerror(errno));
        }
        reported_failure_ = true;
        ::close(fd);
        return false;
    }

    reported_failure_ = false;
    fd_ = fd;
    return true;
}

void SwayIpc::disconnect() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
}

SwayWindow SwayIpc::get_focused_window() {
    if (fd_ < 0) return {};

    uint32_t type;
    std::string payload;
    if (!send_message(MSG_GET_TREE) || !recv_message(type, payload)) {
        disconnect();
        return {};
    }
    if (type != MSG_GET_TREE) return {};

    auto tree = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (tree.is_discarded()) return {};

    try {
        return find_focused(tree);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: unexpected tree layout: {}", e.what());
        return {};
    }
}

bool SwayIpc::send_message(uint32_t type, const std::string& payload) {
    // "i3-ipc" + payload length + message type, both native endian
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[HEADER_SIZE];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd_, header, HEADER_SIZE, MSG_NOSIGNAL) != static_cast<ssize_t>(HEADER_SIZE))
        return false;
    if (len > 0 &&
        ::send(fd_, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
        return false;
    return true;
}

bool SwayIpc::recv_message(uint32_t& type, std::string& payload) {
    auto read_exact = [this](char* dst, size_t n) {
        size_t got = 0;
        while (got < n) {
            ssize_t r = ::recv(fd_, dst + got, n - got, 0);
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) return false;
            got += static_cast<size_t>(r);
        }
        return true;
    };

    char header[HEADER_SIZE];
    if (!read_exact(header, HEADER_SIZE)) return false;
    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    return read_exact(payload.data(), len);
}

SwayWindow SwayIpc::find_focused(const nlohmann::json& node) {
    if (node.value("focused", false)) {
        SwayWindow win;
        if (node.contains("app_id") && node["app_id"].is_string())
            win.app_id = node["app_id"].get<std::string>();
        if (node.contains("window_properties"))
            win.window_class = node["window_properties"].value("class", "");
        if (node.contains("name") && node["name"].is_string())
            win.title = node["name"].get<std::string>();
        win.pid = node.value("pid", 0);
        return win;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (const auto& child : node[key]) {
            auto win = find_focused(child);
            if (!win.empty()) return win;
        }
    }
    return {};
}
