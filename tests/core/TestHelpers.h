// TestHelpers.h — Общие помощники тестов: временные каталоги и сырой TCP клиент

#pragma once

#include <gtest/gtest.h>
#include <string>
#include <chrono>
#include <thread>
#include <functional>
#include <filesystem>
#include <cstdint>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    using test_socket_t = SOCKET;
    #define TEST_SOCKET_INVALID INVALID_SOCKET
    #define TEST_CLOSE_SOCKET closesocket
#else
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    using test_socket_t = int;
    #define TEST_SOCKET_INVALID (-1)
    #define TEST_CLOSE_SOCKET ::close
#endif

namespace OreonPickup {
namespace Test {

namespace fs = std::filesystem;

/// Уникальный каталог под temp_directory_path()
inline std::string makeTempDir(const std::string& prefix) {
    std::string dir = fs::temp_directory_path().string() + "/" + prefix + "_" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    fs::create_directories(dir);
    return dir;
}

/// Ждать условие не дольше timeout
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

/// Блокирующий клиент для подачи произвольных байт responder'у
class RawClient {
public:
    RawClient() = default;
    ~RawClient() { close(); }

    RawClient(const RawClient&) = delete;
    RawClient& operator=(const RawClient&) = delete;

    bool connect(uint16_t port) {
        m_socket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        if (m_socket == TEST_SOCKET_INVALID) return false;

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        return ::connect(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    bool send(const std::string& data) {
        return ::send(m_socket, data.data(), static_cast<int>(data.size()), 0) ==
               static_cast<int>(data.size());
    }

    /// Читать до закрытия соединения пиром
    std::string receiveAll() {
        std::string result;
        char buffer[1024];
        while (true) {
            int n = recv(m_socket, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            result.append(buffer, static_cast<size_t>(n));
        }
        return result;
    }

    void close() {
        if (m_socket != TEST_SOCKET_INVALID) {
            TEST_CLOSE_SOCKET(m_socket);
            m_socket = TEST_SOCKET_INVALID;
        }
    }

private:
    test_socket_t m_socket = TEST_SOCKET_INVALID;
};

/// Занять эфемерный порт (listener остаётся открытым до уничтожения)
class PortBlocker {
public:
    PortBlocker() {
        m_socket = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = INADDR_ANY;
        addr.sin_port = 0;
        bind(m_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(m_socket, 1);

        socklen_t len = sizeof(addr);
        getsockname(m_socket, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
    }

    ~PortBlocker() {
        if (m_socket != TEST_SOCKET_INVALID) {
            TEST_CLOSE_SOCKET(m_socket);
        }
    }

    PortBlocker(const PortBlocker&) = delete;
    PortBlocker& operator=(const PortBlocker&) = delete;

    uint16_t port() const { return m_port; }

private:
    test_socket_t m_socket = TEST_SOCKET_INVALID;
    uint16_t m_port = 0;
};

/// Свободный сейчас порт (после возврата на нём никто не слушает)
inline uint16_t findClosedPort() {
    PortBlocker blocker;
    return blocker.port();
}

} // namespace Test
} // namespace OreonPickup
