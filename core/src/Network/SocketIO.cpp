// SocketIO.cpp — TCP помощники с отменой и таймаутами

#include "SocketIO.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstring>
#include <algorithm>
#include <vector>

#ifdef _WIN32
    #pragma comment(lib, "ws2_32.lib")
    #define SEND_FLAGS 0
#else
    #include <poll.h>
    #include <fcntl.h>
    #include <netdb.h>
    #define SEND_FLAGS MSG_NOSIGNAL
#endif

namespace OreonPickup {
namespace SocketIO {

namespace {

using Clock = std::chrono::steady_clock;

int pollOne(socket_t sock, short events, int timeoutMs, short& revents) {
#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = sock;
    pfd.events = events;
    int r = WSAPoll(&pfd, 1, timeoutMs);
#else
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = events;
    int r = poll(&pfd, 1, timeoutMs);
#endif
    revents = pfd.revents;
    return r;
}

bool isInterrupted() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEINTR;
#else
    return errno == EINTR;
#endif
}

bool wouldBlock() {
#ifdef _WIN32
    int err = WSAGetLastError();
    return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINPROGRESS;
#endif
}

bool setNonBlocking(socket_t sock, bool enabled) {
#ifdef _WIN32
    u_long mode = enabled ? 1 : 0;
    return ioctlsocket(sock, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0) return false;
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(sock, F_SETFL, flags) == 0;
#endif
}

PickupError classifyConnectError(int code) {
#ifdef _WIN32
    if (code == WSAECONNREFUSED) return PickupError::ConnectionRefused;
    if (code == WSAETIMEDOUT) return PickupError::ConnectTimeout;
#else
    if (code == ECONNREFUSED) return PickupError::ConnectionRefused;
    if (code == ETIMEDOUT) return PickupError::ConnectTimeout;
#endif
    return PickupError::NetworkError;
}

bool resolveIpv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &result) != 0 || !result) {
        return false;
    }
    out = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

int64_t remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int64_t>(left) : 0;
}

/// Один шаг poll: не длиннее pollInterval и остатка до дедлайна
int pollSlice(int64_t left, int pollIntervalMs) {
    return static_cast<int>(std::min<int64_t>(left, pollIntervalMs));
}

} // namespace

// ═══════════════════════════════════════════════════════════
// SocketRuntime
// ═══════════════════════════════════════════════════════════

SocketRuntime::SocketRuntime() {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        spdlog::error("SocketIO: WSAStartup failed");
    }
#endif
}

SocketRuntime::~SocketRuntime() {
#ifdef _WIN32
    WSACleanup();
#endif
}

// ═══════════════════════════════════════════════════════════
// Listener
// ═══════════════════════════════════════════════════════════

ListenResult openListener(uint16_t port, int backlog) {
    ListenResult result;

    socket_t sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock == SOCKET_INVALID) {
        result.error = PickupError::NetworkError;
        result.message = "Failed to create socket: " + std::to_string(SOCKET_ERROR_CODE);
        return result;
    }

    // Только для TIME_WAIT: активный listener на порту bind всё равно не пустит
    int opt = 1;
    setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int code = SOCKET_ERROR_CODE;
#ifdef _WIN32
        bool inUse = code == WSAEADDRINUSE || code == WSAEACCES;
#else
        bool inUse = code == EADDRINUSE || code == EACCES;
#endif
        result.error = inUse ? PickupError::PortInUse : PickupError::NetworkError;
        result.message = "Failed to bind port " + std::to_string(port) + ": " + std::to_string(code);
        CLOSE_SOCKET(sock);
        return result;
    }

    if (listen(sock, backlog) < 0) {
        result.error = PickupError::NetworkError;
        result.message = "Failed to listen: " + std::to_string(SOCKET_ERROR_CODE);
        CLOSE_SOCKET(sock);
        return result;
    }

    // Реальный порт (если просили 0)
    socklen_t addrLen = sizeof(addr);
    getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &addrLen);

    result.socket = sock;
    result.port = ntohs(addr.sin_port);
    return result;
}

// ═══════════════════════════════════════════════════════════
// Ожидание
// ═══════════════════════════════════════════════════════════

WaitStatus waitReadable(socket_t sock, int64_t timeoutMs,
                        const std::atomic<bool>& stopFlag, int pollIntervalMs) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        if (stopFlag) return WaitStatus::Stopped;

        int64_t left = remainingMs(deadline);
        if (left <= 0) return WaitStatus::Timeout;

        short revents = 0;
        int r = pollOne(sock, POLLIN, pollSlice(left, pollIntervalMs), revents);

        if (stopFlag) return WaitStatus::Stopped;

        if (r < 0) {
            if (isInterrupted()) continue;
            spdlog::debug("SocketIO: poll() failed: {}", SOCKET_ERROR_CODE);
            return WaitStatus::Error;
        }
        if (r == 0) continue;

        if (revents & POLLNVAL) return WaitStatus::Error;
        // POLLHUP/POLLERR тоже Ready: следующий recv/accept вернёт причину
        return WaitStatus::Ready;
    }
}

// ═══════════════════════════════════════════════════════════
// Connect
// ═══════════════════════════════════════════════════════════

ConnectResult connectWithTimeout(const std::string& host, uint16_t port, int timeoutMs,
                                 const std::atomic<bool>& stopFlag, int pollIntervalMs) {
    ConnectResult result;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!resolveIpv4(host, addr.sin_addr)) {
        result.error = PickupError::NetworkError;
        result.message = "Cannot resolve host: " + host;
        return result;
    }

    socket_t sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock == SOCKET_INVALID) {
        result.error = PickupError::NetworkError;
        result.message = "Failed to create socket: " + std::to_string(SOCKET_ERROR_CODE);
        return result;
    }

    if (!setNonBlocking(sock, true)) {
        result.error = PickupError::NetworkError;
        result.message = "Failed to set non-blocking mode";
        CLOSE_SOCKET(sock);
        return result;
    }

    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (!wouldBlock()) {
            int code = SOCKET_ERROR_CODE;
            result.error = classifyConnectError(code);
            result.message = "Failed to connect: " + std::to_string(code);
            CLOSE_SOCKET(sock);
            return result;
        }

        auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
        bool connected = false;

        while (!connected) {
            if (stopFlag) {
                result.error = PickupError::Cancelled;
                result.message = "Connect cancelled";
                CLOSE_SOCKET(sock);
                return result;
            }

            int64_t left = remainingMs(deadline);
            if (left <= 0) {
                result.error = PickupError::ConnectTimeout;
                result.message = "Connection timed out after " + std::to_string(timeoutMs) + " ms";
                CLOSE_SOCKET(sock);
                return result;
            }

            short revents = 0;
            int r = pollOne(sock, POLLOUT, pollSlice(left, pollIntervalMs), revents);
            if (r < 0) {
                if (isInterrupted()) continue;
                result.error = PickupError::NetworkError;
                result.message = "poll() failed: " + std::to_string(SOCKET_ERROR_CODE);
                CLOSE_SOCKET(sock);
                return result;
            }
            if (r == 0) continue;

            int soError = 0;
            socklen_t len = sizeof(soError);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &len);
            if (soError != 0) {
                result.error = classifyConnectError(soError);
                result.message = "Failed to connect: " + std::to_string(soError);
                CLOSE_SOCKET(sock);
                return result;
            }
            connected = true;
        }
    }

    setNonBlocking(sock, false);
    result.socket = sock;
    return result;
}

// ═══════════════════════════════════════════════════════════
// Send / Receive
// ═══════════════════════════════════════════════════════════

bool sendAll(socket_t sock, const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        int sent = send(sock, data.data() + offset,
                        static_cast<int>(data.size() - offset), SEND_FLAGS);
        if (sent < 0) {
            if (isInterrupted()) continue;
            spdlog::debug("SocketIO: send() failed: {}", SOCKET_ERROR_CODE);
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

ReadResult readJsonMessage(socket_t sock, int timeoutMs, size_t maxBytes,
                           const std::atomic<bool>& stopFlag, int pollIntervalMs) {
    ReadResult result;
    JsonMessageReader reader(maxBytes);
    std::vector<char> buffer(4096);

    auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        WaitStatus wait = waitReadable(sock, remainingMs(deadline), stopFlag, pollIntervalMs);

        if (wait == WaitStatus::Stopped) {
            result.status = ReadStatus::Stopped;
            return result;
        }
        if (wait == WaitStatus::Timeout) {
            // Часть документа до таймаута — это битое сообщение, а не тишина
            result.status = reader.size() > 0 ? ReadStatus::Malformed : ReadStatus::Timeout;
            result.document = reader.document();
            return result;
        }
        if (wait == WaitStatus::Error) {
            result.status = ReadStatus::Error;
            return result;
        }

        int received = recv(sock, buffer.data(), static_cast<int>(buffer.size()), 0);

        if (received < 0) {
            if (isInterrupted() || wouldBlock()) continue;
            spdlog::debug("SocketIO: recv() failed: {}", SOCKET_ERROR_CODE);
            result.status = ReadStatus::Error;
            return result;
        }

        if (received == 0) {
            if (reader.size() == 0) {
                result.status = ReadStatus::Closed;
                return result;
            }
            reader.finish();
            result.status = ReadStatus::Malformed;
            result.document = reader.document();
            return result;
        }

        auto status = reader.feed(buffer.data(), static_cast<size_t>(received));
        if (status == JsonMessageReader::Status::Complete) {
            result.status = ReadStatus::Complete;
            result.document = reader.document();
            return result;
        }
        if (status == JsonMessageReader::Status::Malformed) {
            result.status = ReadStatus::Malformed;
            result.document = reader.document();
            return result;
        }
    }
}

// ═══════════════════════════════════════════════════════════
// Close
// ═══════════════════════════════════════════════════════════

void shutdownSocket(socket_t sock) {
    if (sock == SOCKET_INVALID) return;
#ifdef _WIN32
    shutdown(sock, SD_BOTH);
#else
    shutdown(sock, SHUT_RDWR);
#endif
}

void closeSocket(socket_t& sock) {
    if (sock != SOCKET_INVALID) {
        CLOSE_SOCKET(sock);
        sock = SOCKET_INVALID;
    }
}

std::string addressToString(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip);
}

} // namespace SocketIO
} // namespace OreonPickup
