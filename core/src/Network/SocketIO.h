// SocketIO.h — Внутренние помощники для TCP сокетов pairing
// Все блокирующие ожидания режутся на интервалы pollIntervalMs,
// между ними проверяется флаг остановки.

#pragma once

#include "oreonpickup/Types.h"
#include "oreonpickup/Network/PairingProtocol.h"
#include <string>
#include <atomic>
#include <cstdint>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    using socket_t = SOCKET;
    #define SOCKET_INVALID INVALID_SOCKET
    #define CLOSE_SOCKET closesocket
    #define SOCKET_ERROR_CODE WSAGetLastError()
#else
    #include <sys/socket.h>
    #include <sys/types.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <errno.h>
    using socket_t = int;
    #define SOCKET_INVALID (-1)
    #define CLOSE_SOCKET close
    #define SOCKET_ERROR_CODE errno
#endif

namespace OreonPickup {
namespace SocketIO {

/// WSAStartup/WSACleanup на Windows, no-op на POSIX
class SocketRuntime {
public:
    SocketRuntime();
    ~SocketRuntime();

    SocketRuntime(const SocketRuntime&) = delete;
    SocketRuntime& operator=(const SocketRuntime&) = delete;
};

struct ListenResult {
    socket_t socket = SOCKET_INVALID;
    uint16_t port = 0;
    PickupError error = PickupError::None;
    std::string message;
};

struct ConnectResult {
    socket_t socket = SOCKET_INVALID;
    PickupError error = PickupError::None;
    std::string message;
};

enum class WaitStatus {
    Ready,
    Timeout,
    Stopped,
    Error
};

enum class ReadStatus {
    Complete,
    Malformed,
    Closed,         // Пир закрыл соединение, не прислав ни байта
    Timeout,
    Stopped,
    Error
};

struct ReadResult {
    ReadStatus status = ReadStatus::Error;
    std::string document;       // При Complete; при Malformed принятые байты
};

/// TCP listener на всех интерфейсах. Занятый порт → PortInUse.
ListenResult openListener(uint16_t port, int backlog = 1);

/// Ждать входящего подключения / данных для чтения
WaitStatus waitReadable(socket_t sock, int64_t timeoutMs,
                        const std::atomic<bool>& stopFlag, int pollIntervalMs);

/// Неблокирующий connect с таймаутом. Хост: IPv4 адрес или имя.
ConnectResult connectWithTimeout(const std::string& host, uint16_t port, int timeoutMs,
                                 const std::atomic<bool>& stopFlag, int pollIntervalMs);

/// Отправить всю строку (повторяя send при частичной записи)
bool sendAll(socket_t sock, const std::string& data);

/// Читать, пока не соберётся целый JSON документ, пир не закроет
/// соединение, не истечёт timeoutMs или не будет поднят stopFlag
ReadResult readJsonMessage(socket_t sock, int timeoutMs, size_t maxBytes,
                           const std::atomic<bool>& stopFlag, int pollIntervalMs);

/// Разбудить поток, ждущий на сокете (сокет остаётся открытым)
void shutdownSocket(socket_t sock);

/// Закрыть и обнулить
void closeSocket(socket_t& sock);

/// IPv4 адрес в строку
std::string addressToString(const sockaddr_in& addr);

} // namespace SocketIO
} // namespace OreonPickup
