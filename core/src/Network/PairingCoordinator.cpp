// PairingCoordinator.cpp — Рабочие потоки responder'а и initiator'а

#include "oreonpickup/Network/PairingCoordinator.h"
#include "oreonpickup/Network/PairingProtocol.h"
#include "oreonpickup/PairingCode.h"
#include "oreonpickup/TrustStore.h"
#include "oreonpickup/Logging.h"
#include "SocketIO.h"
#include <spdlog/spdlog.h>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <stdexcept>

namespace OreonPickup {

namespace {

// ═══════════════════════════════════════════════════════════
// Общее состояние координатора
// ═══════════════════════════════════════════════════════════

/// Переживает координатор: отсоединённый после grace period поток
/// продолжает писать сюда, не трогая удалённый Impl.
struct SharedState {
    std::mutex mutex;
    uint64_t currentSessionId = 0;
    PairingState state = PairingState::Idle;
    std::optional<PairingResult> lastResult;
    PairingCoordinator::StateCallback stateCallback;
    NotificationQueue<PairingEvent> events{MAX_PENDING_EVENTS};
};

struct Session {
    uint64_t id = 0;
    PairingRole role = PairingRole::Responder;
    PickupConfig config;
    std::string ownHostname;
    std::shared_ptr<TrustStore> store;
    std::shared_ptr<SharedState> shared;
    PairingCoordinator::ResultCallback resultCallback;

    std::atomic<bool> stop{false};
    std::thread worker;

    // Сокет, на котором сейчас блокируется worker
    std::mutex socketMutex;
    socket_t activeSocket = SOCKET_INVALID;
    uint16_t boundPort = 0;

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done = false;
    PairingResult result;

    ~Session() {
        SocketIO::closeSocket(activeSocket);
    }

    void closeActiveSocket() {
        std::lock_guard<std::mutex> lock(socketMutex);
        SocketIO::closeSocket(activeSocket);
    }

    void interrupt() {
        stop = true;
        std::lock_guard<std::mutex> lock(socketMutex);
        SocketIO::shutdownSocket(activeSocket);
    }
};

/// Обновить состояние координатора, если сессия текущая
void setState(Session& session, PairingState state) {
    std::lock_guard<std::mutex> lock(session.shared->mutex);
    if (session.shared->currentSessionId == session.id) {
        session.shared->state = state;
    }
}

/// Событие в очередь и callback. Только из рабочего потока сессии.
void announce(Session& session, PairingState state,
              PickupError error = PickupError::None, const std::string& detail = {}) {
    PairingEvent event;
    event.sessionId = session.id;
    event.role = session.role;
    event.state = state;
    event.error = error;
    event.detail = detail;

    PairingCoordinator::StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(session.shared->mutex);
        callback = session.shared->stateCallback;
    }

    spdlog::debug("PairingCoordinator: session {} ({}) -> {}",
                  session.id, roleToString(session.role), stateToString(state));

    session.shared->events.push(event);
    if (callback) {
        callback(event);
    }
}

void transition(Session& session, PairingState state,
                PickupError error = PickupError::None, const std::string& detail = {}) {
    setState(session, state);
    announce(session, state, error, detail);
}

PairingResult makeFailure(PairingState state, PickupError error, const std::string& reason) {
    PairingResult result;
    result.finalState = state;
    result.error = error;
    result.reason = reason;
    return result;
}

PairingResult cancelled(const Session& session) {
    return makeFailure(PairingState::Cancelled, PickupError::Cancelled,
                       "Session " + std::to_string(session.id) + " stopped");
}

/// Записать устройство после принятого рукопожатия
PairingResult persistPaired(Session& session, const PairedDevice& device) {
    PairingResult result;
    result.success = true;
    result.finalState = PairingState::Paired;
    result.device = device;

    if (!session.store) {
        result.error = PickupError::StorageIOError;
        result.reason = "No trust store configured";
        spdlog::error("PairingCoordinator: paired with {} but {}", device.deviceId, result.reason);
        return result;
    }

    if (session.store->addOrUpdate(device.deviceId, device)) {
        result.persisted = true;
        spdlog::info("PairingCoordinator: paired with {}", device.deviceId);
    } else {
        result.error = PickupError::StorageIOError;
        result.reason = session.store->getLastError();
        spdlog::error("PairingCoordinator: paired with {} but failed to persist: {}",
                      device.deviceId, result.reason);
    }
    return result;
}

/// Терминальное состояние → результат → Idle → done
void finish(Session& session, PairingResult result) {
    result.role = session.role;

    transition(session, result.finalState, result.error, result.reason);

    {
        std::lock_guard<std::mutex> lock(session.shared->mutex);
        if (session.shared->currentSessionId == session.id) {
            session.shared->lastResult = result;
        }
    }

    {
        std::lock_guard<std::mutex> lock(session.doneMutex);
        session.result = result;
    }

    if (session.resultCallback) {
        session.resultCallback(result);
    }

    transition(session, PairingState::Idle);

    {
        std::lock_guard<std::mutex> lock(session.doneMutex);
        session.done = true;
    }
    session.doneCv.notify_all();
}

/// Ошибка чтения сообщения → результат
PairingResult readFailure(const Session& session, const SocketIO::ReadResult& read,
                          const std::string& remote) {
    switch (read.status) {
        case SocketIO::ReadStatus::Stopped:
            return cancelled(session);
        case SocketIO::ReadStatus::Timeout:
            return makeFailure(PairingState::Failed, PickupError::ReadTimeout,
                               "No message from " + remote + " within " +
                               std::to_string(session.config.readTimeoutMs) + " ms");
        case SocketIO::ReadStatus::Malformed:
            spdlog::warn("PairingCoordinator: malformed message from {}: '{}'",
                         remote, truncateForLog(read.document));
            return makeFailure(PairingState::Failed, PickupError::MalformedMessage, REASON_MALFORMED);
        case SocketIO::ReadStatus::Closed:
            return makeFailure(PairingState::Failed, PickupError::NetworkError,
                               remote + " closed the connection");
        default:
            return makeFailure(PairingState::Failed, PickupError::NetworkError,
                               "Failed to read from " + remote);
    }
}

// ═══════════════════════════════════════════════════════════
// Responder
// ═══════════════════════════════════════════════════════════

PairingResult respond(Session& session, const std::string& code, socket_t listener) {
    const auto& config = session.config;

    const int64_t deadlineMs = static_cast<int64_t>(config.pairingTimeoutSeconds) * 1000;
    auto wait = SocketIO::waitReadable(listener, deadlineMs, session.stop, config.pollIntervalMs);
    if (wait == SocketIO::WaitStatus::Stopped) {
        return cancelled(session);
    }
    if (wait == SocketIO::WaitStatus::Timeout) {
        spdlog::info("PairingCoordinator: no initiator within {} s", config.pairingTimeoutSeconds);
        return makeFailure(PairingState::Cancelled, PickupError::TimedOut,
                           "No connection within " + std::to_string(config.pairingTimeoutSeconds) + " s");
    }
    if (wait == SocketIO::WaitStatus::Error) {
        return makeFailure(PairingState::Failed, PickupError::NetworkError, "Listener failed");
    }

    sockaddr_in clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);
    socket_t client = accept(listener, reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
    if (client == SOCKET_INVALID) {
        if (session.stop) return cancelled(session);
        return makeFailure(PairingState::Failed, PickupError::NetworkError,
                           "Accept failed: " + std::to_string(SOCKET_ERROR_CODE));
    }

    // Одно подключение на сессию: listener больше не нужен
    {
        std::lock_guard<std::mutex> lock(session.socketMutex);
        SocketIO::closeSocket(session.activeSocket);
        session.activeSocket = client;
        if (session.stop) {
            SocketIO::shutdownSocket(client);
        }
    }

    std::string remoteIp = SocketIO::addressToString(clientAddr);
    spdlog::info("PairingCoordinator: connection from {}", remoteIp);
    transition(session, PairingState::Verifying, PickupError::None, remoteIp);

    auto read = SocketIO::readJsonMessage(client, config.readTimeoutMs, config.maxMessageBytes,
                                          session.stop, config.pollIntervalMs);
    std::optional<PairingRequest> request;
    if (read.status == SocketIO::ReadStatus::Complete) {
        request = PairingRequest::fromJson(read.document);
        if (!request) {
            read.status = SocketIO::ReadStatus::Malformed;
        }
    }

    if (!request) {
        if (read.status == SocketIO::ReadStatus::Malformed) {
            // Ответ best-effort: пир всё равно уже нарушил протокол
            if (!SocketIO::sendAll(client, PairingConfirm::rejected(REASON_MALFORMED).toJson())) {
                spdlog::debug("PairingCoordinator: could not report malformed message to {}", remoteIp);
            }
        }
        return readFailure(session, read, remoteIp);
    }

    if (!request->isPairingRequest() || request->code != code) {
        spdlog::warn("PairingCoordinator: rejected {} (invalid code)", remoteIp);
        if (!SocketIO::sendAll(client, PairingConfirm::rejected(REASON_INVALID_CODE).toJson())) {
            spdlog::debug("PairingCoordinator: could not send rejection to {}", remoteIp);
        }
        return makeFailure(PairingState::Rejected, PickupError::InvalidCode, REASON_INVALID_CODE);
    }

    if (!SocketIO::sendAll(client, PairingConfirm::accepted(session.ownHostname).toJson())) {
        return makeFailure(PairingState::Failed, PickupError::NetworkError,
                           "Failed to send confirmation to " + remoteIp);
    }

    std::string remoteHost = request->hostname.empty() ? UNKNOWN_DEVICE_NAME : request->hostname;

    PairedDevice device;
    device.deviceId = makeDeviceId(remoteHost, remoteIp);
    device.hostname = remoteHost;
    device.ip = remoteIp;
    device.port = config.port;
    device.pairedAt = unixNow();
    return persistPaired(session, device);
}

// ═══════════════════════════════════════════════════════════
// Initiator
// ═══════════════════════════════════════════════════════════

PairingResult initiateExchange(Session& session, const std::string& ip, uint16_t port,
                               const std::string& code) {
    const auto& config = session.config;
    std::string remote = ip + ":" + std::to_string(port);

    auto connection = SocketIO::connectWithTimeout(ip, port, config.connectTimeoutMs,
                                                   session.stop, config.pollIntervalMs);
    if (connection.error == PickupError::Cancelled) {
        return cancelled(session);
    }
    if (connection.error != PickupError::None) {
        spdlog::error("PairingCoordinator: cannot reach {}: {}", remote, connection.message);
        return makeFailure(PairingState::Failed, connection.error, connection.message);
    }

    socket_t sock = connection.socket;
    {
        std::lock_guard<std::mutex> lock(session.socketMutex);
        session.activeSocket = sock;
        if (session.stop) {
            SocketIO::shutdownSocket(sock);
        }
    }
    if (session.stop) {
        return cancelled(session);
    }

    transition(session, PairingState::AwaitingResponse, PickupError::None, remote);

    PairingRequest request;
    request.code = code;
    request.hostname = session.ownHostname;
    if (!SocketIO::sendAll(sock, request.toJson())) {
        if (session.stop) return cancelled(session);
        return makeFailure(PairingState::Failed, PickupError::NetworkError,
                           "Failed to send request to " + remote);
    }

    auto read = SocketIO::readJsonMessage(sock, config.readTimeoutMs, config.maxMessageBytes,
                                          session.stop, config.pollIntervalMs);
    std::optional<PairingConfirm> confirm;
    if (read.status == SocketIO::ReadStatus::Complete) {
        confirm = PairingConfirm::fromJson(read.document);
        if (!confirm) {
            read.status = SocketIO::ReadStatus::Malformed;
        }
    }
    if (!confirm) {
        return readFailure(session, read, remote);
    }

    if (!confirm->success) {
        spdlog::warn("PairingCoordinator: {} rejected pairing: {}", remote, confirm->reason);
        return makeFailure(PairingState::Rejected, PickupError::InvalidCode, confirm->reason);
    }

    std::string remoteHost = confirm->hostname.empty() ? UNKNOWN_DEVICE_NAME : confirm->hostname;

    PairedDevice device;
    device.deviceId = makeDeviceId(remoteHost, ip);
    device.hostname = remoteHost;
    device.ip = ip;
    device.port = port;
    device.pairedAt = unixNow();
    return persistPaired(session, device);
}

/// Тело рабочего потока: исключения не выходят за пределы потока
template <typename Body>
void runSession(const std::shared_ptr<Session>& session, Body body) {
    PairingResult result;
    try {
        result = body(*session);
    } catch (const std::exception& e) {
        spdlog::error("PairingCoordinator: session {} failed: {}", session->id, e.what());
        result = makeFailure(PairingState::Failed, PickupError::NetworkError, e.what());
    }
    session->closeActiveSocket();
    finish(*session, std::move(result));
}

} // namespace

// ═══════════════════════════════════════════════════════════
// PairingCoordinator::Impl
// ═══════════════════════════════════════════════════════════

class PairingCoordinator::Impl {
public:
    Impl(const PickupConfig& config, std::shared_ptr<TrustStore> store)
        : m_config(config)
        , m_store(std::move(store))
        , m_shared(std::make_shared<SharedState>()) {}

    ~Impl() {
        stopSession();
        m_shared->events.close();
    }

    std::string generateCode() const {
        return generatePairingCode(m_config.codeLength);
    }

    uint16_t configuredPort() const { return m_config.port; }

    bool startResponder(const std::string& code, uint16_t port, ResultCallback callback) {
        if (!isValidPairingCode(code)) {
            setError(PickupError::InvalidArgument, "Pairing code must be 1-9 decimal digits");
            return false;
        }

        std::lock_guard<std::mutex> control(m_controlMutex);
        stopLocked();

        auto listener = SocketIO::openListener(port);
        if (listener.error != PickupError::None) {
            setError(listener.error, listener.message);
            spdlog::error("PairingCoordinator: {}", listener.message);
            return false;
        }

        auto session = createSession(PairingRole::Responder, std::move(callback));
        session->activeSocket = listener.socket;
        session->boundPort = listener.port;

        spdlog::info("PairingCoordinator: responder listening on port {}", listener.port);
        setState(*session, PairingState::Listening);

        // Событие Listening публикует сам worker: callback не должен
        // выполняться под m_controlMutex в потоке вызывающего
        socket_t listenSocket = listener.socket;
        std::string detail = std::to_string(listener.port);
        session->worker = std::thread([session, code, listenSocket, detail]() {
            announce(*session, PairingState::Listening, PickupError::None, detail);
            runSession(session, [&](Session& s) { return respond(s, code, listenSocket); });
        });
        return true;
    }

    std::shared_ptr<Session> startInitiator(const std::string& ip, uint16_t port,
                                            const std::string& code, ResultCallback callback) {
        if (ip.empty() || port == 0) {
            setError(PickupError::InvalidArgument, "Target address and port are required");
            return nullptr;
        }
        if (!isValidPairingCode(code)) {
            setError(PickupError::InvalidArgument, "Pairing code must be 1-9 decimal digits");
            return nullptr;
        }

        std::lock_guard<std::mutex> control(m_controlMutex);
        stopLocked();

        auto session = createSession(PairingRole::Initiator, std::move(callback));

        spdlog::info("PairingCoordinator: pairing with {}:{}", ip, port);
        setState(*session, PairingState::Connecting);

        session->worker = std::thread([session, ip, port, code]() {
            announce(*session, PairingState::Connecting, PickupError::None,
                     ip + ":" + std::to_string(port));
            runSession(session, [&](Session& s) { return initiateExchange(s, ip, port, code); });
        });
        return session;
    }

    PairingResult initiate(const std::string& ip, uint16_t port, const std::string& code) {
        auto session = startInitiator(ip, port, code, nullptr);
        if (!session) {
            PairingResult result;
            result.role = PairingRole::Initiator;
            result.finalState = PairingState::Failed;
            result.error = getLastErrorCode();
            result.reason = getLastError();
            return result;
        }

        std::unique_lock<std::mutex> lock(session->doneMutex);
        session->doneCv.wait(lock, [&]() { return session->done; });
        return session->result;
    }

    void stopSession() {
        std::lock_guard<std::mutex> control(m_controlMutex);
        stopLocked();
    }

    PairingState getState() const {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->state;
    }

    uint16_t getBoundPort() const {
        auto session = currentSession();
        if (!session || session->role != PairingRole::Responder) return 0;
        return isActiveState(getState()) ? session->boundPort : 0;
    }

    uint64_t getSessionId() const {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->currentSessionId;
    }

    std::optional<PairingResult> getLastResult() const {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        return m_shared->lastResult;
    }

    bool waitForCompletion(int timeoutMs) {
        auto session = currentSession();
        if (!session) return true;

        std::unique_lock<std::mutex> lock(session->doneMutex);
        return session->doneCv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                                        [&]() { return session->done; });
    }

    NotificationQueue<PairingEvent>& events() {
        return m_shared->events;
    }

    void onStateChanged(StateCallback callback) {
        std::lock_guard<std::mutex> lock(m_shared->mutex);
        m_shared->stateCallback = std::move(callback);
    }

    PickupError getLastErrorCode() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastErrorCode;
    }

    std::string getLastError() const {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        return m_lastError;
    }

private:
    PickupConfig m_config;
    std::shared_ptr<TrustStore> m_store;
    std::shared_ptr<SharedState> m_shared;
    SocketIO::SocketRuntime m_runtime;

    std::mutex m_controlMutex;              // Сериализует start/stop
    mutable std::mutex m_sessionMutex;
    std::shared_ptr<Session> m_session;
    uint64_t m_nextSessionId = 1;

    mutable std::mutex m_errorMutex;
    PickupError m_lastErrorCode = PickupError::None;
    std::string m_lastError;

    void setError(PickupError code, const std::string& message) {
        std::lock_guard<std::mutex> lock(m_errorMutex);
        m_lastErrorCode = code;
        m_lastError = message;
    }

    std::shared_ptr<Session> currentSession() const {
        std::lock_guard<std::mutex> lock(m_sessionMutex);
        return m_session;
    }

    std::shared_ptr<Session> createSession(PairingRole role, ResultCallback callback) {
        auto session = std::make_shared<Session>();
        session->id = m_nextSessionId++;
        session->role = role;
        session->config = m_config;
        session->ownHostname = m_config.resolvedHostname();
        session->store = m_store;
        session->shared = m_shared;
        session->resultCallback = std::move(callback);

        {
            std::lock_guard<std::mutex> lock(m_shared->mutex);
            m_shared->currentSessionId = session->id;
        }
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            m_session = session;
        }
        setError(PickupError::None, "");
        return session;
    }

    /// Вызывается под m_controlMutex
    void stopLocked() {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(m_sessionMutex);
            session = std::move(m_session);
        }
        if (!session) return;

        session->interrupt();

        if (!session->worker.joinable()) return;

        // Остановка из ResultCallback / StateCallback самой сессии
        if (session->worker.get_id() == std::this_thread::get_id()) {
            session->worker.detach();
            return;
        }

        bool exited;
        {
            std::unique_lock<std::mutex> lock(session->doneMutex);
            exited = session->doneCv.wait_for(lock, std::chrono::milliseconds(m_config.stopGraceMs),
                                              [&]() { return session->done; });
        }

        if (exited) {
            session->worker.join();
            spdlog::debug("PairingCoordinator: session {} stopped", session->id);
        } else {
            spdlog::warn("PairingCoordinator: session {} did not exit within {} ms, detaching",
                         session->id, m_config.stopGraceMs);
            session->worker.detach();
        }
    }
};

// ═══════════════════════════════════════════════════════════
// PairingCoordinator
// ═══════════════════════════════════════════════════════════

PairingCoordinator::PairingCoordinator(const PickupConfig& config, std::shared_ptr<TrustStore> store)
    : m_impl(std::make_unique<Impl>(config, std::move(store))) {}

PairingCoordinator::~PairingCoordinator() = default;

std::string PairingCoordinator::generateCode() const {
    return m_impl->generateCode();
}

bool PairingCoordinator::startResponder(const std::string& code, ResultCallback callback) {
    return m_impl->startResponder(code, m_impl->configuredPort(), std::move(callback));
}

bool PairingCoordinator::startResponder(const std::string& code, uint16_t port, ResultCallback callback) {
    return m_impl->startResponder(code, port, std::move(callback));
}

bool PairingCoordinator::startInitiator(const std::string& ip, uint16_t port, const std::string& code,
                                        ResultCallback callback) {
    return m_impl->startInitiator(ip, port, code, std::move(callback)) != nullptr;
}

PairingResult PairingCoordinator::initiate(const std::string& ip, uint16_t port, const std::string& code) {
    return m_impl->initiate(ip, port, code);
}

void PairingCoordinator::stopSession() {
    m_impl->stopSession();
}

PairingState PairingCoordinator::getState() const {
    return m_impl->getState();
}

bool PairingCoordinator::isActive() const {
    return isActiveState(m_impl->getState());
}

uint16_t PairingCoordinator::getBoundPort() const {
    return m_impl->getBoundPort();
}

uint64_t PairingCoordinator::getSessionId() const {
    return m_impl->getSessionId();
}

std::optional<PairingResult> PairingCoordinator::getLastResult() const {
    return m_impl->getLastResult();
}

bool PairingCoordinator::waitForCompletion(int timeoutMs) {
    return m_impl->waitForCompletion(timeoutMs);
}

NotificationQueue<PairingEvent>& PairingCoordinator::events() {
    return m_impl->events();
}

void PairingCoordinator::onStateChanged(StateCallback callback) {
    m_impl->onStateChanged(std::move(callback));
}

PickupError PairingCoordinator::getLastErrorCode() const {
    return m_impl->getLastErrorCode();
}

std::string PairingCoordinator::getLastError() const {
    return m_impl->getLastError();
}

} // namespace OreonPickup
