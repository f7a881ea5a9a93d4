#include "Core/Link/ConnectionManager.hpp"
#include "Core/Log.hpp"
#include <algorithm>
#include <fmt/format.h>

ConnectionManager::ConnectionManager(const LinkConfig& cfg, std::unique_ptr<Transport> transport,
    MessageSink* sink, Callbacks cbs)
    : m_cfg(cfg),
      m_transport(std::move(transport)),
      m_sink(sink),
      m_cbs(std::move(cbs)),
      m_decoder(FrameDecoderParams{ cfg.delimiter, cfg.maxFrameBytes, cfg.trimWhitespace }) {
}

ConnectionManager::~ConnectionManager() { stop(); }

bool ConnectionManager::start() {
    std::lock_guard<std::mutex> lk(m_lifecycleMx);
    if (m_thread || !m_transport) return false;

    m_stopRequested = false;
    m_reconnectRequested = false;
    m_running = true;
    setState(LinkState::Connecting, "start");
    m_thread = std::make_unique<std::thread>([this] { run(); });
    return true;
}

void ConnectionManager::stop() {
    std::lock_guard<std::mutex> lk(m_lifecycleMx);
    if (!m_thread) return;

    {
        std::lock_guard<std::mutex> wl(m_waitMx);
        m_stopRequested = true;
    }
    m_waitCv.notify_all();

    setState(LinkState::Closing, "stop requested");
    if (m_cbs.onConnectionLost) m_cbs.onConnectionLost("link stopped");

    if (m_thread->joinable()) m_thread->join();
    m_thread.reset();

    m_transport->close();
    m_decoder.reset();
    m_running = false;
    setState(LinkState::Disconnected, "stopped");
}

void ConnectionManager::forceReconnect() {
    LOGF("Riconnessione forzata richiesta.");
    m_reconnectRequested = true;
}

bool ConnectionManager::write(const std::string& data, std::string& err) {
    std::lock_guard<std::mutex> lk(m_txMx);
    if (m_state != LinkState::Connected) {
        err = "not_connected";
        return false;
    }
    m_outbox.push_back(data);
    return true;
}

LinkState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lk(m_txMx);
    return m_state;
}

std::string ConnectionManager::portName() const {
    std::lock_guard<std::mutex> lk(m_txMx);
    return m_portName;
}

void ConnectionManager::setState(LinkState s, const std::string& detail) {
    std::lock_guard<std::mutex> nl(m_notifyMx);
    {
        std::lock_guard<std::mutex> lk(m_txMx);
        // dopo stop() il loop non puo' piu' riportare il link in Connecting/Connected
        if (m_stopRequested && (s == LinkState::Connecting || s == LinkState::Connected)) return;
        m_state = s;
        if (s == LinkState::Connected) m_portName = detail;
        else {
            m_outbox.clear();
            m_portName.clear();
        }
    }

    LOGF("Link {}: {}", ToString(s), detail);
    const StateChange change{ s, detail, WallClock::now() };
    notifySink("onStateChanged", [&](MessageSink& sink) { sink.onStateChanged(change); });
}

void ConnectionManager::notifySink(const char* what, const std::function<void(MessageSink&)>& fn) {
    if (!m_sink) return;
    try {
        fn(*m_sink);
    }
    catch (const std::exception& ex) {
        LOGF("Eccezione nel sink ({}): {}", what, ex.what());
    }
    catch (...) {
        LOGF("Eccezione sconosciuta nel sink ({})", what);
    }
}

void ConnectionManager::waitBackoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(m_waitMx);
    m_waitCv.wait_for(lk, delay, [this] { return m_stopRequested.load(); });
}

void ConnectionManager::run() {
    auto delay = m_cfg.reconnectDelay;
    bool announce = false;   // il primo Connecting lo notifica start()

    while (!m_stopRequested) {
        if (announce) setState(LinkState::Connecting, "retry");
        announce = false;

        asio::error_code ec;
        m_transport->open(ec);
        if (ec) {
            LOGF("Apertura fallita: {}. Nuovo tentativo tra {} ms.", ec.message(), delay.count());
            waitBackoff(delay);
            delay = std::min(delay * 2, std::max(m_cfg.maxReconnectDelay, m_cfg.reconnectDelay));
            announce = true;
            continue;
        }

        delay = m_cfg.reconnectDelay;
        m_decoder.reset();
        m_reconnectRequested = false;
        setState(LinkState::Connected, m_transport->name());

        const std::string reason = serveConnection();
        m_transport->close();
        if (m_stopRequested) break;
        connectionLost(reason);
    }

    m_transport->close();
}

std::string ConnectionManager::serveConnection() {
    while (!m_stopRequested) {
        if (m_reconnectRequested.exchange(false)) return "Reconnect forced";

        asio::error_code ec;
        if (!flushOutbox(ec)) return fmt::format("write error: {}", ec.message());

        std::string chunk;
        m_transport->readAvailable(chunk, ec);
        if (ec) return fmt::format("read error: {}", ec.message());

        if (!chunk.empty()) dispatch(m_decoder.feed(chunk));
    }
    return "stopped";
}

bool ConnectionManager::flushOutbox(asio::error_code& ec) {
    while (true) {
        std::string data;
        {
            std::lock_guard<std::mutex> lk(m_txMx);
            if (m_outbox.empty()) return true;
            data = std::move(m_outbox.front());
            m_outbox.pop_front();
        }
        LOGD("TX {}", HexDump(data));
        m_transport->write(data, ec);
        if (ec) return false;
    }
}

void ConnectionManager::dispatch(const std::vector<ParsedFrame>& frames) {
    for (const auto& frame : frames) {
        if (const auto* msg = std::get_if<DecodedMessage>(&frame)) {
            LOGD("RX '{}'", msg->content);
            notifySink("onMessage", [&](MessageSink& sink) { sink.onMessage(*msg); });
            if (m_cbs.onMessage) m_cbs.onMessage(*msg);
        }
        else if (const auto* bad = std::get_if<InvalidMessage>(&frame)) {
            LOGF("Messaggio scartato ({}): {}", bad->error, bad->content);
            notifySink("onDecodeError", [&](MessageSink& sink) { sink.onDecodeError(*bad); });
        }
    }
}

void ConnectionManager::connectionLost(const std::string& reason) {
    m_decoder.reset();
    setState(LinkState::Connecting, reason);
    if (m_cbs.onConnectionLost) m_cbs.onConnectionLost(reason);
}
