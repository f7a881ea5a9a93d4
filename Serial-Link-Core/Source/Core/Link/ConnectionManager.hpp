#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Core/Events.hpp"
#include "Core/LinkConfig.hpp"
#include "Core/MessageSink.hpp"
#include "Core/Serial/FrameDecoder.hpp"
#include "Core/Serial/Transport.hpp"

// Possiede il Transport e il thread di lettura.
// Finche' e' avviato e' connesso oppure sta ritentando: il loop termina solo con stop().
class ConnectionManager {
public:
    struct Callbacks {
        // Ogni messaggio valido, dopo il sink
        std::function<void(const DecodedMessage&)> onMessage;
        // Connessione persa o link in chiusura
        std::function<void(const std::string& reason)> onConnectionLost;
    };

    ConnectionManager(const LinkConfig& cfg, std::unique_ptr<Transport> transport,
        MessageSink* sink = nullptr, Callbacks cbs = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Non bloccante. false se gia' avviato.
    bool start();
    // Idempotente: chiude il transport e attende la fine del thread.
    void stop();
    // Chiude e riapre la connessione corrente.
    void forceReconnect();

    // Accoda data per il thread di lettura. false (err="not_connected") se non connesso.
    bool write(const std::string& data, std::string& err);

    [[nodiscard]] LinkState state() const;
    [[nodiscard]] bool isConnected() const { return state() == LinkState::Connected; }
    [[nodiscard]] bool isRunning() const { return m_running.load(); }
    [[nodiscard]] std::string portName() const;

private:
    void run();
    std::string serveConnection();
    bool flushOutbox(asio::error_code& ec);
    void dispatch(const std::vector<ParsedFrame>& frames);
    void connectionLost(const std::string& reason);
    void setState(LinkState s, const std::string& detail);
    void waitBackoff(std::chrono::milliseconds delay);
    void notifySink(const char* what, const std::function<void(MessageSink&)>& fn);

    LinkConfig m_cfg;
    std::unique_ptr<Transport> m_transport;
    MessageSink* m_sink;
    Callbacks m_cbs;
    FrameDecoder m_decoder;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_running{ false };
    std::atomic<bool> m_stopRequested{ false };
    std::atomic<bool> m_reconnectRequested{ false };
    std::mutex m_lifecycleMx;

    // stato + coda di scrittura (stesso lock: write() vede sempre lo stato aggiornato)
    mutable std::mutex m_txMx;
    LinkState m_state{ LinkState::Disconnected };
    std::string m_portName;
    std::deque<std::string> m_outbox;

    // serializza le notifiche di stato verso il sink
    std::mutex m_notifyMx;

    std::mutex m_waitMx;
    std::condition_variable m_waitCv;
};
