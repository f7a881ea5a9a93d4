#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Core/Events.hpp"
#include "Core/LinkConfig.hpp"
#include "Core/MessageSink.hpp"
#include "Core/Link/ConnectionManager.hpp"
#include "Core/Link/RequestCorrelator.hpp"
#include "Core/Serial/Transport.hpp"

// Incapsula ConnectionManager + RequestCorrelator: e' l'API pubblica del link.
class SerialLink {
public:
    SerialLink(LinkConfig cfg, std::unique_ptr<Transport> transport, MessageSink* sink = nullptr);
    ~SerialLink();

    bool start();
    void stop();
    void forceReconnect();

    [[nodiscard]] bool isConnected() const { return m_conn.isConnected(); }
    [[nodiscard]] LinkState state() const { return m_conn.state(); }
    [[nodiscard]] std::string portName() const { return m_conn.portName(); }
    [[nodiscard]] const LinkConfig& config() const { return m_cfg; }

    // Invia senza attendere risposta. outErr = "not_connected" se il link e' giu'.
    bool send(const std::string& request, std::string* outErr = nullptr);

    // Invia request e attende il primo messaggio che inizia con requiredResponsePrefix.
    // Esiti: DecodedMessage | TimeoutError | BusyError | DisconnectedError.
    RequestResult queueRequestWaitResponse(const std::string& request,
        const std::string& requiredResponsePrefix,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Come sopra, accetta il primo messaggio che inizia con uno qualsiasi dei prefissi.
    RequestResult queueRequestWaitAnyResponse(const std::string& request,
        const std::vector<std::string>& acceptedPrefixes,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

private:
    bool writeRequest(const std::string& request, std::string& err);

    LinkConfig m_cfg;
    RequestCorrelator m_correlator;
    ConnectionManager m_conn;   // dopo m_correlator: il thread termina prima che il correlator sia distrutto
};
