#include "Core/Link/SerialLink.hpp"

SerialLink::SerialLink(LinkConfig cfg, std::unique_ptr<Transport> transport, MessageSink* sink)
    : m_cfg(std::move(cfg)),
      m_conn(m_cfg, std::move(transport), sink,
          ConnectionManager::Callbacks{
              [this](const DecodedMessage& msg) { m_correlator.offer(msg); },
              [this](const std::string& reason) { m_correlator.cancel(reason); } }) {
}

SerialLink::~SerialLink() { stop(); }

bool SerialLink::start() { return m_conn.start(); }

void SerialLink::stop() { m_conn.stop(); }

void SerialLink::forceReconnect() { m_conn.forceReconnect(); }

bool SerialLink::writeRequest(const std::string& request, std::string& err) {
    return m_conn.write(request + m_cfg.requestTerminator, err);
}

bool SerialLink::send(const std::string& request, std::string* outErr) {
    std::string err;
    if (!writeRequest(request, err)) {
        if (outErr) *outErr = err;
        return false;
    }
    return true;
}

RequestResult SerialLink::queueRequestWaitResponse(const std::string& request,
    const std::string& requiredResponsePrefix,
    std::optional<std::chrono::milliseconds> timeout) {
    return queueRequestWaitAnyResponse(request, { requiredResponsePrefix }, timeout);
}

RequestResult SerialLink::queueRequestWaitAnyResponse(const std::string& request,
    const std::vector<std::string>& acceptedPrefixes,
    std::optional<std::chrono::milliseconds> timeout) {
    return m_correlator.queueRequestWaitResponse(request, acceptedPrefixes,
        timeout.value_or(m_cfg.defaultTimeout),
        [this](const std::string& req, std::string& err) { return writeRequest(req, err); });
}
