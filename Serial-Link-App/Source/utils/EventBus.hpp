#pragma once
#include <nlohmann/json.hpp>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <chrono>
#include "Core/MessageSink.hpp"

// Sink che converte ogni evento del link in JSON e lo accoda.
class EventBus : public MessageSink {
public:
    using Json = nlohmann::json;

    explicit EventBus(size_t maxEvents = kDefaultMax) : m_max(maxEvents ? maxEvents : 1) {}

    // MessageSink
    void onMessage(const DecodedMessage& msg) override;
    void onDecodeError(const InvalidMessage& msg) override;
    void onStateChanged(const StateChange& change) override;

    // Pubblica un evento (thread-safe). Oltre m_max scarta il piu' vecchio.
    void publish(const Json& ev);

    // Estrae il prossimo evento, con timeout. Ritorna false su timeout.
    bool popNext(Json& out, std::chrono::milliseconds timeout);

    // Utilities
    void clear();
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t dropped() const;

    static constexpr size_t kDefaultMax = 1024;

private:
    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<Json> m_q;
    size_t m_max;
    size_t m_dropped = 0;
};
