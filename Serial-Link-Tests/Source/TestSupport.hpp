#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <asio/error.hpp>
#include "Core/LinkConfig.hpp"
#include "Core/MessageSink.hpp"
#include "Core/Serial/Transport.hpp"

// Attende che pred() diventi vero (poll ogni ms). false se scade il timeout.
inline bool WaitUntil(const std::function<bool()>& pred,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

// Dispositivo simulato, condiviso tra il test e il FakeTransport posseduto dal link
class FakeDevice {
public:
    // Risposte generate a ogni scrittura
    using Responder = std::function<std::vector<std::string>(const std::string& written)>;

    void failNextOpens(int n) { std::lock_guard<std::mutex> lk(m_mx); m_openFailures = n; }
    void failNextRead() { std::lock_guard<std::mutex> lk(m_mx); m_readError = true; }
    void failNextWrite() { std::lock_guard<std::mutex> lk(m_mx); m_writeError = true; }
    void setResponder(Responder r) { std::lock_guard<std::mutex> lk(m_mx); m_responder = std::move(r); }

    void push(const std::string& bytes) {
        {
            std::lock_guard<std::mutex> lk(m_mx);
            m_rx.push_back(bytes);
        }
        m_cv.notify_all();
    }

    int openCalls() const { std::lock_guard<std::mutex> lk(m_mx); return m_openCalls; }
    int closeCalls() const { std::lock_guard<std::mutex> lk(m_mx); return m_closeCalls; }
    bool isOpen() const { std::lock_guard<std::mutex> lk(m_mx); return m_open; }
    std::vector<std::string> written() const { std::lock_guard<std::mutex> lk(m_mx); return m_written; }

    // --- lato transport ---
    void open(asio::error_code& ec) {
        std::lock_guard<std::mutex> lk(m_mx);
        ++m_openCalls;
        if (m_openFailures > 0) {
            --m_openFailures;
            ec = asio::error::no_such_device;
            return;
        }
        m_open = true;
        ec.clear();
    }

    size_t read(std::string& out, asio::error_code& ec) {
        std::unique_lock<std::mutex> lk(m_mx);
        if (!m_open) { ec = asio::error::not_connected; return 0; }
        m_cv.wait_for(lk, std::chrono::milliseconds(2), [this] { return !m_rx.empty() || m_readError; });
        if (m_readError) {
            m_readError = false;
            ec = asio::error::eof;
            return 0;
        }
        size_t n = 0;
        while (!m_rx.empty()) {
            n += m_rx.front().size();
            out += m_rx.front();
            m_rx.pop_front();
        }
        return n;
    }

    void write(const std::string& data, asio::error_code& ec) {
        std::vector<std::string> replies;
        {
            std::lock_guard<std::mutex> lk(m_mx);
            if (!m_open) { ec = asio::error::not_connected; return; }
            if (m_writeError) {
                m_writeError = false;
                ec = asio::error::broken_pipe;
                return;
            }
            m_written.push_back(data);
            if (m_responder) replies = m_responder(data);
        }
        for (const auto& r : replies) push(r);
    }

    void close() {
        std::lock_guard<std::mutex> lk(m_mx);
        if (m_open) ++m_closeCalls;
        m_open = false;
    }

private:
    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::deque<std::string> m_rx;
    std::vector<std::string> m_written;
    Responder m_responder;
    int m_openFailures = 0;
    int m_openCalls = 0;
    int m_closeCalls = 0;
    bool m_open = false;
    bool m_readError = false;
    bool m_writeError = false;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeDevice> dev, std::string name = "/dev/ttyFAKE0")
        : m_dev(std::move(dev)), m_name(std::move(name)) {}

    void open(asio::error_code& ec) override { m_dev->open(ec); }
    size_t readAvailable(std::string& out, asio::error_code& ec) override { return m_dev->read(out, ec); }
    void write(const std::string& data, asio::error_code& ec) override { m_dev->write(data, ec); }
    void close() override { m_dev->close(); }
    bool isOpen() const override { return m_dev->isOpen(); }
    std::string name() const override { return m_dev->isOpen() ? m_name : std::string(); }

private:
    std::shared_ptr<FakeDevice> m_dev;
    std::string m_name;
};

// Registra tutto cio' che il link notifica
class RecordingSink : public MessageSink {
public:
    void onMessage(const DecodedMessage& msg) override {
        std::lock_guard<std::mutex> lk(m_mx);
        m_messages.push_back(msg.content);
    }
    void onDecodeError(const InvalidMessage& msg) override {
        std::lock_guard<std::mutex> lk(m_mx);
        m_errors.push_back(msg.error);
    }
    void onStateChanged(const StateChange& change) override {
        std::lock_guard<std::mutex> lk(m_mx);
        m_states.push_back(change.state);
    }

    std::vector<std::string> messages() const { std::lock_guard<std::mutex> lk(m_mx); return m_messages; }
    std::vector<std::string> errors() const { std::lock_guard<std::mutex> lk(m_mx); return m_errors; }
    std::vector<LinkState> states() const { std::lock_guard<std::mutex> lk(m_mx); return m_states; }

private:
    mutable std::mutex m_mx;
    std::vector<std::string> m_messages;
    std::vector<std::string> m_errors;
    std::vector<LinkState> m_states;
};

// Sink che lancia sempre: il loop deve sopravvivere
class ThrowingSink : public MessageSink {
public:
    ThrowingSink() = default;
    // nonStdException: lancia un int invece di una std::exception
    explicit ThrowingSink(bool nonStdException) : m_nonStd(nonStdException) {}

    void onMessage(const DecodedMessage&) override { fail(); }
    void onDecodeError(const InvalidMessage&) override { fail(); }
    void onStateChanged(const StateChange&) override { fail(); }

private:
    void fail() const {
        if (m_nonStd) throw 42;
        throw std::runtime_error("sink down");
    }

    bool m_nonStd = false;
};

// Config con tempi brevi per i test
inline LinkConfig FastLinkConfig() {
    LinkConfig cfg;
    cfg.ports = { "/dev/ttyFAKE0" };
    cfg.reconnectDelay = std::chrono::milliseconds(5);
    cfg.maxReconnectDelay = std::chrono::milliseconds(5);
    cfg.pollInterval = std::chrono::milliseconds(2);
    cfg.defaultTimeout = std::chrono::milliseconds(500);
    return cfg;
}
