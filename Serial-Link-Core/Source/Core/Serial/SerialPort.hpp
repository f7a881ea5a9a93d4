#pragma once
#include <array>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <asio.hpp>
#include "Core/Serial/Transport.hpp"

// Porta seriale reale (asio). open() prova le porte candidate in ordine
// e tiene la prima che si apre: 8N1, nessun controllo di flusso.
class SerialPort : public Transport {
public:
    // Elenco delle porte candidate, rivalutato a ogni open() (es. ListSerialPorts)
    using PortLister = std::function<std::vector<std::string>()>;

    SerialPort(std::vector<std::string> ports, unsigned int baud,
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20));
    SerialPort(PortLister lister, unsigned int baud,
        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(20));
    ~SerialPort() override;

    void open(asio::error_code& ec) override;
    size_t readAvailable(std::string& out, asio::error_code& ec) override;
    void write(const std::string& data, asio::error_code& ec) override;
    void close() override;

    [[nodiscard]] bool isOpen() const override;
    [[nodiscard]] std::string name() const override;

private:
    bool openOne(const std::string& port, asio::error_code& ec);

    PortLister m_lister;
    unsigned int m_baud;
    std::chrono::milliseconds m_pollInterval;

    asio::io_context m_io;
    std::unique_ptr<asio::serial_port> m_serial;
    std::string m_openPort;
    std::array<char, 512> m_rx{};
};
