#include "Core/Serial/SerialPort.hpp"
#include "Core/Log.hpp"

SerialPort::SerialPort(std::vector<std::string> ports, unsigned int baud, std::chrono::milliseconds pollInterval)
    : SerialPort(PortLister([ports = std::move(ports)] { return ports; }), baud, pollInterval) {
}

SerialPort::SerialPort(PortLister lister, unsigned int baud, std::chrono::milliseconds pollInterval)
    : m_lister(std::move(lister)), m_baud(baud), m_pollInterval(pollInterval) {
    if (m_pollInterval.count() <= 0) m_pollInterval = std::chrono::milliseconds(1);
}

SerialPort::~SerialPort() { close(); }

bool SerialPort::openOne(const std::string& port, asio::error_code& ec) {
    m_serial = std::make_unique<asio::serial_port>(m_io);
    m_serial->open(port, ec);
    if (ec) {
        m_serial.reset();
        return false;
    }

    m_serial->set_option(asio::serial_port_base::baud_rate(m_baud), ec);
    if (!ec) m_serial->set_option(asio::serial_port_base::character_size(8), ec);
    if (!ec) m_serial->set_option(asio::serial_port_base::parity(asio::serial_port_base::parity::none), ec);
    if (!ec) m_serial->set_option(asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one), ec);
    if (!ec) m_serial->set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), ec);
    if (ec) {
        asio::error_code ignored;
        m_serial->close(ignored);
        m_serial.reset();
        return false;
    }

    m_openPort = port;
    return true;
}

void SerialPort::open(asio::error_code& ec) {
    close();
    ec = asio::error::not_found;   // nessuna porta candidata

    const auto ports = m_lister ? m_lister() : std::vector<std::string>{};
    for (const auto& port : ports) {
        if (openOne(port, ec)) {
            LOGF("Seriale {} @ {} aperta.", port, m_baud);
            return;
        }
        LOGF("Errore apertura {}: {}", port, ec.message());
    }
}

size_t SerialPort::readAvailable(std::string& out, asio::error_code& ec) {
    if (!m_serial || !m_serial->is_open()) {
        ec = asio::error::not_connected;
        return 0;
    }

    // Lettura asincrona limitata a m_pollInterval, cosi' il loop resta reattivo a stop()
    bool done = false;
    size_t got = 0;
    asio::error_code readEc;
    m_serial->async_read_some(asio::buffer(m_rx),
        [&](const asio::error_code& e, size_t bytes) {
            readEc = e;
            got = bytes;
            done = true;
        });

    m_io.restart();
    m_io.run_for(m_pollInterval);
    if (!done) {
        asio::error_code ignored;
        m_serial->cancel(ignored);
        m_io.restart();
        m_io.run();   // completa l'handler annullato
    }

    if (readEc && readEc != asio::error::operation_aborted) {
        ec = readEc;
        return 0;
    }
    out.append(m_rx.data(), got);
    return got;
}

void SerialPort::write(const std::string& data, asio::error_code& ec) {
    if (!m_serial || !m_serial->is_open()) {
        ec = asio::error::not_connected;
        return;
    }
    asio::write(*m_serial, asio::buffer(data), ec);
}

void SerialPort::close() {
    if (m_serial && m_serial->is_open()) {
        asio::error_code ignored;
        m_serial->cancel(ignored);
        m_serial->close(ignored);
    }
    m_serial.reset();
    m_openPort.clear();
}

bool SerialPort::isOpen() const {
    return m_serial && m_serial->is_open();
}

std::string SerialPort::name() const {
    return m_openPort;
}
