#include "utils/MainApp.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/EventJson.hpp"
#include "utils/Utils.hpp"
#include "Core/Log.hpp"
#include "Core/Serial/SerialPort.hpp"
#include "Core/Serial/SerialPortEnumerator.hpp"

#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <iostream>
#include <system_error>

using Json = nlohmann::json;

// -----------------------------------------------------------------------------
// Parsing dei comandi da stdin
// -----------------------------------------------------------------------------
CliCommand ParseCliCommand(const std::string& line) {
    CliCommand cmd;
    const std::string s = trimSpaces(line);
    if (s.empty()) return cmd;

    if (s[0] == ':') {
        const std::string name = toLower(s.substr(1));
        if (name == "status") cmd.kind = CliCommand::Kind::Status;
        else if (name == "reconnect") cmd.kind = CliCommand::Kind::Reconnect;
        else if (name == "quit" || name == "q") cmd.kind = CliCommand::Kind::Quit;
        else { cmd.kind = CliCommand::Kind::Send; cmd.request = s; }   // non e' un comando locale
        return cmd;
    }
    if (toLower(s) == "quit") {
        cmd.kind = CliCommand::Kind::Quit;
        return cmd;
    }

    const auto arrow = s.find("=>");
    if (arrow == std::string::npos) {
        cmd.kind = CliCommand::Kind::Send;
        cmd.request = s;
        return cmd;
    }

    cmd.kind = CliCommand::Kind::Request;
    cmd.request = trimSpaces(s.substr(0, arrow));
    cmd.prefix = trimSpaces(s.substr(arrow + 2));
    return cmd;
}

int RunWithExitCodes(const std::function<int()>& body) {
    try {
        return body();
    }
    catch (const fmt::format_error& e) {
        LOGF("[FATAL] fmt::format_error: {}", e.what());
        return 1;
    }
    catch (const std::system_error& e) {
        LOGF("[FATAL] std::system_error: {} (code {})", e.what(), (int)e.code().value());
        return 2;
    }
    catch (const std::exception& e) {
        LOGF("[FATAL] std::exception: {}", e.what());
        return 3;
    }
    catch (...) {
        LOGF("[FATAL] eccezione sconosciuta");
        return 4;
    }
}

// -----------------------------------------------------------------------------
// Costruzione/distruzione
// -----------------------------------------------------------------------------
MainApp::MainApp(std::string configPath)
    : m_configPath(std::move(configPath)) {
}

MainApp::~MainApp() {
    if (m_link) m_link->stop();
    stopEventPrinter();
}

// Chiamabile da un signal handler: solo uno store atomico
void MainApp::requestShutdown() {
    m_shouldExit.store(true, std::memory_order_relaxed);
}

// -----------------------------------------------------------------------------
// Caricamento config + bootstrap del link
// -----------------------------------------------------------------------------
bool MainApp::loadConfig() {
    std::string cfgErr;
    if (!LoadConfigStrict(m_cfg, cfgErr, m_configPath)) {
        LOGF("ERRORE CONFIG: {}", cfgErr);
        return false;
    }
    return true;
}

bool MainApp::initLink() {
    std::unique_ptr<Transport> port;
    if (m_cfg.autoPort) {
        // rivaluta le porte a ogni tentativo: il dispositivo puo' essere collegato dopo l'avvio
        port = std::make_unique<SerialPort>(SerialPort::PortLister([] { return ListSerialPorts(); }),
            m_cfg.link.baud, m_cfg.link.pollInterval);
    }
    else {
        port = std::make_unique<SerialPort>(m_cfg.link.ports, m_cfg.link.baud, m_cfg.link.pollInterval);
    }

    m_link = std::make_unique<SerialLink>(m_cfg.link, std::move(port), &m_events);
    if (!m_link->start()) {
        LOGF("Link non avviato.");
        return false;
    }
    return true;
}

void MainApp::startEventPrinter() {
    m_printer = std::make_unique<std::thread>([this] {
        Json ev;
        while (!m_shouldExit.load(std::memory_order_relaxed)) {
            if (m_events.popNext(ev, std::chrono::milliseconds(100))) {
                LOGF("{}", ev.dump());
            }
        }
        // svuota quanto rimasto (es. la transizione a Disconnected)
        while (m_events.popNext(ev, std::chrono::milliseconds(0))) LOGF("{}", ev.dump());
        });
}

void MainApp::stopEventPrinter() {
    m_shouldExit = true;
    if (m_printer && m_printer->joinable()) m_printer->join();
    m_printer.reset();
}

// -----------------------------------------------------------------------------
// Comandi
// -----------------------------------------------------------------------------
Json MainApp::getStatusJson() const {
    Json out = { {"type", "status"}, {"connected", false} };
    if (!m_link) return out;

    out["connected"] = m_link->isConnected();
    out["state"] = ToString(m_link->state());
    if (m_link->isConnected()) {
        out["port"] = m_link->portName();
        out["baud"] = m_cfg.link.baud;
    }
    return out;
}

Json MainApp::execute(const CliCommand& cmd) {
    switch (cmd.kind) {
    case CliCommand::Kind::Empty:
    case CliCommand::Kind::Quit:
        return Json();
    case CliCommand::Kind::Status:
        return getStatusJson();
    case CliCommand::Kind::Reconnect:
        if (m_link) m_link->forceReconnect();
        return Json{ {"type", "reconnect"}, {"requested", m_link != nullptr} };
    case CliCommand::Kind::Send: {
        std::string err = "not_connected";
        const bool ok = m_link && m_link->send(cmd.request, &err);
        Json out = { {"type", "sent"}, {"request", cmd.request}, {"ok", ok} };
        if (!ok) out["error"] = err;
        return out;
    }
    case CliCommand::Kind::Request:
        if (!m_link) return ResultToJson(DisconnectedError{ "not_connected" });
        return ResultToJson(m_link->queueRequestWaitResponse(cmd.request, cmd.prefix));
    }
    return Json();
}

int MainApp::run() {
    if (!loadConfig()) return 2;

    startEventPrinter();
    if (!initLink()) {
        stopEventPrinter();
        return 5;
    }

    fmt::print("Link avviato. 'RICHIESTA => PREFISSO' attende la risposta, ':quit' per uscire.\n");

    std::string line;
    while (!m_shouldExit.load(std::memory_order_relaxed) && std::getline(std::cin, line)) {
        const CliCommand cmd = ParseCliCommand(line);
        if (cmd.kind == CliCommand::Kind::Quit) break;
        if (cmd.kind == CliCommand::Kind::Empty) continue;

        fmt::print("{}\n", execute(cmd).dump());
        std::fflush(stdout);
    }

    m_link->stop();
    stopEventPrinter();
    return 0;
}
