#pragma once
#include <string>
#include <memory>
#include <optional>
#include <thread>
#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"
#include "utils/EventBus.hpp"
#include "Core/Link/SerialLink.hpp"

// Comando letto da stdin: "REQUEST => PREFIX" attende la risposta, "REQUEST" invia soltanto.
// Le righe che iniziano con ':' sono comandi locali (:status, :reconnect, :quit).
struct CliCommand {
    enum class Kind { Empty, Send, Request, Status, Reconnect, Quit };
    Kind kind = Kind::Empty;
    std::string request;
    std::string prefix;
};

CliCommand ParseCliCommand(const std::string& line);

// Esegue body e traduce le eccezioni in codici di uscita:
// fmt::format_error 1, std::system_error 2, std::exception 3, altro 4
int RunWithExitCodes(const std::function<int()>& body);

class MainApp {
public:
    explicit MainApp(std::string configPath = "config.json");
    ~MainApp();

    int run();
    void requestShutdown();

    // Esegue un comando e restituisce l'esito in JSON (vuoto per Empty/Quit)
    nlohmann::json execute(const CliCommand& cmd);
    nlohmann::json getStatusJson() const;

private:
    bool loadConfig();
    bool initLink();
    void startEventPrinter();
    void stopEventPrinter();

    std::string m_configPath;
    AppConfig   m_cfg;

    std::atomic<bool> m_shouldExit{ false };

    EventBus                    m_events;
    std::unique_ptr<SerialLink> m_link;
    std::unique_ptr<std::thread> m_printer;
};
