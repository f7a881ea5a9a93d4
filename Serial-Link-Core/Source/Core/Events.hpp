#pragma once
#include <chrono>
#include <string>
#include <variant>

using WallClock = std::chrono::system_clock;

// Stato della connessione, posseduto dal ConnectionManager
enum class LinkState {
    Disconnected,
    Connecting,
    Connected,
    Closing
};

const char* ToString(LinkState s);

// Una linea ricevuta e validata (delimitatore rimosso)
struct DecodedMessage {
    std::string content;
    WallClock::time_point timestamp{};
};

// Segmento scartato: caratteri illegali, linea vuota o buffer oltre il limite
struct InvalidMessage {
    std::string content;   // byte in esadecimale, "41-54-0d"
    std::string error;
    WallClock::time_point timestamp{};
};

struct StateChange {
    LinkState state = LinkState::Disconnected;
    std::string detail;    // porta aperta o motivo della disconnessione
    WallClock::time_point timestamp{};
};

// Esiti di queueRequestWaitResponse
struct TimeoutError {
    std::string request;
};

struct BusyError {
    std::string request;
};

struct DisconnectedError {
    std::string reason;
};

using RequestResult = std::variant<DecodedMessage, TimeoutError, BusyError, DisconnectedError>;

// "OK" -> "4f-4b"
std::string HexDump(const std::string& bytes);
