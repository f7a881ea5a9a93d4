#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

// Parametri del link, fissati alla costruzione
struct LinkConfig {
    std::vector<std::string> ports;                    // candidate, provate in ordine
    unsigned baud = 115200;

    std::string delimiter = "\r\n";                    // fine frame in ricezione
    std::string requestTerminator = "\n";              // aggiunto a ogni richiesta
    size_t maxFrameBytes = 4096;
    bool trimWhitespace = false;

    std::chrono::milliseconds defaultTimeout{ 1500 };
    std::chrono::milliseconds reconnectDelay{ 3000 };
    std::chrono::milliseconds maxReconnectDelay{ 3000 };   // > reconnectDelay = backoff esponenziale
    std::chrono::milliseconds pollInterval{ 20 };
};
