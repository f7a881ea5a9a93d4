#include "utils/ConfigLoader.hpp"
#include <fstream>

using nlohmann::json;

// Campo opzionale intero >= 0 (millisecondi, byte, baud)
static bool readUnsigned(const json& obj, const char* key, const std::string& path, unsigned long long& out, std::string& outErr) {
    if (!obj.contains(key)) return true;
    const auto& v = obj[key];
    if (!v.is_number_unsigned()) { outErr = "Chiave '" + path + "." + key + "' non intero positivo."; return false; }
    out = v.get<unsigned long long>();
    return true;
}

static bool readMillis(const json& obj, const char* key, const std::string& path, std::chrono::milliseconds& out, std::string& outErr) {
    unsigned long long v = static_cast<unsigned long long>(out.count());
    if (!readUnsigned(obj, key, path, v, outErr)) return false;
    out = std::chrono::milliseconds(v);
    return true;
}

static bool readString(const json& obj, const char* key, const std::string& path, std::string& out, std::string& outErr) {
    if (!obj.contains(key)) return true;
    if (!obj[key].is_string()) { outErr = "Chiave '" + path + "." + key + "' non stringa."; return false; }
    out = obj[key].get<std::string>();
    return true;
}

static bool parseSerial(AppConfig& cfg, std::string& outErr, const json& s) {
    if (!s.contains("port")) { outErr = "Chiave 'serial.port' mancante."; return false; }
    const auto& p = s["port"];
    if (p.is_string()) {
        const auto port = p.get<std::string>();
        if (port.empty()) { outErr = "'serial.port' vuota."; return false; }
        if (port == "auto") cfg.autoPort = true;
        else cfg.link.ports.push_back(port);
    }
    else if (p.is_array()) {
        for (auto& e : p) {
            if (!e.is_string()) { outErr = "'serial.port' contiene elementi non stringa."; return false; }
            cfg.link.ports.push_back(e.get<std::string>());
        }
        if (cfg.link.ports.empty()) { outErr = "'serial.port' array vuoto."; return false; }
    }
    else {
        outErr = "'serial.port' deve essere stringa o array.";
        return false;
    }

    unsigned long long baud = cfg.link.baud;
    if (!readUnsigned(s, "baud", "serial", baud, outErr)) return false;
    if (baud == 0) { outErr = "'serial.baud' deve essere > 0."; return false; }
    cfg.link.baud = static_cast<unsigned>(baud);
    return true;
}

static bool parseFraming(AppConfig& cfg, std::string& outErr, const json& f) {
    if (!readString(f, "delimiter", "framing", cfg.link.delimiter, outErr)) return false;
    if (cfg.link.delimiter.empty()) { outErr = "'framing.delimiter' vuoto."; return false; }

    unsigned long long maxBytes = cfg.link.maxFrameBytes;
    if (!readUnsigned(f, "maxFrameBytes", "framing", maxBytes, outErr)) return false;
    if (maxBytes < cfg.link.delimiter.size()) { outErr = "'framing.maxFrameBytes' minore del delimitatore."; return false; }
    cfg.link.maxFrameBytes = static_cast<size_t>(maxBytes);

    if (f.contains("trimWhitespace")) {
        if (!f["trimWhitespace"].is_boolean()) { outErr = "'framing.trimWhitespace' non booleano."; return false; }
        cfg.link.trimWhitespace = f["trimWhitespace"].get<bool>();
    }
    return true;
}

bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const json& j) {
    cfg = {};

    if (!j.is_object()) { outErr = "Il documento deve essere un oggetto JSON."; return false; }

    // serial
    if (!j.contains("serial") || !j["serial"].is_object()) { outErr = "Chiave 'serial' mancante o non oggetto."; return false; }
    if (!parseSerial(cfg, outErr, j["serial"])) return false;

    // framing (opzionale)
    if (j.contains("framing")) {
        if (!j["framing"].is_object()) { outErr = "Chiave 'framing' non oggetto."; return false; }
        if (!parseFraming(cfg, outErr, j["framing"])) return false;
    }

    // requests (opzionale)
    if (j.contains("requests")) {
        const auto& r = j["requests"];
        if (!r.is_object()) { outErr = "Chiave 'requests' non oggetto."; return false; }
        if (!readString(r, "terminator", "requests", cfg.link.requestTerminator, outErr)) return false;
        if (!readMillis(r, "defaultTimeoutMs", "requests", cfg.link.defaultTimeout, outErr)) return false;
    }

    // reconnect (opzionale)
    if (j.contains("reconnect")) {
        const auto& r = j["reconnect"];
        if (!r.is_object()) { outErr = "Chiave 'reconnect' non oggetto."; return false; }
        if (!readMillis(r, "delayMs", "reconnect", cfg.link.reconnectDelay, outErr)) return false;
        cfg.link.maxReconnectDelay = cfg.link.reconnectDelay;
        if (!readMillis(r, "maxDelayMs", "reconnect", cfg.link.maxReconnectDelay, outErr)) return false;
        if (!readMillis(r, "pollIntervalMs", "reconnect", cfg.link.pollInterval, outErr)) return false;
        if (cfg.link.maxReconnectDelay < cfg.link.reconnectDelay) { outErr = "'reconnect.maxDelayMs' minore di 'reconnect.delayMs'."; return false; }
        if (cfg.link.pollInterval.count() == 0) { outErr = "'reconnect.pollIntervalMs' deve essere > 0."; return false; }
    }

    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // puo' lanciare
        return ParseConfigStrict(cfg, outErr, j);
    }
    catch (const std::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what();
        return false;
    }
}
