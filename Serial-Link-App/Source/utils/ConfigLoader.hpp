#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);

// Come sopra, a partire da un documento gia' letto
bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const nlohmann::json& j);
