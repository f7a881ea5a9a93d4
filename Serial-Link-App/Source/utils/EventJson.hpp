#pragma once
#include <nlohmann/json.hpp>
#include "Core/Events.hpp"

// Serializzazione JSON degli eventi del link (campo "type" + timestamp epoch in secondi)
void to_json(nlohmann::json& j, const DecodedMessage& m);
void to_json(nlohmann::json& j, const InvalidMessage& m);
void to_json(nlohmann::json& j, const StateChange& c);

nlohmann::json ResultToJson(const RequestResult& r);
