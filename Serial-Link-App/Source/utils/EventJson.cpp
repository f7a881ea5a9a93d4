#include "utils/EventJson.hpp"
#include <type_traits>

using Json = nlohmann::json;

static double EpochSeconds(WallClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

void to_json(Json& j, const DecodedMessage& m) {
    j = Json{ {"type", "message"}, {"timestamp", EpochSeconds(m.timestamp)}, {"content", m.content} };
}

void to_json(Json& j, const InvalidMessage& m) {
    j = Json{ {"type", "invalid_message"}, {"timestamp", EpochSeconds(m.timestamp)},
        {"content", m.content}, {"error", m.error} };
}

void to_json(Json& j, const StateChange& c) {
    j = Json{ {"type", "state"}, {"timestamp", EpochSeconds(c.timestamp)},
        {"state", ToString(c.state)}, {"detail", c.detail} };
}

Json ResultToJson(const RequestResult& r) {
    return std::visit([](const auto& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, DecodedMessage>) return Json(v);
        else if constexpr (std::is_same_v<T, TimeoutError>) return Json{ {"type", "timeout"}, {"request", v.request} };
        else if constexpr (std::is_same_v<T, BusyError>) return Json{ {"type", "busy"}, {"request", v.request} };
        else return Json{ {"type", "disconnected"}, {"reason", v.reason} };
        }, r);
}
