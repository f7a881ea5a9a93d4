#include "Core/Events.hpp"
#include <fmt/format.h>

const char* ToString(LinkState s) {
    switch (s) {
    case LinkState::Disconnected: return "disconnected";
    case LinkState::Connecting:   return "connecting";
    case LinkState::Connected:    return "connected";
    case LinkState::Closing:      return "closing";
    }
    return "unknown";
}

std::string HexDump(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i) out.push_back('-');
        out += fmt::format("{:02x}", static_cast<unsigned char>(bytes[i]));
    }
    return out;
}
