#include "Core/MessageParser.hpp"
#include <algorithm>

static constexpr const char* kBlanks = " \t\r\n";

static inline std::string rtrim(const std::string& s) {
    auto e = s.find_last_not_of(kBlanks);
    if (e == std::string::npos) return {};
    return s.substr(0, e + 1);
}

static inline std::string ltrim(const std::string& s) {
    auto b = s.find_first_not_of(kBlanks);
    if (b == std::string::npos) return {};
    return s.substr(b);
}

bool IsPrintableAscii(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        const auto b = static_cast<unsigned char>(c);
        return b >= 0x20 && b <= 0x7E;
        });
}

ParsedFrame ParseResponseLine(const std::string& frame, bool trimWhitespace) {
    const auto now = WallClock::now();
    // fine riga sempre normalizzata: alcuni dispositivi chiudono con "\r\r\n"
    std::string line = rtrim(frame);
    if (trimWhitespace) line = ltrim(line);

    if (line.empty()) {
        return InvalidMessage{ HexDump(frame), "Empty line", now };
    }
    if (!IsPrintableAscii(line)) {
        return InvalidMessage{ HexDump(frame), "Illegal character(s)", now };
    }
    return DecodedMessage{ line, now };
}
