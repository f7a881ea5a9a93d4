#include "Core/Serial/FrameDecoder.hpp"
#include "Core/Log.hpp"
#include <fmt/format.h>
#include <algorithm>

FrameDecoder::FrameDecoder() : FrameDecoder(FrameDecoderParams{}) {
}

FrameDecoder::FrameDecoder(FrameDecoderParams params)
    : m_params(std::move(params)) {
    if (m_params.delimiter.empty()) m_params.delimiter = "\n";
    if (m_params.maxFrameBytes < m_params.delimiter.size()) m_params.maxFrameBytes = m_params.delimiter.size();
}

std::vector<ParsedFrame> FrameDecoder::feed(std::string_view bytes) {
    std::vector<ParsedFrame> out;
    m_buf.append(bytes.data(), bytes.size());

    const std::string& delim = m_params.delimiter;
    while (true) {
        const auto pos = m_buf.find(delim, m_scanFrom);
        if (pos == std::string::npos) {
            // il delimitatore potrebbe essere a cavallo di due letture
            m_scanFrom = m_buf.size() >= delim.size() ? m_buf.size() - delim.size() + 1 : 0;
            break;
        }
        if (m_discarding) {
            // coda di un frame gia' segnalato come troppo lungo
            m_discarding = false;
        }
        else if (pos > m_params.maxFrameBytes) {
            out.push_back(oversized(m_buf.substr(0, pos)));
        }
        else {
            out.push_back(ParseResponseLine(m_buf.substr(0, pos), m_params.trimWhitespace));
        }
        m_buf.erase(0, pos + delim.size());
        m_scanFrom = 0;
    }

    // Senza delimitatore il frame corrente supera il limite solo se lo supera
    // anche togliendo un delimitatore parziale in coda
    const size_t keep = delim.size() - 1;
    if (!m_discarding && m_buf.size() > m_params.maxFrameBytes + keep) {
        out.push_back(oversized(m_buf.substr(0, m_buf.size() - keep)));
        m_discarding = true;
    }
    if (m_discarding && m_buf.size() > keep) {
        // si tengono solo i byte che possono essere l'inizio del delimitatore
        m_buf.erase(0, m_buf.size() - keep);
        m_scanFrom = 0;
    }
    return out;
}

InvalidMessage FrameDecoder::oversized(const std::string& dropped) const {
    InvalidMessage msg;
    msg.content = HexDump(dropped.substr(0, 32));
    msg.error = fmt::format("Frame exceeds {} bytes", m_params.maxFrameBytes);
    msg.timestamp = WallClock::now();
    LOGF("Frame oltre {} byte scartato fino al prossimo delimitatore", m_params.maxFrameBytes);
    return msg;
}

void FrameDecoder::reset() {
    m_buf.clear();
    m_scanFrom = 0;
    m_discarding = false;
}
