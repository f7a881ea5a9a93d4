#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "Core/MessageParser.hpp"

struct FrameDecoderParams {
    std::string delimiter = "\r\n";
    size_t maxFrameBytes = 4096;   // frame piu' lunghi vengono scartati interi
    bool trimWhitespace = false;
};

// Accumula i byte ricevuti e restituisce i frame completi.
// Il buffer persiste tra una feed() e l'altra; non e' thread-safe
// (lo usa solo il thread di lettura del ConnectionManager).
class FrameDecoder {
public:
    FrameDecoder();
    explicit FrameDecoder(FrameDecoderParams params);

    // Aggiunge bytes e restituisce i frame completati, in ordine di arrivo.
    std::vector<ParsedFrame> feed(std::string_view bytes);

    // Scarta il contenuto parziale (es. dopo una riconnessione)
    void reset();

    [[nodiscard]] const std::string& buffered() const { return m_buf; }
    [[nodiscard]] const FrameDecoderParams& params() const { return m_params; }

private:
    InvalidMessage oversized(const std::string& dropped) const;

    FrameDecoderParams m_params;
    std::string m_buf;
    size_t m_scanFrom = 0;   // posizione da cui riprendere la ricerca del delimitatore
    bool m_discarding = false;   // frame troppo lungo gia' segnalato: si scarta fino al delimitatore
};
