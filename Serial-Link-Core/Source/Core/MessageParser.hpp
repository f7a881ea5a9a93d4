#pragma once
#include <string>
#include <variant>
#include "Core/Events.hpp"

using ParsedFrame = std::variant<DecodedMessage, InvalidMessage>;

// Valida un frame gia' privo di delimitatore.
// - ammessi solo ASCII stampabili (0x20..0x7E), altrimenti "Illegal character(s)"
// - frame vuoto (anche dopo il trim) -> "Empty line"
// - spazi e '\r' finali sono sempre rimossi; trimWhitespace rimuove anche quelli iniziali
ParsedFrame ParseResponseLine(const std::string& frame, bool trimWhitespace = false);

bool IsPrintableAscii(const std::string& s);
