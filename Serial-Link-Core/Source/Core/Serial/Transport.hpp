#pragma once
#include <cstddef>
#include <string>
#include <asio/error_code.hpp>

// Canale a byte verso il dispositivo. Gli errori sono riportati via error_code:
// open() fallito = errore di porta, read/write falliti = connessione persa.
// Usato da un solo thread alla volta (il loop del ConnectionManager).
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open(asio::error_code& ec) = 0;

    // Accoda in out i byte disponibili, attendendo al massimo l'intervallo di poll.
    // Ritorna il numero di byte letti (0 = nessun dato, non e' un errore).
    virtual size_t readAvailable(std::string& out, asio::error_code& ec) = 0;

    virtual void write(const std::string& data, asio::error_code& ec) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

    // Nome del dispositivo aperto (vuoto se chiuso)
    [[nodiscard]] virtual std::string name() const = 0;
};
