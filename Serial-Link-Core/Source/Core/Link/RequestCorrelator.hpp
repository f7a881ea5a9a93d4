#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "Core/Events.hpp"

// Una sola richiesta in volo alla volta. Una seconda richiesta concorrente
// viene rifiutata subito con BusyError (nessuna coda).
class RequestCorrelator {
public:
    // Consegna la richiesta al canale di scrittura; false (con err) se il link non e' connesso.
    using WriteFn = std::function<bool(const std::string& request, std::string& err)>;

    // Registra la richiesta, la scrive e attende il primo messaggio che inizia
    // con uno dei prefissi (lista vuota = qualsiasi messaggio).
    RequestResult queueRequestWaitResponse(const std::string& request,
        const std::vector<std::string>& prefixes,
        std::chrono::milliseconds timeout,
        const WriteFn& write);

    // Thread di lettura: true se msg ha risolto la richiesta pendente.
    bool offer(const DecodedMessage& msg);

    // Risveglia la richiesta pendente con DisconnectedError.
    void cancel(const std::string& reason);

    [[nodiscard]] bool hasPending() const;

    static bool MatchesAny(const std::string& content, const std::vector<std::string>& prefixes);

private:
    struct PendingRequest {
        std::string request;
        std::vector<std::string> prefixes;
        std::optional<RequestResult> result;
    };

    mutable std::mutex m_mx;
    std::condition_variable m_cv;
    std::optional<PendingRequest> m_pending;
};
