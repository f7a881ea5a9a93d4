#include "Core/Link/RequestCorrelator.hpp"
#include "Core/Log.hpp"

bool RequestCorrelator::MatchesAny(const std::string& content, const std::vector<std::string>& prefixes) {
    if (prefixes.empty()) return true;
    for (const auto& p : prefixes) {
        if (content.compare(0, p.size(), p) == 0) return true;
    }
    return false;
}

RequestResult RequestCorrelator::queueRequestWaitResponse(const std::string& request,
    const std::vector<std::string>& prefixes,
    std::chrono::milliseconds timeout,
    const WriteFn& write) {
    // un timeout oltre il limite del clock (es. milliseconds::max()) significa attesa senza scadenza
    const auto now = std::chrono::steady_clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - now);
    const bool unbounded = timeout >= headroom;
    const auto deadline = unbounded ? std::chrono::steady_clock::time_point::max() : now + timeout;

    {
        std::lock_guard<std::mutex> lk(m_mx);
        if (m_pending) {
            LOGD("Richiesta '{}' rifiutata: '{}' ancora in attesa", request, m_pending->request);
            return BusyError{ request };
        }
        m_pending.emplace(PendingRequest{ request, prefixes, std::nullopt });
    }

    // Scrittura fuori dal lock: i messaggi arrivati prima della registrazione non possono risolverla
    std::string err;
    if (!write(request, err)) {
        std::lock_guard<std::mutex> lk(m_mx);
        m_pending.reset();
        return DisconnectedError{ err };
    }

    std::unique_lock<std::mutex> lk(m_mx);
    const auto answered = [this] { return m_pending->result.has_value(); };
    if (unbounded) m_cv.wait(lk, answered);
    else m_cv.wait_until(lk, deadline, answered);

    RequestResult out = m_pending->result ? std::move(*m_pending->result) : RequestResult{ TimeoutError{ request } };
    m_pending.reset();
    if (std::holds_alternative<TimeoutError>(out)) {
        LOGF("Timeout in attesa della risposta a '{}'", request);
    }
    return out;
}

bool RequestCorrelator::offer(const DecodedMessage& msg) {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        if (!m_pending || m_pending->result) return false;
        if (!MatchesAny(msg.content, m_pending->prefixes)) return false;
        m_pending->result = msg;
    }
    m_cv.notify_all();
    return true;
}

void RequestCorrelator::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lk(m_mx);
        if (!m_pending || m_pending->result) return;
        m_pending->result = DisconnectedError{ reason };
    }
    m_cv.notify_all();
}

bool RequestCorrelator::hasPending() const {
    std::lock_guard<std::mutex> lk(m_mx);
    return m_pending.has_value();
}
