#pragma once
#include "Core/Events.hpp"

// Osservatore di tutto il traffico del link. Chiamato dal thread di lettura:
// le eccezioni vengono intercettate e loggate, mai propagate al loop.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual void onMessage(const DecodedMessage& msg) = 0;
    virtual void onDecodeError(const InvalidMessage& msg) = 0;
    virtual void onStateChanged(const StateChange& change) = 0;
};
