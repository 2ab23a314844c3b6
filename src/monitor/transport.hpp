#pragma once

#include "monitor/delivery_buffer.hpp"
#include <asio/awaitable.hpp>
#include <string>

namespace beacon {

// Delivers one signed batch to the hub.
class event_transport {
public:
    virtual ~event_transport() = default;

    // Never throws for network or HTTP failures; those are reported in the result.
    virtual asio::awaitable<submit_result> submit(std::string body, std::string signature) = 0;

    // Aborts an in-flight request. Safe to call from any thread.
    virtual void cancel() {}
};

} // namespace beacon
