//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationChannel.h
// Purpose: Per-request event queue between a dispatched request and the HTTP task writing its reply
//==========================================================================================================

#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace toolhost {
namespace http {

//==========================================================================================================
// StreamEvent
// Purpose: One outbound frame.
// Fields:
//   event: SSE event name.
//   data: Serialized JSON payload.
//   terminal: True for the Response/Error that ends the request.
//==========================================================================================================
struct StreamEvent {
    std::string event{"message"};
    std::string data;
    bool terminal{false};
};

// Formats an event as an SSE frame ("event: <name>\ndata: <line>\n...\n\n").
std::string FormatSseFrame(const StreamEvent& ev);

//==========================================================================================================
// CorrelationChannel
// Purpose: Single-consumer queue of StreamEvents for one request id.
// Thread-safety:
//   - Push() and Close() may be called from any thread; they post onto the channel's executor.
//   - Receive() must be awaited on the channel's executor by a single consumer.
// Notes:
//   - Receive() drains queued events before reporting closure, so a terminal event pushed before
//     Close() is never lost.
//==========================================================================================================
class CorrelationChannel : public std::enable_shared_from_this<CorrelationChannel> {
public:
    explicit CorrelationChannel(boost::asio::any_io_executor executor);

    void Push(StreamEvent ev);
    void Close();

    //==========================================================================================================
    // Receive
    // Returns:
    //   Next event, or std::nullopt once the channel is closed and drained.
    //==========================================================================================================
    boost::asio::awaitable<std::optional<StreamEvent>> Receive();

private:
    boost::asio::any_io_executor executor;
    boost::asio::steady_timer signal;
    std::deque<StreamEvent> queue;
    bool closed{false};
};

} // namespace http
} // namespace toolhost
