//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationChannel.cpp
// Purpose: Timer-signalled event queue on an Asio executor
//==========================================================================================================

#include "toolhost/http/CorrelationChannel.h"

#include <sstream>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace toolhost {
namespace http {

namespace net = boost::asio;

std::string FormatSseFrame(const StreamEvent& ev) {
    std::string out;
    if (!ev.event.empty()) {
        out += "event: " + ev.event + "\n";
    }
    std::istringstream lines(ev.data);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out += "data: " + line + "\n";
        any = true;
    }
    if (!any) {
        out += "data: \n";
    }
    out += "\n";
    return out;
}

CorrelationChannel::CorrelationChannel(net::any_io_executor ex)
    : executor(ex), signal(ex) {
    signal.expires_at(net::steady_timer::time_point::max());
}

void CorrelationChannel::Push(StreamEvent ev) {
    net::post(executor, [self = shared_from_this(), ev = std::move(ev)]() mutable {
        if (self->closed) {
            return;
        }
        self->queue.push_back(std::move(ev));
        self->signal.cancel();
    });
}

void CorrelationChannel::Close() {
    net::post(executor, [self = shared_from_this()]() {
        self->closed = true;
        self->signal.cancel();
    });
}

net::awaitable<std::optional<StreamEvent>> CorrelationChannel::Receive() {
    for (;;) {
        if (!queue.empty()) {
            StreamEvent ev = std::move(queue.front());
            queue.pop_front();
            co_return ev;
        }
        if (closed) {
            co_return std::nullopt;
        }
        signal.expires_at(net::steady_timer::time_point::max());
        boost::system::error_code ec;
        co_await signal.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
}

} // namespace http
} // namespace toolhost
