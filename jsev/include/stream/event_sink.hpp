//! # Event Sinks
//!
//! Destinations for the events produced by `StreamParser`. A sink reports
//! whether its consumer is still listening; the parser treats a refused event
//! as cancellation and stops.
//!
//! ## Available Sinks
//!
//! | Sink | Delivery |
//! |------|----------|
//! | `ChannelSink` | blocking hand-off through a `Channel<Event>` |
//! | `CallbackSink` | synchronous call on the parser's thread |

#pragma once

#include "stream/channel.hpp"
#include "stream/event.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <utility>

namespace jsev::stream {

/// Abstract consumer of parse events.
class EventSink {
public:
    virtual ~EventSink() = default;

    /// Delivers one event.
    ///
    /// # Returns
    ///
    /// `false` if the consumer is gone and the parse should stop.
    virtual auto emit(Event event) -> bool = 0;
};

/// Sends events through a channel.
///
/// With a deadline, a blocked send gives up once the deadline passes. The
/// terminal `EndOfStream` event is always sent without a deadline so the
/// consumer learns why the stream ended; closing the channel still releases it.
class ChannelSink : public EventSink {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    explicit ChannelSink(Channel<Event>& channel, Deadline deadline = std::nullopt)
        : channel_(channel), deadline_(deadline) {}

    auto emit(Event event) -> bool override {
        if (event.is_end()) {
            return channel_.send(std::move(event));
        }
        return channel_.send_until(std::move(event), deadline_);
    }

private:
    Channel<Event>& channel_;
    Deadline deadline_;
};

/// Calls a function for every event on the parser's thread.
class CallbackSink : public EventSink {
public:
    using Callback = std::function<bool(Event)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    auto emit(Event event) -> bool override {
        return callback_(std::move(event));
    }

private:
    Callback callback_;
};

} // namespace jsev::stream
