//! # Event Stream
//!
//! Runs a `StreamParser` on a dedicated worker thread and hands its events to
//! the consuming thread through a `Channel<Event>`.
//!
//! ## Lifecycle
//!
//! The worker starts in the constructor. The consumer calls `next()` until it
//! returns `std::nullopt`; the last event before that is `EndOfStream`.
//! Calling `cancel()` or destroying the stream early closes the channel: the
//! worker's pending send fails, the parse stops with a `Cancelled` error and
//! the destructor joins the worker, releasing the source.
//!
//! ## Example
//!
//! ```cpp
//! auto source = FileSource::open("huge.json");
//! if (is_ok(source)) {
//!     EventStream events(std::move(unwrap(source)));
//!     while (auto event = events.next()) {
//!         if (event->is_error()) {
//!             std::cerr << event->error->to_string() << "\n";
//!         }
//!     }
//! }
//! ```

#pragma once

#include "common.hpp"
#include "stream/byte_source.hpp"
#include "stream/channel.hpp"
#include "stream/event.hpp"
#include "stream/parser.hpp"

#include <optional>
#include <thread>

namespace jsev::stream {

class EventStream {
public:
    /// Takes ownership of `source` and starts parsing it on a worker thread.
    ///
    /// # Arguments
    ///
    /// * `source` - Bytes to parse
    /// * `options` - Parser configuration
    /// * `capacity` - Channel capacity, 0 for rendezvous hand-off
    explicit EventStream(Box<ByteSource> source, ParserOptions options = {}, size_t capacity = 0);

    /// Cancels the parse if it is still running and joins the worker.
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Blocks for the next event.
    ///
    /// # Returns
    ///
    /// The next event, or `std::nullopt` once the stream has ended or was
    /// cancelled.
    auto next() -> std::optional<Event>;

    /// Stops the parse. Events already buffered may still be returned by `next()`.
    void cancel();

private:
    Box<ByteSource> source_;
    Channel<Event> channel_;
    StreamParser parser_;
    std::thread worker_;
};

} // namespace jsev::stream
