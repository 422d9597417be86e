#include "stream/event_stream.hpp"

#include "log/log.hpp"

namespace jsev::stream {

EventStream::EventStream(Box<ByteSource> source, ParserOptions options, size_t capacity)
    : source_(std::move(source)), channel_(capacity), parser_(*source_, options) {
    worker_ = std::thread([this] {
        JSEV_LOG_DEBUG("stream", "worker started");
        bool ok = parser_.parse(channel_);
        JSEV_LOG_DEBUG("stream", "worker finished (" << (ok ? "ok" : "error") << ", "
                                                     << parser_.events_emitted() << " events)");
    });
}

EventStream::~EventStream() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto EventStream::next() -> std::optional<Event> {
    return channel_.receive();
}

void EventStream::cancel() {
    if (!channel_.is_closed()) {
        JSEV_LOG_DEBUG("stream", "cancelling parse");
        channel_.close();
    }
}

} // namespace jsev::stream
