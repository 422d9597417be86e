//! # Channel
//!
//! A blocking message-passing queue between one producer thread and one
//! consumer thread.
//!
//! ## Hand-off Modes
//!
//! | Capacity | `send()` returns when... |
//! |----------|--------------------------|
//! | 0 (default) | the receiver has taken the item (rendezvous) |
//! | N > 0 | the item is buffered (blocks while N items are pending) |
//!
//! ## Closing
//!
//! Either side may `close()` the channel. Blocked and future `send()` calls
//! return `false`; an item whose rendezvous had not completed is dropped.
//! `receive()` keeps returning buffered items and then `std::nullopt`.
//!
//! ## Example
//!
//! ```cpp
//! Channel<Event> channel;
//! std::thread producer([&] { parser.parse(channel); });
//! while (auto event = channel.receive()) {
//!     handle(*event);
//! }
//! producer.join();
//! ```

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace jsev::stream {

template <typename T> class Channel {
public:
    /// Creates a channel; capacity 0 makes every send a rendezvous.
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Sends `value`, blocking according to the channel's capacity.
    ///
    /// # Returns
    ///
    /// `true` if the value was delivered (rendezvous) or buffered, `false` if the
    /// channel was closed first.
    auto send(T value) -> bool {
        return send_until(std::move(value), std::nullopt);
    }

    /// Like `send()`, but gives up at `deadline`.
    ///
    /// # Returns
    ///
    /// `false` if the channel was closed or the deadline passed before the
    /// hand-off completed. A value not yet taken is withdrawn.
    auto send_until(T value, std::optional<std::chrono::steady_clock::time_point> deadline)
        -> bool {
        std::unique_lock<std::mutex> lock(mutex_);

        const size_t limit = capacity_ > 0 ? capacity_ : 1;
        if (!wait(lock, deadline, [this, limit] { return closed_ || queue_.size() < limit; })) {
            return false;
        }
        if (closed_) {
            return false;
        }

        queue_.push_back(std::move(value));
        const uint64_t ticket = ++sent_;
        ready_.notify_all();

        if (capacity_ > 0) {
            return true;
        }

        bool taken =
            wait(lock, deadline, [this, ticket] { return received_ >= ticket || closed_; });
        if (received_ >= ticket) {
            return true;
        }
        if (!taken || closed_) {
            // Still queued: it is necessarily the last item since capacity is one.
            if (!queue_.empty() && sent_ == ticket) {
                queue_.pop_back();
                --sent_;
                space_.notify_all();
            }
        }
        return false;
    }

    /// Blocks until an item is available or the channel is closed and drained.
    auto receive() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return take(lock);
    }

    /// Like `receive()`, but returns `std::nullopt` after `timeout` as well.
    auto receive_for(std::chrono::milliseconds timeout) -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return take(lock);
    }

    /// Closes the channel and wakes every blocked sender and receiver.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ready_.notify_all();
        space_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto capacity() const -> size_t {
        return capacity_;
    }

private:
    template <typename Pred>
    auto wait(std::unique_lock<std::mutex>& lock,
              const std::optional<std::chrono::steady_clock::time_point>& deadline, Pred pred)
        -> bool {
        if (deadline) {
            return space_.wait_until(lock, *deadline, pred);
        }
        space_.wait(lock, pred);
        return true;
    }

    /// Pops the front item. After close, a rendezvous item is left for its
    /// sender to withdraw.
    auto take(std::unique_lock<std::mutex>& /*lock*/) -> std::optional<T> {
        if (queue_.empty() || (closed_ && capacity_ == 0)) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        ++received_;
        space_.notify_all();
        return value;
    }

    const size_t capacity_;
    std::deque<T> queue_;
    uint64_t sent_ = 0;
    uint64_t received_ = 0;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable ready_; ///< Signalled when an item is queued or on close
    std::condition_variable space_; ///< Signalled when an item is taken or on close
};

} // namespace jsev::stream
