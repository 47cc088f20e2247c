// =============================================================================
// blkstore - Error Channels
// =============================================================================
// Bounded, closeable channels and the fan-in merge used to observe failures
// from many concurrent block operations through one sink.
//
// This module provides:
// - Channel<T>: bounded MPMC queue with close semantics and stop_token-aware
//   receive
// - ErrorChannel: Channel<Error>, one per operation; an operation sends at
//   most one error and then closes it
// - MergedErrors / mergeErrorChannels(): forwards every input's error into a
//   single output whose capacity equals the number of inputs, then closes the
//   output exactly once
// =============================================================================

#ifndef BLKSTORE_CONCURRENCY_ERROR_CHANNEL_H
#define BLKSTORE_CONCURRENCY_ERROR_CHANNEL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

#include "blkstore/common/error.h"

namespace blkstore::concurrency {

// =============================================================================
// Channel
// =============================================================================

/// @brief Bounded FIFO channel that can be closed.
///
/// Once closed, send() fails and receive() drains what is left before
/// reporting the end of the channel.
template <typename T>
class Channel {
public:
    /// @brief Construct with a fixed capacity (at least 1).
    explicit Channel(std::size_t capacity = 1) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueue a value, blocking while the channel is full.
    /// @return false if the channel is (or becomes) closed; the value is dropped.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    /// @brief Like send(), but gives up once @p stopToken is triggered.
    /// @return false if closed or stopped; the value is dropped.
    bool send(T value, std::stop_token stopToken) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, stopToken, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_ || stopToken.stop_requested()) {
            return false;
        }
        queue_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    /// @brief Enqueue a value if there is room.
    /// @return false if full or closed.
    bool trySend(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(value));
        notEmpty_.notify_one();
        return true;
    }

    /// @brief Dequeue a value, blocking until one arrives or the channel is
    ///        closed and drained.
    [[nodiscard]] std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    /// @brief Like receive(), but gives up once @p stopToken is triggered.
    /// @return std::nullopt when closed and drained, or when stopped; a stop
    ///         request wins over a value that is already queued.
    [[nodiscard]] std::optional<T> receive(std::stop_token stopToken) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, stopToken, [this] { return closed_ || !queue_.empty(); });
        if (stopToken.stop_requested()) {
            return std::nullopt;
        }
        return popLocked();
    }

    /// @brief Close the channel.
    /// @return true for the call that closed it, false if it was already closed.
    bool close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
        return true;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// @brief Number of queued values.
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::optional<T> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        notFull_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any notEmpty_;
    std::condition_variable_any notFull_;
    std::deque<T> queue_;
    bool closed_ = false;
};

/// @brief One-shot failure channel of a single operation.
using ErrorChannel = Channel<Error>;

/// @brief Create an error channel for one operation (capacity 1).
[[nodiscard]] inline std::shared_ptr<ErrorChannel> makeErrorChannel() {
    return std::make_shared<ErrorChannel>(1);
}

// =============================================================================
// MergedErrors
// =============================================================================

/// @brief Fan-in of several error channels into one output channel.
///
/// One forwarder thread per input moves that input's error (if any) to the
/// output; a completion thread joins the forwarders and then closes the
/// output. Forwarders stop waiting when the cancellation token fires and
/// drop whatever their input produces afterwards.
///
/// Destroying the object cancels forwarders that are still waiting and joins
/// every thread.
class MergedErrors {
public:
    /// @brief Start forwarding.
    /// @param cancel Shared cancellation signal.
    /// @param inputs Channels to merge; null entries are ignored.
    MergedErrors(std::stop_token cancel, std::vector<std::shared_ptr<ErrorChannel>> inputs);

    ~MergedErrors();

    MergedErrors(const MergedErrors&) = delete;
    MergedErrors& operator=(const MergedErrors&) = delete;
    MergedErrors(MergedErrors&&) = delete;
    MergedErrors& operator=(MergedErrors&&) = delete;

    /// @brief The merged output; closed once every forwarder has finished.
    [[nodiscard]] const std::shared_ptr<ErrorChannel>& output() const noexcept { return output_; }

    /// @brief Next merged error, or std::nullopt once the output is closed.
    [[nodiscard]] std::optional<Error> receive() { return output_->receive(); }

    /// @brief Receive until the output closes.
    [[nodiscard]] std::vector<Error> drain();

private:
    void forward(const std::shared_ptr<ErrorChannel>& input);

    /// @brief Stop forwarding and join every started thread; the output ends closed.
    void stopAndJoin() noexcept;

    std::shared_ptr<ErrorChannel> output_;
    std::stop_source stopSource_;
    std::optional<std::stop_callback<std::function<void()>>> cancelLink_;
    std::vector<std::thread> forwarders_;
    std::thread closer_;
};

/// @brief Merge @p channels into a single error channel.
/// @param cancel Cancellation signal; once triggered, unforwarded errors are
///               abandoned and the output still closes.
/// @param channels Per-operation error channels.
/// @return Owner of the forwarding threads and of the merged output.
[[nodiscard]] std::unique_ptr<MergedErrors> mergeErrorChannels(
    std::stop_token cancel, std::vector<std::shared_ptr<ErrorChannel>> channels);

}  // namespace blkstore::concurrency

#endif  // BLKSTORE_CONCURRENCY_ERROR_CHANNEL_H
