#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "vencode/timedef.hpp"

namespace vencode {

namespace internal {

// Shared state of a channel: a FIFO queue with an optional capacity bound, closable once.
template <class T>
class ChanState {
 public:
  explicit ChanState(std::size_t capacity) : _capacity(capacity) {}

  // Blocks while the queue is full. Returns false if the channel is closed.
  bool send(T value) {
    std::unique_lock lock(_mutex);
    _notFull.wait(lock, [this] { return _closed || _capacity == 0 || _queue.size() < _capacity; });
    if (_closed) {
      return false;
    }
    _queue.push_back(std::move(value));
    _notEmpty.notify_one();
    return true;
  }

  void close() {
    std::scoped_lock lock(_mutex);
    _closed = true;
    _notEmpty.notify_all();
    _notFull.notify_all();
  }

  std::optional<T> tryRecv() {
    std::scoped_lock lock(_mutex);
    return popFront();
  }

  // Blocks until a value is available or the channel is closed and drained.
  std::optional<T> recv() {
    std::unique_lock lock(_mutex);
    _notEmpty.wait(lock, [this] { return _closed || !_queue.empty(); });
    return popFront();
  }

  // Like recv(), but gives up at 'deadline'.
  std::optional<T> recvUntil(SteadyTimePoint deadline) {
    std::unique_lock lock(_mutex);
    _notEmpty.wait_until(lock, deadline, [this] { return _closed || !_queue.empty(); });
    return popFront();
  }

  [[nodiscard]] std::size_t size() const {
    std::scoped_lock lock(_mutex);
    return _queue.size();
  }

  [[nodiscard]] bool closed() const {
    std::scoped_lock lock(_mutex);
    return _closed;
  }

 private:
  std::optional<T> popFront() {
    if (_queue.empty()) {
      return std::nullopt;
    }
    std::optional<T> ret(std::move(_queue.front()));
    _queue.pop_front();
    _notFull.notify_one();
    return ret;
  }

  mutable std::mutex _mutex;
  std::condition_variable _notEmpty;
  std::condition_variable _notFull;
  std::deque<T> _queue;
  std::size_t _capacity;
  bool _closed{false};
};

}  // namespace internal

template <class T>
class RecvChan;

template <class T>
class SendChan;

// Handle on a thread-safe FIFO channel, shared by copies of the handle.
// A default constructed handle is nil. A capacity of 0 means unbounded.
template <class T>
class Chan {
 public:
  using value_type = T;

  Chan() noexcept = default;

  [[nodiscard]] static Chan make(std::size_t capacity = 0) {
    return Chan(std::make_shared<internal::ChanState<T>>(capacity));
  }

  bool send(T value) const { return _state->send(std::move(value)); }

  void close() const { _state->close(); }

  std::optional<T> tryRecv() const { return _state->tryRecv(); }

  std::optional<T> recv() const { return _state->recv(); }

  std::optional<T> recvUntil(SteadyTimePoint deadline) const { return _state->recvUntil(deadline); }

  [[nodiscard]] std::size_t size() const { return _state->size(); }

  [[nodiscard]] bool isNil() const noexcept { return _state == nullptr; }

  [[nodiscard]] RecvChan<T> recvOnly() const noexcept { return RecvChan<T>(_state); }

  [[nodiscard]] SendChan<T> sendOnly() const noexcept { return SendChan<T>(_state); }

 private:
  explicit Chan(std::shared_ptr<internal::ChanState<T>> state) noexcept : _state(std::move(state)) {}

  std::shared_ptr<internal::ChanState<T>> _state;
};

// Receive-only view of a channel.
template <class T>
class RecvChan {
 public:
  using value_type = T;

  RecvChan() noexcept = default;

  std::optional<T> tryRecv() const { return _state->tryRecv(); }

  std::optional<T> recv() const { return _state->recv(); }

  std::optional<T> recvUntil(SteadyTimePoint deadline) const { return _state->recvUntil(deadline); }

  [[nodiscard]] std::size_t size() const { return _state->size(); }

  [[nodiscard]] bool isNil() const noexcept { return _state == nullptr; }

 private:
  friend class Chan<T>;

  explicit RecvChan(std::shared_ptr<internal::ChanState<T>> state) noexcept : _state(std::move(state)) {}

  std::shared_ptr<internal::ChanState<T>> _state;
};

// Send-only view of a channel.
template <class T>
class SendChan {
 public:
  using value_type = T;

  SendChan() noexcept = default;

  bool send(T value) const { return _state->send(std::move(value)); }

  void close() const { _state->close(); }

  [[nodiscard]] std::size_t size() const { return _state->size(); }

  [[nodiscard]] bool isNil() const noexcept { return _state == nullptr; }

 private:
  friend class Chan<T>;

  explicit SendChan(std::shared_ptr<internal::ChanState<T>> state) noexcept : _state(std::move(state)) {}

  std::shared_ptr<internal::ChanState<T>> _state;
};

}  // namespace vencode
