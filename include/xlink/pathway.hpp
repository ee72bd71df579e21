/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file pathway.hpp
 * @brief Bounded blocking FIFO connecting producer handles to one consumer.
 *
 * A pathway carries values of exactly one type T. CreatePathway() returns a
 * PathwaySender<T> / PathwayReceiver<T> pair sharing one PathwayState:
 *
 *   PathwaySender<T> --+
 *   PathwaySender<T> --+--> [ ring of Capacity slots ] --> PathwayReceiver<T>
 *   (copies)           |        mutex + 2 condvars        (move-only)
 *
 * Close semantics:
 *   - Last PathwaySender destroyed: receiver drains the buffer, then Recv()
 *     returns an empty optional (end-of-stream).
 *   - PathwayReceiver destroyed or Close()d: every pending and future send
 *     fails with kSendFailed. Close() keeps buffered values receivable;
 *     destruction discards them.
 *
 * A send either enqueues the whole value or nothing: a timed-out SendFor()
 * or a failed Send() never leaves a partial element behind.
 *
 * Usage:
 * @code
 *   auto pair = xlink::CreatePathway<Ping>(8);
 *   auto& ends = pair.value();
 *   ends.sender.Send(Ping{1});
 *   auto msg = ends.receiver.Recv();   // optional<Ping>
 * @endcode
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef XLINK_PATHWAY_HPP_
#define XLINK_PATHWAY_HPP_

#include "xlink/platform.hpp"
#include "xlink/vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/// Largest accepted pathway capacity. Slots are allocated up front.
#ifndef XLINK_PATHWAY_MAX_CAPACITY
#define XLINK_PATHWAY_MAX_CAPACITY 65536U
#endif

namespace xlink {

static constexpr uint32_t kMaxPathwayCapacity = XLINK_PATHWAY_MAX_CAPACITY;

namespace detail {

// ============================================================================
// PathwayState -- shared by all handles of one pathway
// ============================================================================

template <typename T>
struct PathwayState {
  explicit PathwayState(uint32_t cap) : slots(cap), capacity(cap) {}

  bool IsFull() const noexcept { return count >= capacity; }

  void PushLocked(T&& value) noexcept {
    slots[(head + count) % capacity].emplace(std::move(value));
    ++count;
  }

  T PopLocked() noexcept {
    T value = std::move(slots[head].value());
    slots[head].reset();
    head = (head + 1U) % capacity;
    --count;
    return value;
  }

  void ClearLocked() noexcept {
    while (count > 0U) {
      slots[head].reset();
      head = (head + 1U) % capacity;
      --count;
    }
  }

  std::mutex mtx;
  std::condition_variable not_full;
  std::condition_variable not_empty;
  std::vector<optional<T>> slots;
  const uint32_t capacity;
  uint32_t head{0U};
  uint32_t count{0U};
  uint32_t senders{1U};
  bool closed{false};  ///< Receiver closed or destroyed.
};

}  // namespace detail

template <typename T>
class PathwayReceiver;

template <typename T>
struct PathwayPair;

template <typename T>
expected<PathwayPair<T>, LinkError> CreatePathway(uint32_t capacity) noexcept;

// ============================================================================
// PathwaySender<T>
// ============================================================================

/**
 * @brief Producer handle. Copies share the pathway and each counts as one
 *        producer; end-of-stream is signalled when the last copy goes away.
 */
template <typename T>
class PathwaySender final {
 public:
  PathwaySender(const PathwaySender& other) noexcept : state_(other.state_) {
    if (state_ != nullptr) {
      std::lock_guard<std::mutex> lk(state_->mtx);
      ++state_->senders;
    }
  }

  PathwaySender(PathwaySender&& other) noexcept
      : state_(std::move(other.state_)) {}

  PathwaySender& operator=(const PathwaySender& other) noexcept {
    if (this != &other) {
      PathwaySender tmp(other);
      Release();
      state_ = std::move(tmp.state_);
    }
    return *this;
  }

  PathwaySender& operator=(PathwaySender&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~PathwaySender() { Release(); }

  /**
   * @brief Enqueue @p value, blocking while the pathway is full.
   * @return kSendFailed if the receiver is (or becomes) closed.
   */
  expected<void, LinkError> Send(T value) const noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) {
      return expected<void, LinkError>::error(LinkError::kSendFailed);
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->not_full.wait(lk, [this] {
      return state_->closed || !state_->IsFull();
    });
    return PushAndNotify(lk, std::move(value));
  }

  /**
   * @brief Enqueue without blocking.
   * @return kQueueFull if no slot is free, kSendFailed if closed.
   */
  expected<void, LinkError> TrySend(T value) const noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) {
      return expected<void, LinkError>::error(LinkError::kSendFailed);
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    if (!state_->closed && state_->IsFull()) {
      return expected<void, LinkError>::error(LinkError::kQueueFull);
    }
    return PushAndNotify(lk, std::move(value));
  }

  /**
   * @brief Enqueue, blocking at most @p timeout_us microseconds.
   * @return kTimeout if still full at the deadline (nothing enqueued).
   */
  expected<void, LinkError> SendFor(T value, uint64_t timeout_us) const noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) {
      return expected<void, LinkError>::error(LinkError::kSendFailed);
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    bool ready = state_->not_full.wait_for(
        lk, std::chrono::microseconds(timeout_us),
        [this] { return state_->closed || !state_->IsFull(); });
    if (!ready) {
      return expected<void, LinkError>::error(LinkError::kTimeout);
    }
    return PushAndNotify(lk, std::move(value));
  }

  /** @brief True once the receiver has been closed or destroyed. */
  bool IsClosed() const noexcept {
    if (state_ == nullptr) return true;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->closed;
  }

  uint32_t Capacity() const noexcept {
    return (state_ != nullptr) ? state_->capacity : 0U;
  }

  uint32_t Size() const noexcept {
    if (state_ == nullptr) return 0U;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->count;
  }

 private:
  friend expected<PathwayPair<T>, LinkError> CreatePathway<T>(
      uint32_t capacity) noexcept;

  explicit PathwaySender(std::shared_ptr<detail::PathwayState<T>> state) noexcept
      : state_(std::move(state)) {}

  expected<void, LinkError> PushAndNotify(std::unique_lock<std::mutex>& lk,
                                          T&& value) const noexcept {
    if (state_->closed) {
      return expected<void, LinkError>::error(LinkError::kSendFailed);
    }
    state_->PushLocked(std::move(value));
    lk.unlock();
    state_->not_empty.notify_one();
    return expected<void, LinkError>::success();
  }

  void Release() noexcept {
    if (state_ == nullptr) return;
    bool last = false;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      last = (--state_->senders == 0U);
    }
    if (last) {
      state_->not_empty.notify_all();
    }
    state_.reset();
  }

  std::shared_ptr<detail::PathwayState<T>> state_;
};

// ============================================================================
// PathwayReceiver<T>
// ============================================================================

/**
 * @brief Consumer handle. Move-only; exactly one exists per pathway.
 */
template <typename T>
class PathwayReceiver final {
 public:
  PathwayReceiver(const PathwayReceiver&) = delete;
  PathwayReceiver& operator=(const PathwayReceiver&) = delete;

  PathwayReceiver(PathwayReceiver&& other) noexcept
      : state_(std::move(other.state_)) {}

  PathwayReceiver& operator=(PathwayReceiver&& other) noexcept {
    if (this != &other) {
      Drop();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~PathwayReceiver() { Drop(); }

  /**
   * @brief Dequeue the next value, blocking while the pathway is empty.
   * @return Empty optional on end-of-stream: buffer drained and either
   *         every sender is gone or Close() was called.
   */
  optional<T> Recv() noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) return optional<T>();
    std::unique_lock<std::mutex> lk(state_->mtx);
    state_->not_empty.wait(lk, [this] {
      return state_->count > 0U || state_->senders == 0U || state_->closed;
    });
    if (state_->count == 0U) {
      return optional<T>();
    }
    return optional<T>(PopAndNotify(lk));
  }

  /**
   * @brief Dequeue without blocking.
   * @return kEmpty if nothing is buffered, kChannelClosed at end-of-stream.
   */
  expected<T, LinkError> TryRecv() noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) {
      return expected<T, LinkError>::error(LinkError::kChannelClosed);
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    if (state_->count == 0U) {
      return expected<T, LinkError>::error(EmptyReasonLocked());
    }
    return expected<T, LinkError>::success(PopAndNotify(lk));
  }

  /**
   * @brief Dequeue, blocking at most @p timeout_us microseconds.
   * @return kTimeout on expiry, kChannelClosed at end-of-stream.
   */
  expected<T, LinkError> RecvFor(uint64_t timeout_us) noexcept {
    if (XLINK_UNLIKELY(state_ == nullptr)) {
      return expected<T, LinkError>::error(LinkError::kChannelClosed);
    }
    std::unique_lock<std::mutex> lk(state_->mtx);
    bool ready = state_->not_empty.wait_for(
        lk, std::chrono::microseconds(timeout_us), [this] {
          return state_->count > 0U || state_->senders == 0U || state_->closed;
        });
    if (!ready) {
      return expected<T, LinkError>::error(LinkError::kTimeout);
    }
    if (state_->count == 0U) {
      return expected<T, LinkError>::error(LinkError::kChannelClosed);
    }
    return expected<T, LinkError>::success(PopAndNotify(lk));
  }

  /**
   * @brief Refuse further sends. Already buffered values stay receivable;
   *        blocked senders wake up and fail with kSendFailed.
   */
  void Close() noexcept {
    if (state_ == nullptr) return;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      state_->closed = true;
    }
    state_->not_full.notify_all();
  }

  uint32_t Size() const noexcept {
    if (state_ == nullptr) return 0U;
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->count;
  }

  uint32_t Capacity() const noexcept {
    return (state_ != nullptr) ? state_->capacity : 0U;
  }

  /** @brief False for a moved-from handle. */
  bool IsValid() const noexcept { return state_ != nullptr; }

 private:
  friend expected<PathwayPair<T>, LinkError> CreatePathway<T>(
      uint32_t capacity) noexcept;

  explicit PathwayReceiver(std::shared_ptr<detail::PathwayState<T>> state) noexcept
      : state_(std::move(state)) {}

  LinkError EmptyReasonLocked() const noexcept {
    return (state_->senders == 0U || state_->closed) ? LinkError::kChannelClosed
                                                     : LinkError::kEmpty;
  }

  T PopAndNotify(std::unique_lock<std::mutex>& lk) noexcept {
    T value = state_->PopLocked();
    lk.unlock();
    state_->not_full.notify_one();
    return value;
  }

  void Drop() noexcept {
    if (state_ == nullptr) return;
    {
      std::lock_guard<std::mutex> lk(state_->mtx);
      state_->closed = true;
      state_->ClearLocked();
    }
    state_->not_full.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::PathwayState<T>> state_;
};

// ============================================================================
// CreatePathway
// ============================================================================

template <typename T>
struct PathwayPair {
  PathwaySender<T> sender;
  PathwayReceiver<T> receiver;
};

/**
 * @brief Create a pathway buffering up to @p capacity values of type T.
 * @return kInvalidCapacity when @p capacity is zero or above
 *         kMaxPathwayCapacity.
 */
template <typename T>
expected<PathwayPair<T>, LinkError> CreatePathway(uint32_t capacity) noexcept {
  if (capacity == 0U || capacity > kMaxPathwayCapacity) {
    return expected<PathwayPair<T>, LinkError>::error(
        LinkError::kInvalidCapacity);
  }
  auto state = std::make_shared<detail::PathwayState<T>>(capacity);
  return expected<PathwayPair<T>, LinkError>::success(
      PathwayPair<T>{PathwaySender<T>(state), PathwayReceiver<T>(state)});
}

}  // namespace xlink

#endif  // XLINK_PATHWAY_HPP_
