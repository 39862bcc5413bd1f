#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace tradeguard {

namespace detail {

struct CancellationState {
  std::mutex mutex;
  bool cancelled{false};
  std::uint64_t next_registration{1};
  std::map<std::uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

// -----------------------------------------------------------------------------
// CancellationToken / CancellationSource
// -----------------------------------------------------------------------------
//
// @brief  Lets a caller that does not own a component ask it to shut down.
//
// @details
// A CancellationSource owns the shared state; tokens handed out by token()
// observe it. cancel() is one-shot: the first call marks the state and
// invokes every registered callback, later calls do nothing.
//
// A default-constructed token is never cancelled and ignores registrations,
// so components can take a token parameter with a {} default.
//
// Callbacks run on the thread that calls cancel(), while the state mutex is
// held. They must be short and must not call back into the token.
// unregisterCallback() takes the same mutex, so once it returns the callback
// is guaranteed not to be running and will never run again.
//
// Thread model:
//   All members are safe to call from any thread.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  using Registration = std::uint64_t;

  CancellationToken() = default;

  bool isCancelled() const {
    if (!state_) {
      return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  // -------------------------------------------------------------------------
  // registerCallback(callback)
  // -------------------------------------------------------------------------
  // @brief  Arranges for callback to run when the source is cancelled.
  //
  // @return A handle for unregisterCallback(), or 0 when nothing was
  //         registered (empty token, or already cancelled, in which case
  //         callback has been invoked synchronously).
  // -------------------------------------------------------------------------
  Registration registerCallback(std::function<void()> callback) const {
    if (!state_) {
      return 0;
    }
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) {
      callback();
      return 0;
    }
    Registration id = state_->next_registration++;
    state_->callbacks.emplace(id, std::move(callback));
    return id;
  }

  void unregisterCallback(Registration id) const {
    if (!state_ || id == 0) {
      return;
    }
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
  }

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
 public:
  CancellationSource()
      : state_(std::make_shared<detail::CancellationState>()) {}

  CancellationToken token() const { return CancellationToken(state_); }

  void cancel() {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
    for (auto& entry : state_->callbacks) {
      entry.second();
    }
    state_->callbacks.clear();
  }

  bool isCancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace tradeguard
