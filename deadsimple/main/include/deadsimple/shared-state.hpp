#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace deadsimple {

// Thrown when acquiring a SharedState whose previous holder exited with an exception.
class PoisonedStateError : public std::runtime_error {
 public:
  PoisonedStateError() : std::runtime_error("shared state is poisoned: a previous holder failed while holding it") {}
};

// Single application-defined value shared by all concurrently running handlers.
// The value is only reachable through an exclusive lock: there is no unsynchronized access path.
//
// If a holder leaves its critical section because of an exception, the value may be half updated. The state is
// then poisoned and every later acquisition throws PoisonedStateError instead of exposing it.
template <class T>
class SharedState {
 public:
  // Exclusive access to the value, released on destruction.
  class Guard {
   public:
    Guard(const Guard&) = delete;
    Guard(Guard&&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;

    ~Guard() {
      if (std::uncaught_exceptions() > _nbUncaughtExceptions) {
        _owner._poisoned.store(true, std::memory_order_release);
      }
    }

    T& operator*() noexcept { return _owner._value; }
    T* operator->() noexcept { return &_owner._value; }

   private:
    friend class SharedState;

    explicit Guard(SharedState& owner) : _owner(owner), _lock(owner._mutex) {
      if (_owner._poisoned.load(std::memory_order_acquire)) {
        throw PoisonedStateError();
      }
    }

    SharedState& _owner;
    std::unique_lock<std::mutex> _lock;
    int _nbUncaughtExceptions{std::uncaught_exceptions()};
  };

  explicit SharedState(T initial) noexcept(std::is_nothrow_move_constructible_v<T>) : _value(std::move(initial)) {}

  SharedState(const SharedState&) = delete;
  SharedState(SharedState&&) = delete;
  SharedState& operator=(const SharedState&) = delete;
  SharedState& operator=(SharedState&&) = delete;

  ~SharedState() = default;

  // Block until exclusive access is obtained.
  // Throws PoisonedStateError if a previous holder failed.
  [[nodiscard]] Guard lock() { return Guard(*this); }

  // Run func(T&) under the lock and return its result. If func throws, the state gets poisoned and the exception
  // propagates.
  template <class Func>
  decltype(auto) withLock(Func&& func) {
    Guard guard(*this);
    return std::invoke(std::forward<Func>(func), *guard);
  }

  [[nodiscard]] bool isPoisoned() const noexcept { return _poisoned.load(std::memory_order_acquire); }

 private:
  std::mutex _mutex;
  std::atomic<bool> _poisoned{false};
  T _value;
};

}  // namespace deadsimple
