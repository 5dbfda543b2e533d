#ifndef BGJOBS_SHARED_STATE_CONCEPTS_HPP
#define BGJOBS_SHARED_STATE_CONCEPTS_HPP

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace bgjobs {

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept LockPolicy = Lockable<typename P::mutex_type> && requires {
  typename P::lock_type;
};

// =============================================================================
// Synchronization Primitive Concepts
// =============================================================================

template <typename S>
concept SlotSemaphore = requires(S s) {
  { s.acquire() } -> std::same_as<void>;
  { s.try_acquire() } -> std::convertible_to<bool>;
  { s.release() } -> std::same_as<void>;
  { s.available() } -> std::convertible_to<std::ptrdiff_t>;
  { s.capacity() } -> std::convertible_to<std::ptrdiff_t>;
  { s.wait_idle() } -> std::same_as<void>;
};

template <typename R, typename T>
concept ResultReader = requires(R r) {
  { r.read() } -> std::convertible_to<T>;
  { r.ready() } -> std::convertible_to<bool>;
};

// =============================================================================
// Job Concepts
// =============================================================================

// Anything copied into a background thread and handed to the unit of work.
template <typename C>
concept JobContext = std::copy_constructible<C> && std::is_object_v<C>;

template <typename F>
concept UnitOfWork = std::move_constructible<std::decay_t<F>> &&
                     std::invocable<std::decay_t<F> &>;

template <typename F, typename C>
concept ContextualUnitOfWork =
    JobContext<C> && std::move_constructible<std::decay_t<F>> &&
    std::invocable<std::decay_t<F> &, const C &>;

} // namespace bgjobs

#endif // BGJOBS_SHARED_STATE_CONCEPTS_HPP
