#pragma once

#include "guesser.h"
#include "registry.h"
#include "settings.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace typeguesser {

class GuesserPool;

// Move-only handle to a checked-out Guesser. Returns it to the pool when
// destroyed or released.
class PooledGuesser {
public:
  PooledGuesser() = default;
  PooledGuesser(GuesserPool* pool, std::unique_ptr<Guesser> guesser)
      : pool_(pool), guesser_(std::move(guesser)) {}
  ~PooledGuesser() { release(); }

  PooledGuesser(PooledGuesser&& other) noexcept = default;
  PooledGuesser& operator=(PooledGuesser&& other) noexcept {
    if (this != &other) {
      release();
      pool_ = other.pool_;
      guesser_ = std::move(other.guesser_);
    }
    return *this;
  }

  PooledGuesser(const PooledGuesser&) = delete;
  PooledGuesser& operator=(const PooledGuesser&) = delete;

  Guesser& operator*() const { return *guesser_; }
  Guesser* operator->() const { return guesser_.get(); }
  Guesser* get() const { return guesser_.get(); }
  explicit operator bool() const { return guesser_ != nullptr; }

  // Hands the guesser back early; the handle is empty afterwards.
  void release();

private:
  GuesserPool* pool_ = nullptr;
  std::unique_ptr<Guesser> guesser_;
};

/**
 * @brief Thread-safe cache of reusable Guessers.
 *
 * acquire() hands out a Guesser exactly as it was returned; it never resets.
 * Returning one (by dropping its PooledGuesser) resets it and restores the
 * pool's default settings before it becomes available again, so callers
 * always receive a clean instance. Guessers returned while the pool already
 * holds max_retained() idle instances are destroyed.
 *
 * The pool must outlive every PooledGuesser it hands out.
 *
 * @example
 * @code
 * typeguesser::GuesserPool pool;
 * {
 *   auto guesser = pool.acquire();
 *   guesser->adjust_to_compensate_for_value("42");
 *   auto request = guesser->guess();
 * } // returned and reset here
 * @endcode
 */
class GuesserPool {
public:
  explicit GuesserPool(size_t max_retained = default_max_retained());
  GuesserPool(const GuessSettings& defaults, size_t max_retained,
              const DeciderRegistry& registry = DeciderRegistry::shared());

  GuesserPool(const GuesserPool&) = delete;
  GuesserPool& operator=(const GuesserPool&) = delete;

  PooledGuesser acquire();

  // Resets the guesser and makes it available again.
  void release(std::unique_ptr<Guesser> guesser);

  // Idle guessers currently held.
  size_t available() const;
  size_t max_retained() const { return max_retained_; }

  const GuessSettings& default_settings() const { return defaults_; }

  // Twice the hardware concurrency, at least 2.
  static size_t default_max_retained();

private:
  const DeciderRegistry& registry_;
  const GuessSettings defaults_;
  const size_t max_retained_;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Guesser>> idle_;
};

} // namespace typeguesser
