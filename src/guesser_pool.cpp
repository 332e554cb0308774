#include "typeguesser/guesser_pool.h"

#include <algorithm>
#include <thread>

namespace typeguesser {

void PooledGuesser::release() {
  if (pool_ && guesser_)
    pool_->release(std::move(guesser_));
  guesser_.reset();
  pool_ = nullptr;
}

GuesserPool::GuesserPool(size_t max_retained)
    : GuesserPool(GuessSettings(), max_retained, DeciderRegistry::shared()) {}

GuesserPool::GuesserPool(const GuessSettings& defaults, size_t max_retained,
                         const DeciderRegistry& registry)
    : registry_(registry), defaults_(defaults), max_retained_(max_retained) {
  idle_.reserve(max_retained_);
}

size_t GuesserPool::default_max_retained() {
  size_t threads = std::thread::hardware_concurrency();
  return std::max<size_t>(2, threads * 2);
}

PooledGuesser GuesserPool::acquire() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!idle_.empty()) {
      std::unique_ptr<Guesser> guesser = std::move(idle_.back());
      idle_.pop_back();
      return PooledGuesser(this, std::move(guesser));
    }
  }
  // Construct outside the lock
  return PooledGuesser(this, std::make_unique<Guesser>(defaults_, registry_));
}

void GuesserPool::release(std::unique_ptr<Guesser> guesser) {
  if (!guesser)
    return;
  guesser->reset();
  guesser->set_settings(defaults_);

  std::lock_guard<std::mutex> lock(mutex_);
  if (idle_.size() < max_retained_)
    idle_.push_back(std::move(guesser));
}

size_t GuesserPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

} // namespace typeguesser
