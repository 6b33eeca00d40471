#include "random.h"

#include <atomic>
#include <random>

#include "platform_util.h"

namespace tracewire {
namespace tracing {
namespace {

std::atomic<std::size_t> registrations{0};

class ThreadEngine {
  std::mt19937_64 engine_;
  std::uniform_int_distribution<std::uint64_t> uniform_;

 public:
  ThreadEngine() { reseed(); }

  std::uint64_t draw() { return uniform_(engine_); }

  void reseed() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    engine_.seed(seed);
  }
};

ThreadEngine& this_thread_engine() {
  thread_local ThreadEngine engine;
  return engine;
}

// Only the forking thread exists in the child.
void reseed_in_child() { this_thread_engine().reseed(); }

void register_fork_handler() {
  // `pthread_atfork` handlers are never removed, so register once per process.
  // If registration fails, a forked child draws its parent's sequence.
  static const int status = [] {
    ++registrations;
    return at_fork_in_child(&reseed_in_child);
  }();
  static_cast<void>(status);
}

}  // namespace

std::uint64_t random_uint64() {
  register_fork_handler();
  return this_thread_engine().draw();
}

std::size_t fork_handler_registrations() { return registrations.load(); }

}  // namespace tracing
}  // namespace tracewire
