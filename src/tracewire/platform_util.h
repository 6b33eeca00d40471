#pragma once

// This component provides platform-dependent miscellanea.

namespace tracewire {
namespace tracing {

// Arrange for the specified `on_fork` to be called in the child process after
// this process forks. Return zero on success, or a nonzero error number
// otherwise.
int at_fork_in_child(void (*on_fork)());

}  // namespace tracing
}  // namespace tracewire
