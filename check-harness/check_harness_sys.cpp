#include "check_harness_sys.hpp"

namespace ch {
namespace sys {
poll_fn poll_impl = ::poll;

int poll(struct pollfd* fds, nfds_t nfds, int timeout_ms) {
  return poll_impl(fds, nfds, timeout_ms);
}

void reset_to_default_poll() {
  poll_impl = ::poll;
}
} // namespace sys
} // namespace ch
