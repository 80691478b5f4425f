#ifndef CHECK_HARNESS_SYS_HPP
#define CHECK_HARNESS_SYS_HPP

#include <poll.h>

namespace ch {
namespace sys {
using poll_fn = int (*)(struct pollfd*, nfds_t, int);

// Replaceable so tests can simulate EINTR or failures in the reader loop.
extern poll_fn poll_impl;

int poll(struct pollfd* fds, nfds_t nfds, int timeout_ms);

void reset_to_default_poll();
} // namespace sys
} // namespace ch

#endif // CHECK_HARNESS_SYS_HPP
