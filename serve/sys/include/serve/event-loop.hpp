#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "serve/base-fd.hpp"
#include "serve/event.hpp"
#include "serve/timedef.hpp"

namespace serve {

// Thin RAII wrapper over epoll.
//  * The ready-event buffer starts with kInitialCapacity slots and doubles each time a poll
//    returns exactly capacity() events. It never shrinks.
//  * add()/mod()/del() log details on failure; the caller decides the policy (drop connection, abort).
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    int fd;
    EventBmp eventBmp;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if epoll cannot be created.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Failures are logged at debug level (fd may already be closed).
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal, reusable buffer.
  //  - On success: a non-empty span of ready events.
  //  - On timeout or EINTR: an empty span with a non-null data() pointer.
  //  - On unrecoverable failure (already logged): an empty span with a null data() pointer.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

 private:
  int _pollTimeoutMs{0};
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace serve
