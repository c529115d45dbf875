#include "FrameChannel.hpp"

#include "FdUtils.hpp"

namespace specter {
FrameChannel::FrameChannel() : totalBytes(0), closed(false) {
  FATAL_FAIL(::pipe(wakePipe));
  FdUtils::setNonBlocking(wakePipe[0]);
  FdUtils::setNonBlocking(wakePipe[1]);
  FdUtils::setCloseOnExec(wakePipe[0]);
  FdUtils::setCloseOnExec(wakePipe[1]);
}

FrameChannel::~FrameChannel() {
  ::close(wakePipe[0]);
  ::close(wakePipe[1]);
}

bool FrameChannel::push(const Frame &frame) {
  {
    lock_guard<std::mutex> guard(channelMutex);
    if (closed) {
      VLOG(2) << "Dropping " << frame.getType() << " frame on closed channel";
      return false;
    }
    pending.push_back(frame);
    totalBytes += frame.payloadSize();
  }
  frameReady.notify_one();
  wake();
  return true;
}

bool FrameChannel::pop(Frame *frame) {
  lock_guard<std::mutex> guard(channelMutex);
  if (pending.empty()) {
    return false;
  }
  *frame = pending.front();
  totalBytes -= pending.front().payloadSize();
  pending.pop_front();
  return true;
}

bool FrameChannel::waitPop(Frame *frame, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(channelMutex);
  if (!frameReady.wait_for(lock, timeout,
                           [this] { return !pending.empty() || closed; })) {
    return false;
  }
  if (pending.empty()) {
    return false;
  }
  *frame = pending.front();
  totalBytes -= pending.front().payloadSize();
  pending.pop_front();
  return true;
}

void FrameChannel::close() {
  {
    lock_guard<std::mutex> guard(channelMutex);
    if (closed) {
      return;
    }
    closed = true;
  }
  frameReady.notify_all();
  wake();
}

bool FrameChannel::isClosed() const {
  lock_guard<std::mutex> guard(channelMutex);
  return closed;
}

bool FrameChannel::isDrained() const {
  lock_guard<std::mutex> guard(channelMutex);
  return closed && pending.empty();
}

size_t FrameChannel::size() const {
  lock_guard<std::mutex> guard(channelMutex);
  return pending.size();
}

size_t FrameChannel::pendingBytes() const {
  lock_guard<std::mutex> guard(channelMutex);
  return totalBytes;
}

void FrameChannel::wake() {
  char b = 1;
  int rc = ::write(wakePipe[1], &b, 1);
  // A full pipe already guarantees the consumer will wake up.
  if (rc < 0 && GetErrno() != EAGAIN && GetErrno() != EWOULDBLOCK) {
    STERROR << "Cannot signal frame channel: " << strerror(GetErrno());
  }
}

void FrameChannel::drainWakeFd() {
  char b[256];
  while (::read(wakePipe[0], b, sizeof(b)) > 0) {
  }
}
}  // namespace specter
