#include "codebox/sandbox/port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace codebox::sandbox {

bool is_port_bindable(const std::uint16_t port) {
  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const bool bound = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
  close(fd);
  return bound;
}

PortAllocator::PortAllocator(const std::uint16_t first, const std::uint16_t last, PortProbe probe)
    : first_(first), last_(last), probe_(std::move(probe)) {}

common::Result<std::uint16_t> PortAllocator::allocate() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::uint32_t candidate = first_; candidate <= last_; ++candidate) {
    const auto port = static_cast<std::uint16_t>(candidate);
    if (reserved_.contains(port)) {
      continue;
    }
    if (probe_ && !probe_(port)) {
      continue;
    }
    reserved_.insert(port);
    return common::Result<std::uint16_t>::success(port);
  }
  return common::Result<std::uint16_t>::failure("no free port in range " + std::to_string(first_) +
                                                    "-" + std::to_string(last_),
                                                common::ErrorCode::RuntimeUnavailable);
}

void PortAllocator::release(const std::uint16_t port) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_.erase(port);
}

bool PortAllocator::is_reserved(const std::uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.contains(port);
}

std::size_t PortAllocator::reserved_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.size();
}

} // namespace codebox::sandbox
