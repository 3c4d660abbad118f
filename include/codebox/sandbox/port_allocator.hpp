#pragma once

#include "codebox/common/result.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>

namespace codebox::sandbox {

using PortProbe = std::function<bool(std::uint16_t)>;

/// True when a TCP listener can bind 127.0.0.1:<port> right now.
[[nodiscard]] bool is_port_bindable(std::uint16_t port);

/// Hands out the lowest port of [first, last] that is neither reserved nor rejected by the
/// probe. Thread-safe.
class PortAllocator {
public:
  PortAllocator(std::uint16_t first, std::uint16_t last, PortProbe probe = is_port_bindable);

  [[nodiscard]] common::Result<std::uint16_t> allocate();
  void release(std::uint16_t port);

  [[nodiscard]] bool is_reserved(std::uint16_t port) const;
  [[nodiscard]] std::size_t reserved_count() const;
  [[nodiscard]] std::uint16_t first() const { return first_; }
  [[nodiscard]] std::uint16_t last() const { return last_; }

private:
  std::uint16_t first_;
  std::uint16_t last_;
  PortProbe probe_;
  mutable std::mutex mutex_;
  std::set<std::uint16_t> reserved_;
};

} // namespace codebox::sandbox
