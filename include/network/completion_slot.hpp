// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef KERNELSHIM_NETWORK_COMPLETION_SLOT_HPP
#define KERNELSHIM_NETWORK_COMPLETION_SLOT_HPP

#include <optional>

namespace kernelshim {
namespace network {

/**
 * CompletionSlot - single-value exchange shared by the two forwarders of one
 * relayed connection
 *
 * The first offered completion code is kept; every later offer is a no-op.
 * Only touched from the io_context thread.
 */
class CompletionSlot {
public:
  // Returns true if this offer filled the slot
  bool offer(int code) {
    if (value_) {
      return false;
    }
    value_ = code;
    return true;
  }

  bool filled() const { return value_.has_value(); }
  std::optional<int> value() const { return value_; }

private:
  std::optional<int> value_;
};

} // namespace network
} // namespace kernelshim

#endif // KERNELSHIM_NETWORK_COMPLETION_SLOT_HPP
