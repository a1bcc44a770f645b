#pragma once

#include <cstdint>

namespace payledger {
namespace common {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

}  // namespace common
}  // namespace payledger
