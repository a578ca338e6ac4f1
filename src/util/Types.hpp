#pragma once
// Types.hpp - Common type aliases

#include <cstddef>
#include <cstdint>

namespace cal {

using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f64 = double;
using usize = std::size_t;

} // namespace cal
