#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases for the spritefx library.
 */

namespace spritefx {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

}
