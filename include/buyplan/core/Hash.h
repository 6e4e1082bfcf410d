#pragma once
#include "buyplan/core/Types.h"

#include <string>
#include <string_view>

namespace buyplan::core {

// 64-bit FNV-1a. Stable across platforms; used for stage-output signatures.
u64 fnv1a64(std::string_view text);

// Order-sensitive combine of two 64-bit hashes.
u64 hashCombine(u64 a, u64 b);

// 16 lowercase hex digits.
std::string toHex64(u64 value);

} // namespace buyplan::core
