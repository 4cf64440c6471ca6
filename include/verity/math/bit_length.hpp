/*
 * Copyright (C) 2023-2025 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>

#include <gmpxx.h>

#include <verity/types.hpp>

namespace verity::math {

/************************************************************
 * Compute max(1, ceil(log2(n))), the round count needed to
 * cover n entries.
 *
 * Example:
 *     log2_up(0)    -> 1
 *     log2_up(1)    -> 1
 *     log2_up(2)    -> 1
 *     log2_up(5)    -> 3
 *     log2_up(1024) -> 10
 *
 * @param n  Number of entries
 * @return   Smallest e >= 1 with 2^e >= n
 ************************************************************/
constexpr u64 log2_up(u64 n) noexcept {
    constexpr u64 max_exponent = std::numeric_limits<u64>::digits;

    const u64 m = (n != 0) ? n - 1 : 0;
    u64 exponent = 1;
    while (exponent < max_exponent && (m >> exponent) != 0) {
        ++exponent;
    }
    return exponent;
}

/************************************************************
 * Same as above over an arbitrary precision value, so the
 * full 256-bit word range is covered.
 *
 * @param n  Non-negative number of entries
 * @return   Smallest e >= 1 with 2^e >= n
 ************************************************************/
inline size_t log2_up(const mpz_class& n) {
    if (sgn(n) < 0) {
        throw std::invalid_argument("log2_up: negative argument");
    }

    if (n <= 1) {
        return 1;
    }

    mpz_class m = n - 1;
    // mpz_sizeinbase is exact for base 2
    return mpz_sizeinbase(m.get_mpz_t(), 2);
}

static_assert(log2_up(u64{0}) == 1);
static_assert(log2_up(u64{3}) == 2);
static_assert(log2_up(u64{1025}) == 11);
static_assert(log2_up(std::numeric_limits<u64>::max()) == 64);

}  // namespace verity::math
