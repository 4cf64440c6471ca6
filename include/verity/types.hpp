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

#include <array>
#include <cstddef>
#include <cstdint>

namespace verity {

// Numeric Types
/* ------------------------------------------------------------ */
using u8  = uint8_t;
using u32 = uint32_t;
using u64 = uint64_t;

using address_t = u64;

// Word Type
/* ------------------------------------------------------------ */
constexpr size_t word_size = 32;

/// A 256-bit big-endian word, the unit every queue stores.
using word_t = std::array<u8, word_size>;

// Queue Kind
/* ------------------------------------------------------------ */
enum class queue_kind : u8 {
    challenge = 0,
    first_round_evaluation,
    final_round_evaluation,
    chi_evaluation,
    rho_evaluation,
};

constexpr size_t num_queue_kinds = 5;

constexpr std::array<queue_kind, num_queue_kinds> all_queue_kinds = {
    queue_kind::challenge,
    queue_kind::first_round_evaluation,
    queue_kind::final_round_evaluation,
    queue_kind::chi_evaluation,
    queue_kind::rho_evaluation,
};

constexpr size_t index_of(queue_kind k) noexcept {
    return static_cast<size_t>(k);
}

}  // namespace verity
