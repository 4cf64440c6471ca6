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

#include <verity/types.hpp>

namespace verity::params {

constexpr size_t word_size  = verity::word_size;
constexpr size_t num_queues = num_queue_kinds;

// Every queue takes a head slot and a tail slot
constexpr size_t slots_per_queue = 2;
constexpr size_t num_slots       = num_queues * slots_per_queue;
constexpr size_t builder_size    = num_slots * word_size;

// Two scratch words, then the free-pointer word and the zero word;
// arena regions start right after
constexpr address_t free_pointer_location = 2 * word_size;
constexpr address_t zero_slot_location    = free_pointer_location + word_size;
constexpr address_t arena_origin          = zero_slot_location + word_size;

// Byte offsets of the builder slots, in layout order
namespace slot {
constexpr size_t challenge_head            = 0 * word_size;
constexpr size_t challenge_tail            = 1 * word_size;
constexpr size_t first_round_eval_head     = 2 * word_size;
constexpr size_t first_round_eval_tail     = 3 * word_size;
constexpr size_t final_round_eval_head     = 4 * word_size;
constexpr size_t final_round_eval_tail     = 5 * word_size;
constexpr size_t chi_eval_head             = 6 * word_size;
constexpr size_t chi_eval_tail             = 7 * word_size;
constexpr size_t rho_eval_head             = 8 * word_size;
constexpr size_t rho_eval_tail             = 9 * word_size;
}  // namespace slot

constexpr size_t head_slot(queue_kind k) noexcept {
    return index_of(k) * slots_per_queue * word_size;
}

constexpr size_t tail_slot(queue_kind k) noexcept {
    return head_slot(k) + word_size;
}

static_assert(free_pointer_location == 0x40 && arena_origin == 0x80);
static_assert(head_slot(queue_kind::rho_evaluation) == slot::rho_eval_head);
static_assert(tail_slot(queue_kind::rho_evaluation) + word_size == builder_size);

}  // namespace verity::params
