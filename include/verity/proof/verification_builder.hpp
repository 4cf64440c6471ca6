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
#include <span>

#include <verity/memory/arena.hpp>
#include <verity/params.hpp>
#include <verity/proof/word_queue.hpp>
#include <verity/types.hpp>

namespace verity {

/************************************************************
 * Value queues a verifier drains while checking one proof.
 *
 * Each of the five queues is set once from the transcript and
 * then consumed front to back. Running a queue dry throws
 * queue_exhausted, which must reject the whole verification.
 *
 * Re-setting a queue discards its previous cursors.
 ************************************************************/
struct verification_builder {
    verification_builder() = default;

    verification_builder(const verification_builder&) = delete;
    verification_builder& operator=(const verification_builder&) = delete;

    void set(queue_kind kind, std::span<const word_t> words);
    const word_t& consume(queue_kind kind);

    void set_challenges(std::span<const word_t> words) {
        set(queue_kind::challenge, words);
    }
    void set_first_round_evaluations(std::span<const word_t> words) {
        set(queue_kind::first_round_evaluation, words);
    }
    void set_final_round_evaluations(std::span<const word_t> words) {
        set(queue_kind::final_round_evaluation, words);
    }
    void set_chi_evaluations(std::span<const word_t> words) {
        set(queue_kind::chi_evaluation, words);
    }
    void set_rho_evaluations(std::span<const word_t> words) {
        set(queue_kind::rho_evaluation, words);
    }

    const word_t& consume_challenge() {
        return consume(queue_kind::challenge);
    }
    const word_t& consume_first_round_evaluation() {
        return consume(queue_kind::first_round_evaluation);
    }
    const word_t& consume_final_round_evaluation() {
        return consume(queue_kind::final_round_evaluation);
    }
    const word_t& consume_chi_evaluation() {
        return consume(queue_kind::chi_evaluation);
    }
    const word_t& consume_rho_evaluation() {
        return consume(queue_kind::rho_evaluation);
    }

    const word_queue& queue(queue_kind kind) const noexcept {
        return queues_[index_of(kind)];
    }

    size_t remaining(queue_kind kind)   const noexcept { return queue(kind).remaining(); }
    size_t head_offset(queue_kind kind) const noexcept { return queue(kind).head_offset(); }
    size_t tail_offset(queue_kind kind) const noexcept { return queue(kind).tail_offset(); }

    /// True when every queue has been consumed to its end.
    bool drained() const noexcept;

private:
    std::array<word_queue, params::num_queues> queues_;
};

using builder_arena_t = memory::bump_arena<verification_builder, params::builder_size>;
using builder_scope_t = memory::arena_scope<builder_arena_t>;

/// Process-wide arena every verification call allocates its builder from.
builder_arena_t& builder_arena();

}  // namespace verity
