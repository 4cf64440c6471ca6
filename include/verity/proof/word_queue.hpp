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
#include <span>

#include <verity/proof/error.hpp>
#include <verity/types.hpp>

namespace verity {

/************************************************************
 * FIFO view over a borrowed run of words.
 *
 * The queue never copies: whoever calls set() keeps the words
 * alive and unmodified until the queue is dropped. Head and
 * tail are word indices; the byte offsets the builder layout
 * talks about are index * word_size.
 ************************************************************/
struct word_queue {
    word_queue() = default;

    void set(std::span<const word_t> words) noexcept {
        words_ = words;
        head_  = 0;
    }

    /// Pop the front word, or throw queue_exhausted(kind) without
    /// touching the cursor when nothing is left.
    const word_t& consume(queue_kind kind) {
        const size_t next = head_ + 1;
        if (next > words_.size()) {
            throw queue_exhausted(kind);
        }

        const word_t& value = words_[head_];
        head_ = next;
        return value;
    }

    size_t remaining()   const noexcept { return words_.size() - head_; }
    size_t head_index()  const noexcept { return head_; }
    size_t tail_index()  const noexcept { return words_.size(); }
    size_t head_offset() const noexcept { return head_ * word_size; }
    size_t tail_offset() const noexcept { return words_.size() * word_size; }
    bool   empty()       const noexcept { return remaining() == 0; }

private:
    std::span<const word_t> words_;
    size_t head_ = 0;
};

}  // namespace verity
