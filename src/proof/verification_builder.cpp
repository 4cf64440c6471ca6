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

#include <algorithm>

#include <verity/proof/verification_builder.hpp>
#include <verity/util/log.hpp>

namespace verity {

void verification_builder::set(queue_kind kind, std::span<const word_t> words) {
    word_queue& q = queues_[index_of(kind)];

    if (q.tail_index() != 0) {
        VERITY_LOG_DEBUG << "Re-pointing " << to_string(kind)
                         << " queue, dropping " << q.remaining()
                         << " unconsumed words";
    }

    q.set(words);
    VERITY_LOG_TRACE << "Set " << to_string(kind) << " queue: "
                     << words.size() << " words";
}

const word_t& verification_builder::consume(queue_kind kind) {
    word_queue& q = queues_[index_of(kind)];
    const word_t& value = q.consume(kind);

    VERITY_LOG_TRACE << "Consumed " << to_string(kind)
                     << " word at offset " << (q.head_offset() - word_size);
    return value;
}

bool verification_builder::drained() const noexcept {
    return std::all_of(queues_.begin(), queues_.end(),
                       [](const word_queue& q) { return q.empty(); });
}

builder_arena_t& builder_arena() {
    static builder_arena_t arena;
    return arena;
}

}  // namespace verity
