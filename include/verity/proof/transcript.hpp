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
#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include <verity/proof/verification_builder.hpp>
#include <verity/types.hpp>

namespace verity {

/************************************************************
 * Owned storage for the values of one proof transcript.
 *
 * A builder populated from a transcript borrows these vectors,
 * so the transcript must outlive every consume on that builder.
 ************************************************************/
struct transcript {
    std::vector<word_t>& words(queue_kind kind) noexcept {
        return words_[index_of(kind)];
    }

    const std::vector<word_t>& words(queue_kind kind) const noexcept {
        return words_[index_of(kind)];
    }

    /// Set every builder queue to the matching vector.
    void populate(verification_builder& builder) const;

private:
    std::array<std::vector<word_t>, num_queue_kinds> words_;
};

/// JSON field holding the values of a queue kind, e.g. "chi_evaluations".
const char* json_key(queue_kind kind) noexcept;

/************************************************************
 * Build a transcript from a JSON object.
 *
 * Every queue field is optional and is an array whose entries
 * are either hex strings or non-negative integers.
 *
 * @param j  Transcript object
 * @return   Parsed transcript
 * @throw    std::invalid_argument on malformed entries,
 *           std::out_of_range on values wider than a word
 ************************************************************/
transcript load_transcript(const nlohmann::json& j);

/// Read and parse a JSON transcript file.
transcript load_transcript_file(const std::filesystem::path& path);

}  // namespace verity
