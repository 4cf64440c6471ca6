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

#include <functional>
#include <optional>
#include <variant>

#include <verity/proof/error.hpp>
#include <verity/proof/transcript.hpp>
#include <verity/proof/verification_builder.hpp>

namespace verity {

struct verification_accepted { };
struct verification_rejected { error_code code; };

struct verification_result {
    verification_result() : data_(verification_accepted{}) { }
    verification_result(verification_accepted ok) : data_(ok) { }
    verification_result(verification_rejected r) : data_(r) { }

    bool accepted() const { return std::holds_alternative<verification_accepted>(data_); }
    bool rejected() const { return std::holds_alternative<verification_rejected>(data_); }

    /// Reason for a rejection; std::nullopt when the proof was accepted.
    std::optional<error_code> code() const {
        if (auto* r = std::get_if<verification_rejected>(&data_))
            return r->code;
        return std::nullopt;
    }

private:
    std::variant<verification_accepted, verification_rejected> data_;
};

/// The protocol rounds run against a populated builder.
using verification_routine = std::function<void(verification_builder&)>;

/************************************************************
 * Run one verification call.
 *
 * Allocates a builder from the arena, sets every queue from
 * the transcript and hands it to the routine. A
 * verification_error anywhere in the routine rejects the
 * proof; no value consumed before the failure escapes. The
 * arena is rewound before returning, whatever the outcome.
 *
 * Errors other than verification_error are propagated.
 *
 * @param t        Transcript the builder borrows from
 * @param routine  Protocol rounds
 * @param arena    Arena the builder is allocated from
 * @return         Accepted, or rejected with the error code
 ************************************************************/
verification_result verify_transcript(const transcript& t,
                                      const verification_routine& routine,
                                      builder_arena_t& arena = builder_arena());

}  // namespace verity
