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

#include <stdexcept>
#include <string>

#include <verity/types.hpp>

namespace verity {

// Error Codes
/* ------------------------------------------------------------ */
// Numeric values are pinned so diagnostics stay comparable across builds
enum class error_code : u32 {
    too_few_challenges       = 1,
    too_few_first_round_mles = 2,
    too_few_final_round_mles = 3,
    too_few_chi_evaluations  = 4,
    too_few_rho_evaluations  = 5,
};

const char* to_string(error_code code) noexcept;
const char* to_string(queue_kind kind) noexcept;

/// Error raised when a queue of the given kind runs dry.
error_code exhaustion_code(queue_kind kind) noexcept;

// Exceptions
/* ------------------------------------------------------------ */

/************************************************************
 * Base of every error that rejects a proof. The verification
 * call boundary is the only place allowed to catch it.
 ************************************************************/
struct verification_error : std::runtime_error {
    explicit verification_error(error_code code);
    verification_error(error_code code, const std::string& what);

    error_code code() const noexcept { return code_; }

private:
    error_code code_;
};

struct queue_exhausted : verification_error {
    explicit queue_exhausted(queue_kind kind);

    queue_kind kind() const noexcept { return kind_; }

private:
    queue_kind kind_;
};

}  // namespace verity
