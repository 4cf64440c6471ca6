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

#include <verity/proof/error.hpp>

namespace verity {

const char* to_string(error_code code) noexcept {
    switch (code) {
    case error_code::too_few_challenges:
        return "TooFewChallenges";
    case error_code::too_few_first_round_mles:
        return "TooFewFirstRoundMLEs";
    case error_code::too_few_final_round_mles:
        return "TooFewFinalRoundMLEs";
    case error_code::too_few_chi_evaluations:
        return "TooFewChiEvaluations";
    case error_code::too_few_rho_evaluations:
        return "TooFewRhoEvaluations";
    default:
        return "<error>";
    }
}

const char* to_string(queue_kind kind) noexcept {
    switch (kind) {
    case queue_kind::challenge:
        return "challenge";
    case queue_kind::first_round_evaluation:
        return "first_round_evaluation";
    case queue_kind::final_round_evaluation:
        return "final_round_evaluation";
    case queue_kind::chi_evaluation:
        return "chi_evaluation";
    case queue_kind::rho_evaluation:
        return "rho_evaluation";
    default:
        return "<error>";
    }
}

error_code exhaustion_code(queue_kind kind) noexcept {
    switch (kind) {
    case queue_kind::first_round_evaluation:
        return error_code::too_few_first_round_mles;
    case queue_kind::final_round_evaluation:
        return error_code::too_few_final_round_mles;
    case queue_kind::chi_evaluation:
        return error_code::too_few_chi_evaluations;
    case queue_kind::rho_evaluation:
        return error_code::too_few_rho_evaluations;
    case queue_kind::challenge:
    default:
        return error_code::too_few_challenges;
    }
}

verification_error::verification_error(error_code code)
    : verification_error(code, to_string(code)) { }

verification_error::verification_error(error_code code, const std::string& what)
    : std::runtime_error(what), code_(code) { }

queue_exhausted::queue_exhausted(queue_kind kind)
    : verification_error(exhaustion_code(kind),
                         std::string(to_string(exhaustion_code(kind)))
                         + ": " + to_string(kind) + " queue exhausted"),
      kind_(kind) { }

}  // namespace verity
