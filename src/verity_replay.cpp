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

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <verity/math/bit_length.hpp>
#include <verity/proof/session.hpp>
#include <verity/util/log.hpp>
#include <verity/util/word.hpp>

using json = nlohmann::json;

using namespace verity;

namespace {
queue_kind parse_queue_kind(const std::string& name) {
    for (queue_kind kind : all_queue_kinds) {
        if (name == to_string(kind)) {
            return kind;
        }
    }
    throw std::invalid_argument("Unknown queue kind \"" + name + "\"");
}
}

int main(int argc, const char *argv[]) {
    if (argc < 2) {
        std::cerr << "Error: No JSON input provided" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::string_view jstr = argv[1];
    json jconfig;

    try {
        jconfig = json::parse(jstr);
    }
    catch (json::exception& e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    transcript proof;
    std::vector<queue_kind> schedule;

    try {
        set_logging_level(parse_log_level(jconfig.value("log-level", "info")));

        if (!jconfig.contains("transcript")) {
            std::cerr << "Error: No transcript provided" << std::endl;
            exit(EXIT_FAILURE);
        }

        const auto& jtranscript = jconfig["transcript"];
        proof = jtranscript.is_string()
            ? load_transcript_file(jtranscript.get<std::string>())
            : load_transcript(jtranscript);

        if (jconfig.contains("schedule")) {
            for (const auto& step : jconfig["schedule"]) {
                schedule.push_back(parse_queue_kind(step.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    const size_t num_challenges = proof.words(queue_kind::challenge).size();
    std::cout << "challenges: " << num_challenges
              << ", rounds: " << math::log2_up(static_cast<u64>(num_challenges))
              << ", schedule: " << schedule.size() << " steps" << std::endl;

    std::cout << "=============== Start Replay ===============" << std::endl;

    verification_result result;
    try {
        result = verify_transcript(proof, [&schedule](verification_builder& builder) {
            for (queue_kind kind : schedule) {
                const word_t& value = builder.consume(kind);
                VERITY_LOG_INFO << to_string(kind) << ": " << word_to_hex(value);
            }
        });
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    if (result.rejected()) {
        std::cout << "rejected: " << to_string(*result.code()) << std::endl;
        std::cerr << "Verification failed, exiting" << std::endl;
        exit(EXIT_FAILURE);
    }

    std::cout << "accepted" << std::endl;
    return 0;
}
