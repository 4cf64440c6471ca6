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

#include <fstream>
#include <stdexcept>
#include <string>

#include <verity/proof/transcript.hpp>
#include <verity/util/log.hpp>
#include <verity/util/word.hpp>

using json = nlohmann::json;

// Use unnamed namespace for internal linkage
namespace {
verity::word_t parse_word(const json& entry, const char *field) {
    if (entry.is_string()) {
        return verity::word_from_hex(entry.get<std::string>());
    }
    if (entry.is_number_unsigned()) {
        return verity::make_word(entry.get<verity::u64>());
    }
    throw std::invalid_argument(std::string("Invalid entry in \"") + field
                                + "\": " + entry.dump());
}
}

namespace verity {

void transcript::populate(verification_builder& builder) const {
    for (queue_kind kind : all_queue_kinds) {
        builder.set(kind, words(kind));
    }
}

const char* json_key(queue_kind kind) noexcept {
    switch (kind) {
    case queue_kind::challenge:
        return "challenges";
    case queue_kind::first_round_evaluation:
        return "first_round_evaluations";
    case queue_kind::final_round_evaluation:
        return "final_round_evaluations";
    case queue_kind::chi_evaluation:
        return "chi_evaluations";
    case queue_kind::rho_evaluation:
        return "rho_evaluations";
    default:
        return "<error>";
    }
}

transcript load_transcript(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Transcript must be a JSON object");
    }

    transcript t;
    for (queue_kind kind : all_queue_kinds) {
        const char *field = json_key(kind);
        if (!j.contains(field)) {
            continue;
        }

        const json& entries = j[field];
        if (!entries.is_array()) {
            throw std::invalid_argument(std::string("Transcript field \"") + field
                                        + "\" must be an array");
        }

        auto& out = t.words(kind);
        out.reserve(entries.size());
        for (const auto& entry : entries) {
            out.push_back(parse_word(entry, field));
        }

        VERITY_LOG_DEBUG << "Transcript " << field << ": " << out.size() << " words";
    }
    return t;
}

transcript load_transcript_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Could not read from file \"" + path.string() + "\"");
    }

    json j;
    try {
        j = json::parse(file);
    }
    catch (const json::exception& e) {
        throw std::invalid_argument("Transcript \"" + path.string() + "\": " + e.what());
    }
    return load_transcript(j);
}

}  // namespace verity
