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

#include <stdexcept>
#include <string>

#include <verity/util/log.hpp>

namespace verity {

void enable_logging() {
    if (!logging::core::get()->get_logging_enabled())
        logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    if (logging::core::get()->get_logging_enabled())
        logging::core::get()->set_logging_enabled(false);
}

void set_logging_level(log_level level) {
    switch (level) {
    case log_level::disabled:
        disable_logging();
        break;
    case log_level::debug_only:
        enable_logging();
        logging::core::get()->set_filter
            (logging::trivial::severity == logging::trivial::debug);
        break;
    case log_level::info_only:
        enable_logging();
        logging::core::get()->set_filter
            (logging::trivial::severity == logging::trivial::info);
        break;
    case log_level::full:
        enable_logging();
        logging::core::get()->set_filter
            (logging::trivial::severity >= logging::trivial::trace);
        break;
    }
}

log_level parse_log_level(std::string_view name) {
    if (name == "disabled") return log_level::disabled;
    if (name == "debug")    return log_level::debug_only;
    if (name == "info")     return log_level::info_only;
    if (name == "full")     return log_level::full;

    throw std::invalid_argument("Unknown log level \"" + std::string(name) + "\"");
}

}  // namespace verity
