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

#include <ios>

#include <verity/proof/session.hpp>
#include <verity/util/log.hpp>

namespace verity {

verification_result verify_transcript(const transcript& t,
                                      const verification_routine& routine,
                                      builder_arena_t& arena)
{
    builder_scope_t scope(arena);

    const memory::region_handle handle = arena.allocate();
    verification_builder& builder = arena.get(handle);
    VERITY_LOG_DEBUG << "Allocated verification builder at 0x"
                     << std::hex << handle.base << std::dec;

    t.populate(builder);

    try {
        routine(builder);
    }
    catch (const verification_error& e) {
        VERITY_LOG_WARNING << "Verification rejected: " << e.what();
        return verification_rejected{ e.code() };
    }

    if (!builder.drained()) {
        VERITY_LOG_DEBUG << "Verification finished with unconsumed transcript values";
    }
    return verification_accepted{};
}

}  // namespace verity
