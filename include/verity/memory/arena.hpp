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

#include <concepts>
#include <cstddef>
#include <deque>
#include <stdexcept>
#include <string>

#include <verity/params.hpp>
#include <verity/types.hpp>

namespace verity::memory {

/// Base address of a region handed out by a bump_arena.
struct region_handle {
    address_t base = 0;

    bool operator==(const region_handle&) const = default;
};

/************************************************************
 * Monotonic bump allocator. Every allocation hands out the
 * current free pointer and advances it by RegionSize; regions
 * are only reclaimed together by reset().
 *
 * Regions live in a deque, so a reference obtained from get()
 * stays valid until the next reset().
 ************************************************************/
template <std::default_initializable T, size_t RegionSize = sizeof(T)>
struct bump_arena {
    static constexpr size_t region_size = RegionSize;

    bump_arena() : bump_arena(params::arena_origin) { }

    explicit bump_arena(address_t origin)
        : origin_(origin), free_pointer_(origin) { }

    bump_arena(const bump_arena&) = delete;
    bump_arena& operator=(const bump_arena&) = delete;

    region_handle allocate() {
        region_handle handle{ free_pointer_ };
        regions_.emplace_back();
        free_pointer_ += region_size;
        return handle;
    }

    T& get(region_handle handle) {
        return regions_[index_of(handle)];
    }

    const T& get(region_handle handle) const {
        return regions_[index_of(handle)];
    }

    void reset() noexcept {
        regions_.clear();
        free_pointer_ = origin_;
    }

    // Marks the arena as owned by one call and reclaims regions left
    // over from outside any call; false if a call already owns it
    bool try_enter() noexcept {
        if (entered_)
            return false;
        reset();
        entered_ = true;
        return true;
    }

    void leave() noexcept {
        reset();
        entered_ = false;
    }

    bool      entered()      const noexcept { return entered_; }
    address_t origin()       const noexcept { return origin_; }
    address_t free_pointer() const noexcept { return free_pointer_; }
    size_t    allocated()    const noexcept { return regions_.size(); }
    bool      empty()        const noexcept { return regions_.empty(); }

private:
    size_t index_of(region_handle handle) const {
        if (handle.base < origin_ ||
            handle.base >= free_pointer_ ||
            (handle.base - origin_) % region_size != 0)
        {
            throw std::out_of_range("bump_arena: stale or foreign region handle "
                                    + std::to_string(handle.base));
        }
        return (handle.base - origin_) / region_size;
    }

    std::deque<T> regions_;
    address_t origin_;
    address_t free_pointer_;
    bool entered_ = false;
};


/************************************************************
 * Guard covering one top-level call. Everything allocated
 * from the arena inside the scope is reclaimed when the scope
 * ends, including when it ends by an exception.
 *
 * Scopes do not nest.
 ************************************************************/
template <typename Arena>
struct arena_scope {
    explicit arena_scope(Arena& arena) : arena_(arena) {
        if (!arena_.try_enter()) {
            throw std::logic_error("arena_scope: arena is already in use");
        }
    }

    ~arena_scope() { arena_.leave(); }

    arena_scope(const arena_scope&) = delete;
    arena_scope& operator=(const arena_scope&) = delete;

    Arena& arena() noexcept { return arena_; }

private:
    Arena& arena_;
};

}  // namespace verity::memory
