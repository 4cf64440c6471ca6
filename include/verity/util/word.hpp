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

#include <string>
#include <string_view>

#include <gmpxx.h>

#include <verity/types.hpp>

/// @file word.hpp
/// @brief Conversions between 256-bit big-endian words and GMP / hex values

namespace verity
{
/// Build a word holding a 64-bit value in its lowest bytes
///
/// @param val The value to store
/// @return word_t Big-endian word, upper 24 bytes zero
word_t make_word(u64 val);

/// Import a word as a GMP integer
///
/// @param w The big-endian word
/// @return mpz_class The unsigned value of the word
mpz_class word_to_mpz(const word_t& w);

/// Export a GMP integer into a word
///
/// Throws std::out_of_range if the value is negative or needs more
/// than 256 bits.
///
/// @param val The GMP integer to convert
/// @return word_t Big-endian word
word_t word_from_mpz(const mpz_class& val);

/// Parse a hex string into a word
///
/// A leading "0x" is optional and odd lengths are padded with a leading
/// zero. Throws std::invalid_argument on empty or non-hex input and
/// std::out_of_range when the value does not fit in 32 bytes.
///
/// @param hex The hex string
/// @return word_t Big-endian word
word_t word_from_hex(std::string_view hex);

/// Format a word as a "0x" prefixed, 64 digit lowercase hex string
std::string word_to_hex(const word_t& w);
}
