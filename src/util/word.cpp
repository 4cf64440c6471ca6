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

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <boost/algorithm/hex.hpp>

#include <verity/util/word.hpp>

namespace verity
{
word_t make_word(u64 val)
{
  word_t w{};
  for (std::size_t i = 0; i < sizeof(u64); ++i) {
    w[word_size - 1 - i] = static_cast<u8>(val >> (8 * i));
  }
  return w;
}

mpz_class word_to_mpz(const word_t& w)
{
  mpz_class result;
  mpz_import(result.get_mpz_t(), w.size(), 1, sizeof(u8), 1, 0, w.data());
  return result;
}

word_t word_from_mpz(const mpz_class& val)
{
  if (sgn(val) < 0) {
    throw std::out_of_range("word_from_mpz: negative value");
  }
  if (mpz_sizeinbase(val.get_mpz_t(), 2) > word_size * 8) {
    throw std::out_of_range("word_from_mpz: value exceeds 256 bits");
  }

  word_t w{};
  std::size_t count = 0;
  u8 buf[word_size];
  mpz_export(buf, &count, 1, sizeof(u8), 1, 0, val.get_mpz_t());

  // mpz_export writes the minimal number of bytes, right-align them
  std::copy(buf, buf + count, w.begin() + (word_size - count));
  return w;
}

word_t word_from_hex(std::string_view hex)
{
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.empty()) {
    throw std::invalid_argument("Empty hex word");
  }

  std::string digits(hex);
  if (digits.size() % 2 == 1) {
    digits.insert(digits.begin(), '0');
  }

  std::vector<u8> bytes;
  try {
    boost::algorithm::unhex(digits.begin(), digits.end(), std::back_inserter(bytes));
  }
  catch (const boost::algorithm::hex_decode_error&) {
    throw std::invalid_argument("Invalid hex word \"" + std::string(hex) + "\"");
  }

  // Leading zero bytes do not count against the width
  auto first = std::find_if(bytes.begin(), bytes.end(), [](u8 b) { return b != 0; });
  const auto significant = static_cast<std::size_t>(std::distance(first, bytes.end()));
  if (significant > word_size) {
    throw std::out_of_range("Hex word \"" + std::string(hex) + "\" exceeds 32 bytes");
  }

  word_t w{};
  std::copy(first, bytes.end(), w.begin() + (word_size - significant));
  return w;
}

std::string word_to_hex(const word_t& w)
{
  std::string out = "0x";
  boost::algorithm::hex_lower(w.begin(), w.end(), std::back_inserter(out));
  return out;
}
}
