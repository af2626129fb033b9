/*
 * Copyright (C) 2023-2026 Ligero, Inc.
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

#include <blswit/types.hpp>

namespace blswit {

/// True when `str` starts with "0x" or "0X".
bool has_hex_prefix(std::string_view str) noexcept;

/************************************************************
 * Decode a hex string into bytes, most significant first.
 *
 * Example:
 *     hex_to_bytes("0x1234", true) -> [0x12, 0x34]
 *     hex_to_bytes("abCD", false)  -> [0xab, 0xcd]
 *
 * @param hex           Source string
 * @param strip_prefix  Drop the first two characters before decoding
 * @throws malformed_hex  on odd length or non-hex characters
 ************************************************************/
bytes_t hex_to_bytes(std::string_view hex, bool strip_prefix);

/// Lowercase hex, no prefix.
std::string bytes_to_hex(const bytes_t& bytes);

/// Interpret `bytes` as a big-endian unsigned integer.
mpz_class bytes_to_mpz(const bytes_t& bytes);

}  // namespace blswit
