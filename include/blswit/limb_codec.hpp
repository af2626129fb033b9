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

#include <cstddef>

#include <gmpxx.h>

#include <blswit/params.hpp>
#include <blswit/types.hpp>

/// @file limb_codec.hpp
/// @brief Decomposition of big integers into fixed-width limbs for
///        non-native field arithmetic inside a circuit.

namespace blswit {

/// Total number of bits a `k`-limb array of `n`-bit limbs can hold.
constexpr size_t capacity_bits(size_t n, size_t k) noexcept { return n * k; }

/// True when `value` is non-negative and below 2^(n*k).
bool fits(const mpz_class& value, size_t n, size_t k);

/************************************************************
 * Split `value` into exactly `k` limbs of `n` bits each,
 * least significant limb first. High limbs are zero-padded.
 *
 * Example (n = 4, k = 3):
 *     encode(0x2a) -> [0xa, 0x2, 0x0]
 *
 * @throws invalid_input  if `value` is negative or `n`, `k` is zero
 * @throws out_of_range   if `value >= 2^(n*k)`
 ************************************************************/
limb_array encode(const mpz_class& value,
                  size_t n = params::limb_bits,
                  size_t k = params::num_limbs);

/************************************************************
 * Reassemble Σ limbs[i] * 2^(n*i).
 *
 * @throws invalid_input  if a limb is negative or not below 2^n
 ************************************************************/
mpz_class decode(const limb_array& limbs, size_t n = params::limb_bits);

}  // namespace blswit
