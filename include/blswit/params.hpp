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
#include <string_view>

namespace blswit::params {

// The circuit's constraint system is generated for these two values;
// they change together with it, never at runtime.
constexpr size_t limb_bits = 55;
constexpr size_t num_limbs = 7;

constexpr size_t modulus_bits = 381;

static_assert(limb_bits * num_limbs >= modulus_bits,
              "limb decomposition cannot hold a BLS12-381 base field element");

constexpr size_t fp_bytes         = 48;
constexpr size_t g1_compressed    = fp_bytes;
constexpr size_t g2_compressed    = 2 * fp_bytes;

// Ethereum proof-of-possession ciphersuite
constexpr std::string_view hash_to_g2_dst = "BLS_SIG_BLS12381G2_XMD:SHA-256_SSWU_RO_POP_";

constexpr std::string_view default_input  = "data/my_step_data.json";
constexpr std::string_view default_output = "data/my_step_input.json";

}  // namespace blswit::params
