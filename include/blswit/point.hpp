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
#include <nlohmann/json.hpp>

#include <blswit/params.hpp>
#include <blswit/types.hpp>

namespace blswit {

using json = nlohmann::ordered_json;

/// Element of the quadratic extension Fp2 = Fp[u] / (u^2 + 1), c0 + c1 * u
struct fp2 {
    mpz_class c0;
    mpz_class c1;

    bool operator==(const fp2&) const = default;
};

/// Affine point on E(Fp), coordinates reduced modulo p
struct g1_affine {
    mpz_class x;
    mpz_class y;

    bool operator==(const g1_affine&) const = default;
};

/// Affine point on E'(Fp2)
struct g2_affine {
    fp2 x;
    fp2 y;

    bool operator==(const g2_affine&) const = default;
};

struct encoded_g1 {
    limb_array x;
    limb_array y;

    bool operator==(const encoded_g1&) const = default;
};

struct encoded_fp2 {
    limb_array c0;
    limb_array c1;

    bool operator==(const encoded_fp2&) const = default;
};

struct encoded_g2 {
    encoded_fp2 x;
    encoded_fp2 y;

    bool operator==(const encoded_g2&) const = default;
};

encoded_g1 encode_point(const g1_affine& point,
                        size_t n = params::limb_bits,
                        size_t k = params::num_limbs);

encoded_g2 encode_point(const g2_affine& point,
                        size_t n = params::limb_bits,
                        size_t k = params::num_limbs);

/// Concatenate the limbs of a G2 point in the order x.c0, x.c1, y.c0, y.c1.
limb_array flatten(const encoded_g2& point);

/// Limbs as a JSON array of decimal strings. Limbs can exceed the
/// 2^53 exact-integer range of JSON consumers, hence strings.
json limbs_to_json(const limb_array& limbs);

}  // namespace blswit
