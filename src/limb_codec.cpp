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

#include <string>

#include <blswit/limb_codec.hpp>
#include <blswit/util/mpz_get.hpp>

namespace blswit {

namespace {

size_t bit_length(const mpz_class& value) {
    return sgn(value) == 0 ? 0 : mpz_sizeinbase(value.get_mpz_t(), 2);
}

// Limbs narrower than a machine word are compared natively
bool limb_in_range(const mpz_class& limb, size_t n) {
    if (sgn(limb) < 0) {
        return false;
    }
    if (n >= 64) {
        return bit_length(limb) <= n;
    }
    return mpz_fits_u64(limb) && (mpz_get_u64(limb) >> n) == 0;
}

}  // namespace

bool fits(const mpz_class& value, size_t n, size_t k) {
    return sgn(value) >= 0 && bit_length(value) <= capacity_bits(n, k);
}

limb_array encode(const mpz_class& value, size_t n, size_t k) {
    if (n == 0 || k == 0) {
        throw invalid_input("limb width and limb count must be positive");
    }
    if (sgn(value) < 0) {
        throw invalid_input("cannot encode negative value " + value.get_str());
    }
    if (!fits(value, n, k)) {
        throw out_of_range("value of " + std::to_string(bit_length(value))
                           + " bits exceeds " + std::to_string(capacity_bits(n, k))
                           + "-bit limb capacity");
    }

    const mpz_class mask = (mpz_class(1) << n) - 1;
    mpz_class rest = value;

    limb_array limbs;
    limbs.reserve(k);
    for (size_t i = 0; i < k; i++) {
        limbs.emplace_back(rest & mask);
        rest >>= n;
    }
    return limbs;
}

mpz_class decode(const limb_array& limbs, size_t n) {
    if (n == 0) {
        throw invalid_input("limb width must be positive");
    }

    mpz_class acc = 0;
    for (size_t i = limbs.size(); i-- > 0;) {
        const mpz_class& limb = limbs[i];
        if (!limb_in_range(limb, n)) {
            throw invalid_input("limb " + std::to_string(i) + " is not an "
                                + std::to_string(n) + "-bit value");
        }
        acc <<= n;
        acc += limb;
    }
    return acc;
}

}  // namespace blswit
