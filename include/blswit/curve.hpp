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

#include <string_view>

#include <blswit/params.hpp>
#include <blswit/point.hpp>
#include <blswit/types.hpp>

namespace blswit {

/************************************************************
 * The elliptic-curve capabilities the converter depends on.
 *
 * Implementations only decode points, they never verify
 * signatures. Every failure is reported as
 * `decompression_error`.
 ************************************************************/
class curve_backend {
public:
    virtual ~curve_backend() = default;

    /// Decompress a 48-byte ZCash-format G1 encoding.
    virtual g1_affine decompress_g1(const bytes_t& compressed) const = 0;

    /// Decompress a 96-byte ZCash-format G2 encoding.
    virtual g2_affine decompress_g2(const bytes_t& compressed) const = 0;

    /// Hash `msg` onto G2 with the given domain separation tag.
    virtual g2_affine hash_to_g2(const bytes_t& msg,
                                 std::string_view dst = params::hash_to_g2_dst) const = 0;
};

/// BLS12-381 backed by blst
class bls12_381_backend final : public curve_backend {
public:
    g1_affine decompress_g1(const bytes_t& compressed) const override;
    g2_affine decompress_g2(const bytes_t& compressed) const override;
    g2_affine hash_to_g2(const bytes_t& msg,
                         std::string_view dst = params::hash_to_g2_dst) const override;
};

}  // namespace blswit
