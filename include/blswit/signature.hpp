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

#include <blswit/curve.hpp>
#include <blswit/point.hpp>
#include <blswit/types.hpp>

namespace blswit {

/// Output shape of an encoded G2 point
enum class encoding_mode : unsigned char {
    array,   /**< flat limbs: x.c0, x.c1, y.c0, y.c1 */
    object,  /**< {"x": {"c0", "c1"}, "y": {"c0", "c1"}} */
};

/// @throws invalid_mode  for anything but "array" or "object"
encoding_mode parse_encoding_mode(std::string_view name);

constexpr std::string_view to_string(encoding_mode mode) noexcept {
    return mode == encoding_mode::array ? "array" : "object";
}

/************************************************************
 * Decode a hex-encoded compressed G2 signature. A leading
 * "0x" is optional.
 *
 * @throws malformed_hex, decompression_error
 ************************************************************/
g2_affine decompress_signature(std::string_view sig_hex, const curve_backend& curve);

json g2_as_array(const encoded_g2& point);
json g2_as_object(const encoded_g2& point);

json signature_as_array(std::string_view sig_hex, const curve_backend& curve);
json signature_as_object(std::string_view sig_hex, const curve_backend& curve);

json signature_as_snark_input(std::string_view sig_hex,
                              encoding_mode mode,
                              const curve_backend& curve);

/// Hash `msg` onto G2 with the Ethereum PoP tag and encode it like a signature.
json message_hash_as_snark_input(const bytes_t& msg,
                                 encoding_mode mode,
                                 const curve_backend& curve);

}  // namespace blswit
