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

#include <blswit/hex.hpp>
#include <blswit/signature.hpp>

namespace blswit {

namespace {

json encode_as(const g2_affine& point, encoding_mode mode) {
    const encoded_g2 encoded = encode_point(point);
    switch (mode) {
    case encoding_mode::array:  return g2_as_array(encoded);
    case encoding_mode::object: return g2_as_object(encoded);
    }
    throw invalid_mode("unknown encoding mode");
}

}  // namespace

encoding_mode parse_encoding_mode(std::string_view name) {
    if (name == "array")  return encoding_mode::array;
    if (name == "object") return encoding_mode::object;
    throw invalid_mode("unknown encoding mode \"" + std::string(name) + "\"");
}

g2_affine decompress_signature(std::string_view sig_hex, const curve_backend& curve) {
    const bytes_t compressed = hex_to_bytes(sig_hex, has_hex_prefix(sig_hex));
    return curve.decompress_g2(compressed);
}

json g2_as_array(const encoded_g2& point) {
    return limbs_to_json(flatten(point));
}

json g2_as_object(const encoded_g2& point) {
    json out = json::object();
    out["x"]["c0"] = limbs_to_json(point.x.c0);
    out["x"]["c1"] = limbs_to_json(point.x.c1);
    out["y"]["c0"] = limbs_to_json(point.y.c0);
    out["y"]["c1"] = limbs_to_json(point.y.c1);
    return out;
}

json signature_as_array(std::string_view sig_hex, const curve_backend& curve) {
    return g2_as_array(encode_point(decompress_signature(sig_hex, curve)));
}

json signature_as_object(std::string_view sig_hex, const curve_backend& curve) {
    return g2_as_object(encode_point(decompress_signature(sig_hex, curve)));
}

json signature_as_snark_input(std::string_view sig_hex,
                              encoding_mode mode,
                              const curve_backend& curve)
{
    return encode_as(decompress_signature(sig_hex, curve), mode);
}

json message_hash_as_snark_input(const bytes_t& msg,
                                 encoding_mode mode,
                                 const curve_backend& curve)
{
    return encode_as(curve.hash_to_g2(msg), mode);
}

}  // namespace blswit
