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

#include <blswit/limb_codec.hpp>
#include <blswit/point.hpp>

namespace blswit {

encoded_g1 encode_point(const g1_affine& point, size_t n, size_t k) {
    return { encode(point.x, n, k), encode(point.y, n, k) };
}

encoded_g2 encode_point(const g2_affine& point, size_t n, size_t k) {
    return {
        { encode(point.x.c0, n, k), encode(point.x.c1, n, k) },
        { encode(point.y.c0, n, k), encode(point.y.c1, n, k) },
    };
}

limb_array flatten(const encoded_g2& point) {
    limb_array out;
    out.reserve(point.x.c0.size() + point.x.c1.size() + point.y.c0.size() + point.y.c1.size());
    for (const limb_array* part : { &point.x.c0, &point.x.c1, &point.y.c0, &point.y.c1 }) {
        out.insert(out.end(), part->begin(), part->end());
    }
    return out;
}

json limbs_to_json(const limb_array& limbs) {
    json out = json::array();
    for (const auto& limb : limbs) {
        out.push_back(limb.get_str(10));
    }
    return out;
}

}  // namespace blswit
