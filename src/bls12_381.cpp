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

#include <blst.h>

#include <blswit/curve.hpp>
#include <blswit/hex.hpp>

namespace blswit {

namespace {

const char* describe(BLST_ERROR err) {
    switch (err) {
    case BLST_SUCCESS:            return "success";
    case BLST_BAD_ENCODING:       return "bad encoding";
    case BLST_POINT_NOT_ON_CURVE: return "point not on curve";
    case BLST_POINT_NOT_IN_GROUP: return "point not in group";
    default:                      return "unexpected blst error";
    }
}

mpz_class fp_to_mpz(const blst_fp& fp) {
    bytes_t buf(params::fp_bytes);
    blst_bendian_from_fp(buf.data(), &fp);
    return bytes_to_mpz(buf);
}

fp2 fp2_to_mpz(const blst_fp2& fp) {
    return { fp_to_mpz(fp.fp[0]), fp_to_mpz(fp.fp[1]) };
}

void check_size(const bytes_t& compressed, size_t expected, const char *group) {
    if (compressed.size() != expected) {
        throw decompression_error(std::string(group) + " encoding must be "
                                  + std::to_string(expected) + " bytes, got "
                                  + std::to_string(compressed.size()));
    }
}

}  // namespace

g1_affine bls12_381_backend::decompress_g1(const bytes_t& compressed) const {
    check_size(compressed, params::g1_compressed, "G1");

    blst_p1_affine point;
    if (BLST_ERROR err = blst_p1_uncompress(&point, compressed.data()); err != BLST_SUCCESS) {
        throw decompression_error(std::string("G1: ") + describe(err));
    }
    if (blst_p1_affine_is_inf(&point)) {
        throw decompression_error("G1: point at infinity");
    }
    return { fp_to_mpz(point.x), fp_to_mpz(point.y) };
}

g2_affine bls12_381_backend::decompress_g2(const bytes_t& compressed) const {
    check_size(compressed, params::g2_compressed, "G2");

    blst_p2_affine point;
    if (BLST_ERROR err = blst_p2_uncompress(&point, compressed.data()); err != BLST_SUCCESS) {
        throw decompression_error(std::string("G2: ") + describe(err));
    }
    if (blst_p2_affine_is_inf(&point)) {
        throw decompression_error("G2: point at infinity");
    }
    return { fp2_to_mpz(point.x), fp2_to_mpz(point.y) };
}

g2_affine bls12_381_backend::hash_to_g2(const bytes_t& msg, std::string_view dst) const {
    blst_p2 hashed;
    blst_hash_to_g2(&hashed,
                    msg.data(), msg.size(),
                    reinterpret_cast<const byte*>(dst.data()), dst.size(),
                    nullptr, 0);

    blst_p2_affine point;
    blst_p2_to_affine(&point, &hashed);
    return { fp2_to_mpz(point.x), fp2_to_mpz(point.y) };
}

}  // namespace blswit
