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

#include <iterator>

#include <boost/algorithm/hex.hpp>

#include <blswit/hex.hpp>

namespace blswit {

bool has_hex_prefix(std::string_view str) noexcept {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

bytes_t hex_to_bytes(std::string_view hex, bool strip_prefix) {
    if (strip_prefix) {
        if (hex.size() < 2) {
            throw malformed_hex("hex string \"" + std::string(hex) + "\" has no prefix to strip");
        }
        hex.remove_prefix(2);
    }

    if (hex.size() % 2 == 1) {
        throw malformed_hex("hex string of odd length " + std::to_string(hex.size()));
    }

    bytes_t out;
    out.reserve(hex.size() / 2);
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(out));
    }
    catch (const boost::algorithm::hex_decode_error&) {
        throw malformed_hex("non-hex character in \"" + std::string(hex) + "\"");
    }
    return out;
}

std::string bytes_to_hex(const bytes_t& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(out));
    return out;
}

mpz_class bytes_to_mpz(const bytes_t& bytes) {
    mpz_class out = 0;
    if (!bytes.empty()) {
        mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(u8), 1, 0, bytes.data());
    }
    return out;
}

}  // namespace blswit
