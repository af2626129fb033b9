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

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

namespace blswit {

// Numeric Types
/* ------------------------------------------------------------ */
using u8  = uint8_t;
using u32 = uint32_t;
using u64 = uint64_t;

using bytes_t    = std::vector<u8>;
using limb_array = std::vector<mpz_class>;

// Errors
/* ------------------------------------------------------------ */
enum class error_kind : unsigned char {
    input_not_found,
    malformed_input,
    malformed_hex,
    decompression_error,
    out_of_range,
    invalid_input,
    invalid_mode,
};

constexpr std::string_view to_string(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::input_not_found:     return "InputNotFound";
    case error_kind::malformed_input:     return "MalformedInput";
    case error_kind::malformed_hex:       return "MalformedHex";
    case error_kind::decompression_error: return "DecompressionError";
    case error_kind::out_of_range:        return "OutOfRange";
    case error_kind::invalid_input:       return "InvalidInput";
    case error_kind::invalid_mode:        return "InvalidMode";
    }
    return "Unknown";
}

/************************************************************
 * Base of every failure raised while converting step data.
 *
 * All of them are fatal to a run: the entry point reports
 * `kind()` and `what()` and exits with a non-zero status.
 ************************************************************/
struct conversion_error : std::runtime_error {
    conversion_error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) { }

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

template <error_kind Kind>
struct basic_conversion_error : conversion_error {
    explicit basic_conversion_error(const std::string& msg)
        : conversion_error(Kind, msg) { }
};

using input_not_found     = basic_conversion_error<error_kind::input_not_found>;
using malformed_input     = basic_conversion_error<error_kind::malformed_input>;
using malformed_hex       = basic_conversion_error<error_kind::malformed_hex>;
using decompression_error = basic_conversion_error<error_kind::decompression_error>;
using out_of_range        = basic_conversion_error<error_kind::out_of_range>;
using invalid_input       = basic_conversion_error<error_kind::invalid_input>;
using invalid_mode        = basic_conversion_error<error_kind::invalid_mode>;

/// Rethrow `e` with its message prefixed by the location that triggered it,
/// keeping the concrete exception type.
[[noreturn]] inline void rethrow_at(const conversion_error& e, const std::string& where) {
    const std::string msg = where + ": " + e.what();
    switch (e.kind()) {
    case error_kind::input_not_found:     throw input_not_found(msg);
    case error_kind::malformed_input:     throw malformed_input(msg);
    case error_kind::malformed_hex:       throw malformed_hex(msg);
    case error_kind::decompression_error: throw decompression_error(msg);
    case error_kind::out_of_range:        throw out_of_range(msg);
    case error_kind::invalid_input:       throw invalid_input(msg);
    case error_kind::invalid_mode:        throw invalid_mode(msg);
    }
    throw conversion_error(e.kind(), msg);
}

}  // namespace blswit
