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

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <blswit/curve.hpp>
#include <blswit/point.hpp>
#include <blswit/signature.hpp>
#include <blswit/types.hpp>

namespace blswit {

namespace fs = std::filesystem;

/// Raw sync-committee snapshot, as produced by the light client
struct step_data {
    std::vector<std::string> pubkeys;       /**< compressed G1, "0x"-prefixed hex */
    json                     pubkeybits;
    std::string              signature;     /**< compressed G2 hex */
    std::string              signing_root;  /**< 32-byte hex */
    json                     participation;
    json                     sync_committee_poseidon;
};

struct convert_options {
    encoding_mode         signature_mode = encoding_mode::array;
    std::optional<size_t> committee_size;
    bool                  message_hash = false;
};

/// Public keys split into the two parallel coordinate arrays the
/// circuit takes; index i of both belongs to input key i.
struct encoded_pubkeys {
    std::vector<limb_array> x;
    std::vector<limb_array> y;
};

/// @throws malformed_input  on a missing or ill-typed field
step_data parse_step_data(const json& j);

/// @throws input_not_found, malformed_input
step_data load_step_data(const fs::path& path);

/************************************************************
 * Decompress and limb-encode every public key, in order.
 * The first failure aborts; its message names "pubkeys[i]".
 *
 * @throws malformed_hex, decompression_error, out_of_range
 ************************************************************/
encoded_pubkeys encode_pubkeys(const std::vector<std::string>& pubkeys,
                               const curve_backend& curve);

/************************************************************
 * Build the circuit input document from `data`.
 *
 * Output fields, in order: pubkeysX, pubkeysY, aggregationBits,
 * signature, signingRoot, participation, syncCommitteePoseidon
 * and, with `options.message_hash`, messageHash.
 ************************************************************/
json convert(const step_data& data,
             const convert_options& options,
             const curve_backend& curve);

/// Serialize `input` and write it to `path` in a single write.
void write_step_input(const json& input, const fs::path& path);

/// Load, convert, write. Nothing is written unless conversion succeeds.
void convert_file(const fs::path& input,
                  const fs::path& output,
                  const convert_options& options,
                  const curve_backend& curve);

}  // namespace blswit
