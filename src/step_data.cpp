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

#include <fstream>
#include <utility>

#include <blswit/hex.hpp>
#include <blswit/params.hpp>
#include <blswit/step_data.hpp>
#include <blswit/util/log.hpp>

namespace blswit {

namespace {

const json& require(const json& j, const char *key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw malformed_input(std::string("missing field \"") + key + "\"");
    }
    return *it;
}

std::string require_string(const json& j, const char *key) {
    const json& v = require(j, key);
    if (!v.is_string()) {
        throw malformed_input(std::string("field \"") + key + "\" must be a string");
    }
    return v.get<std::string>();
}

void check_committee_size(const step_data& data, size_t expected) {
    if (data.pubkeys.size() != expected) {
        throw malformed_input("expected " + std::to_string(expected) + " pubkeys, got "
                              + std::to_string(data.pubkeys.size()));
    }
    if (data.pubkeybits.is_array() && data.pubkeybits.size() != expected) {
        throw malformed_input("expected " + std::to_string(expected) + " pubkeybits, got "
                              + std::to_string(data.pubkeybits.size()));
    }
}

}  // namespace

step_data parse_step_data(const json& j) {
    if (!j.is_object()) {
        throw malformed_input("step data must be a JSON object");
    }

    step_data data;

    const json& pubkeys = require(j, "pubkeys");
    if (!pubkeys.is_array()) {
        throw malformed_input("field \"pubkeys\" must be an array");
    }
    for (size_t i = 0; i < pubkeys.size(); i++) {
        if (!pubkeys[i].is_string()) {
            throw malformed_input("pubkeys[" + std::to_string(i) + "] must be a string");
        }
        data.pubkeys.push_back(pubkeys[i].get<std::string>());
    }

    data.pubkeybits              = require(j, "pubkeybits");
    data.signature               = require_string(j, "signature");
    data.signing_root            = require_string(j, "signing_root");
    data.participation           = require(j, "participation");
    data.sync_committee_poseidon = require(j, "syncCommitteePoseidon");
    return data;
}

step_data load_step_data(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw input_not_found("cannot find step data \"" + path.string() + "\"");
    }

    std::ifstream ifs(path);
    if (!ifs) {
        throw malformed_input("cannot read step data \"" + path.string() + "\"");
    }

    json j;
    try {
        j = json::parse(ifs);
    }
    catch (const json::exception& e) {
        throw malformed_input(path.string() + ": " + e.what());
    }
    return parse_step_data(j);
}

encoded_pubkeys encode_pubkeys(const std::vector<std::string>& pubkeys,
                               const curve_backend& curve)
{
    encoded_pubkeys out;
    out.x.reserve(pubkeys.size());
    out.y.reserve(pubkeys.size());

    for (size_t i = 0; i < pubkeys.size(); i++) {
        try {
            // The first two characters are the "0x" tag
            const bytes_t compressed = hex_to_bytes(pubkeys[i], true);
            encoded_g1 point = encode_point(curve.decompress_g1(compressed));
            out.x.push_back(std::move(point.x));
            out.y.push_back(std::move(point.y));
        }
        catch (const conversion_error& e) {
            rethrow_at(e, "pubkeys[" + std::to_string(i) + "]");
        }
        BLSWIT_LOG_DEBUG << "encoded pubkeys[" << i << "]";
    }
    return out;
}

json convert(const step_data& data,
             const convert_options& options,
             const curve_backend& curve)
{
    if (options.committee_size) {
        check_committee_size(data, *options.committee_size);
    }

    BLSWIT_LOG_DEBUG << "encoding " << data.pubkeys.size() << " pubkeys";
    const encoded_pubkeys pubkeys = encode_pubkeys(data.pubkeys, curve);

    json signature;
    try {
        signature = signature_as_snark_input(data.signature, options.signature_mode, curve);
    }
    catch (const conversion_error& e) {
        rethrow_at(e, "signature");
    }

    bytes_t signing_root;
    try {
        signing_root = hex_to_bytes(data.signing_root, has_hex_prefix(data.signing_root));
    }
    catch (const conversion_error& e) {
        rethrow_at(e, "signing_root");
    }

    json input = json::object();

    json& xs = input["pubkeysX"] = json::array();
    for (const auto& limbs : pubkeys.x) {
        xs.push_back(limbs_to_json(limbs));
    }
    json& ys = input["pubkeysY"] = json::array();
    for (const auto& limbs : pubkeys.y) {
        ys.push_back(limbs_to_json(limbs));
    }

    input["aggregationBits"]       = data.pubkeybits;
    input["signature"]             = std::move(signature);
    input["signingRoot"]           = signing_root;
    input["participation"]         = data.participation;
    input["syncCommitteePoseidon"] = data.sync_committee_poseidon;

    if (options.message_hash) {
        try {
            input["messageHash"] = message_hash_as_snark_input(signing_root,
                                                               options.signature_mode,
                                                               curve);
        }
        catch (const conversion_error& e) {
            rethrow_at(e, "messageHash");
        }
    }
    return input;
}

void write_step_input(const json& input, const fs::path& path) {
    const std::string text = input.dump();

    const fs::path dir = path.parent_path();
    std::error_code ec;
    if (!dir.empty() && !fs::is_directory(dir, ec)) {
        throw std::runtime_error("Output directory " + dir.string() + " does not exist");
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("Cannot write file " + path.string());
    }
    ofs << text;
    if (!ofs.flush()) {
        throw std::runtime_error("Failed writing file " + path.string());
    }
}

void convert_file(const fs::path& input,
                  const fs::path& output,
                  const convert_options& options,
                  const curve_backend& curve)
{
    BLSWIT_LOG_INFO << "Reading step data from " << input.string();
    const step_data data = load_step_data(input);

    const json step_input = convert(data, options, curve);

    BLSWIT_LOG_INFO << "Writing input to file " << output.string();
    write_step_input(step_input, output);
}

}  // namespace blswit
