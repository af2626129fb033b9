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

#include <cstdlib>
#include <string>

#include <blswit/cli.hpp>
#include <blswit/signature.hpp>

namespace blswit {

run_config parse_run_config(const json& jconfig) {
    if (!jconfig.is_object()) {
        throw malformed_input("config must be a JSON object");
    }

    run_config config;
    try {
        if (jconfig.contains("log-level")) {
            auto name = jconfig["log-level"].template get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                throw malformed_input("invalid log-level \"" + name + "\"");
            }
            config.level = *level;
        }
        if (jconfig.contains("input")) {
            config.input = jconfig["input"].template get<std::string>();
        }
        if (jconfig.contains("output")) {
            config.output = jconfig["output"].template get<std::string>();
        }
        if (jconfig.contains("committee-size")) {
            const json& size = jconfig["committee-size"];
            if (!size.is_number_unsigned()) {
                throw malformed_input("committee-size must be a non-negative integer");
            }
            config.options.committee_size = size.template get<size_t>();
        }
        if (jconfig.contains("signature-mode")) {
            config.options.signature_mode =
                parse_encoding_mode(jconfig["signature-mode"].template get<std::string>());
        }
        if (jconfig.contains("message-hash")) {
            config.options.message_hash = jconfig["message-hash"].template get<bool>();
        }
    }
    catch (const json::exception& e) {
        throw malformed_input(std::string("invalid config: ") + e.what());
    }
    return config;
}

run_config parse_run_config(std::string_view jstr) {
    json jconfig;
    try {
        jconfig = json::parse(jstr);
    }
    catch (const json::exception& e) {
        throw malformed_input(std::string("invalid config: ") + e.what());
    }
    return parse_run_config(jconfig);
}

int run(const run_config& config, const curve_backend& curve, std::ostream& err) {
    BLSWIT_LOG_DEBUG << "limbs: " << params::num_limbs << " x " << params::limb_bits
                     << " bits, signature mode: " << to_string(config.options.signature_mode);

    try {
        convert_file(config.input, config.output, config.options, curve);
    }
    catch (const conversion_error& e) {
        err << "Error: " << to_string(e.kind()) << ": " << e.what() << std::endl;
        BLSWIT_LOG_FATAL << to_string(e.kind()) << ": " << e.what();
        return EXIT_FAILURE;
    }
    catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        BLSWIT_LOG_FATAL << e.what();
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}  // namespace blswit
