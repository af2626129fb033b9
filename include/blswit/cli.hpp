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

#include <ostream>

#include <blswit/curve.hpp>
#include <blswit/step_data.hpp>
#include <blswit/util/log.hpp>

namespace blswit {

/// Settings of one `convert-step-data` run
struct run_config {
    fs::path        input  = std::string(params::default_input);
    fs::path        output = std::string(params::default_output);
    convert_options options;
    log_level       level  = log_level::info_only;
};

/************************************************************
 * Read the JSON configuration passed on the command line.
 * Every key is optional.
 *
 * Example:
 *     { "input": "in.json", "signature-mode": "object",
 *       "committee-size": 512, "log-level": "debug" }
 *
 * @throws malformed_input  on ill-typed values or unknown log level
 * @throws invalid_mode     on an unknown signature mode
 ************************************************************/
run_config parse_run_config(const json& jconfig);

/// Same as above, from the raw command-line string.
run_config parse_run_config(std::string_view jstr);

/************************************************************
 * Convert `config.input` into `config.output`.
 *
 * A failure is written to `err` as "Error: <Kind>: <message>"
 * regardless of the log level, and logged as fatal.
 *
 * @return  EXIT_SUCCESS or EXIT_FAILURE
 ************************************************************/
int run(const run_config& config, const curve_backend& curve, std::ostream& err);

}  // namespace blswit
