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
#include <iostream>

#include <blswit/cli.hpp>
#include <blswit/curve.hpp>
#include <blswit/util/log.hpp>

using namespace blswit;

int main(int argc, const char *argv[]) {
    std::cout << "convert-step-data v"
              << BLSWIT_VERSION_MAJOR << "."
              << BLSWIT_VERSION_MINOR << "."
              << BLSWIT_VERSION_PATCH << std::endl;

    run_config config;
    if (argc >= 2) {
        try {
            config = parse_run_config(std::string_view(argv[1]));
        }
        catch (const conversion_error& e) {
            std::cerr << "Error: " << to_string(e.kind()) << ": " << e.what() << std::endl;
            exit(EXIT_FAILURE);
        }
    }
    set_logging_level(config.level);

    bls12_381_backend curve;
    return run(config, curve, std::cerr);
}
