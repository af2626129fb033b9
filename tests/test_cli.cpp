// tests/test_cli.cpp
#define BOOST_TEST_MODULE Cli_Tests
#include <boost/test/included/unit_test.hpp>
#include <blswit/cli.hpp>
#include "fake_curve.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

using namespace blswit;
using namespace blswit::test;

namespace {

struct run_fixture {
    run_fixture() {
        curve.add_g1(g1_hex(0x01), g1_affine{ 5, 7 });
        curve.add_g2(g2_hex(0xa1), g2_affine{ { 21, 22 }, { 23, 24 } });

        std::random_device rd;
        dir = fs::temp_directory_path() / ("blswit-cli-" + std::to_string(rd()));
        fs::create_directories(dir);
    }

    ~run_fixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
        set_logging_level(log_level::info_only);
    }

    run_config write_input(const std::vector<std::string>& pubkeys) const {
        json j = json::object();
        j["pubkeys"] = pubkeys;
        j["pubkeybits"] = json::array({ 1, 1, 0 });
        j["signature"] = g2_hex(0xa1);
        j["signing_root"] = "0x00ff";
        j["participation"] = 2;
        j["syncCommitteePoseidon"] = "1";

        run_config config;
        config.input = dir / "my_step_data.json";
        config.output = dir / "my_step_input.json";
        std::ofstream ofs(config.input);
        ofs << j.dump();
        return config;
    }

    fake_curve curve;
    fs::path dir;
};

}

// ============================================================================
// Test Suite: parse_run_config
// ============================================================================

BOOST_AUTO_TEST_SUITE(Config_Tests)

BOOST_AUTO_TEST_CASE(defaults) {
    run_config config = parse_run_config(json::object());
    BOOST_CHECK_EQUAL(config.input.string(), "data/my_step_data.json");
    BOOST_CHECK_EQUAL(config.output.string(), "data/my_step_input.json");
    BOOST_CHECK(config.options.signature_mode == encoding_mode::array);
    BOOST_CHECK(!config.options.committee_size);
    BOOST_CHECK(!config.options.message_hash);
    BOOST_CHECK(config.level == log_level::info_only);
}

BOOST_AUTO_TEST_CASE(all_keys) {
    run_config config = parse_run_config(std::string_view(
        R"({"input": "a.json", "output": "b.json", "committee-size": 512,
            "signature-mode": "object", "message-hash": true, "log-level": "debug"})"));
    BOOST_CHECK_EQUAL(config.input.string(), "a.json");
    BOOST_CHECK_EQUAL(config.output.string(), "b.json");
    BOOST_REQUIRE(config.options.committee_size);
    BOOST_CHECK_EQUAL(*config.options.committee_size, 512u);
    BOOST_CHECK(config.options.signature_mode == encoding_mode::object);
    BOOST_CHECK(config.options.message_hash);
    BOOST_CHECK(config.level == log_level::debug_only);
}

BOOST_AUTO_TEST_CASE(invalid_json_rejected) {
    BOOST_CHECK_THROW(parse_run_config(std::string_view("{ \"input\": ")), malformed_input);
    BOOST_CHECK_THROW(parse_run_config(std::string_view("[1, 2]")), malformed_input);
}

BOOST_AUTO_TEST_CASE(ill_typed_values_rejected) {
    BOOST_CHECK_THROW(parse_run_config(json({ { "committee-size", "many" } })), malformed_input);
    BOOST_CHECK_THROW(parse_run_config(json({ { "committee-size", -1 } })), malformed_input);
    BOOST_CHECK_THROW(parse_run_config(json({ { "message-hash", "yes" } })), malformed_input);
    BOOST_CHECK_THROW(parse_run_config(json({ { "log-level", "loud" } })), malformed_input);
}

BOOST_AUTO_TEST_CASE(unknown_signature_mode_rejected) {
    BOOST_CHECK_THROW(parse_run_config(json({ { "signature-mode", "hex" } })), invalid_mode);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: run
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(Run_Tests, run_fixture)

BOOST_AUTO_TEST_CASE(success_exit_status) {
    run_config config = write_input({ g1_hex(0x01) });
    std::ostringstream err;

    BOOST_CHECK_EQUAL(run(config, curve, err), EXIT_SUCCESS);
    BOOST_CHECK(err.str().empty());
    BOOST_CHECK(fs::exists(config.output));
}

BOOST_AUTO_TEST_CASE(failure_reported_under_debug_level) {
    run_config config = write_input({ g1_hex(0x01), g1_hex(0x01), "0x123" });
    set_logging_level(log_level::debug_only);
    std::ostringstream err;

    BOOST_CHECK_EQUAL(run(config, curve, err), EXIT_FAILURE);
    BOOST_CHECK(err.str().find("MalformedHex") != std::string::npos);
    BOOST_CHECK(err.str().find("pubkeys[2]") != std::string::npos);
    BOOST_CHECK(!fs::exists(config.output));
}

BOOST_AUTO_TEST_CASE(failure_reported_with_logging_disabled) {
    run_config config = write_input({ g1_hex(0x01), g1_hex(0x01), g1_hex(0x42) });
    set_logging_level(log_level::disabled);
    std::ostringstream err;

    BOOST_CHECK_EQUAL(run(config, curve, err), EXIT_FAILURE);
    BOOST_CHECK(err.str().find("DecompressionError") != std::string::npos);
    BOOST_CHECK(err.str().find("pubkeys[2]") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(committee_size_mismatch_fails) {
    run_config config = write_input({ g1_hex(0x01) });
    config.options.committee_size = 512;
    std::ostringstream err;

    BOOST_CHECK_EQUAL(run(config, curve, err), EXIT_FAILURE);
    BOOST_CHECK(err.str().find("MalformedInput") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_input_fails) {
    run_config config;
    config.input = dir / "absent.json";
    config.output = dir / "out.json";
    std::ostringstream err;

    BOOST_CHECK_EQUAL(run(config, curve, err), EXIT_FAILURE);
    BOOST_CHECK(err.str().find("InputNotFound") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
