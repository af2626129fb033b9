// tests/util/test_mpz_get.cpp
#define BOOST_TEST_MODULE MPZ_Get_Tests
#include <boost/test/included/unit_test.hpp>
#include <gmp.h>
#include <gmpxx.h>
#include <blswit/limb_codec.hpp>
#include <blswit/util/mpz_get.hpp>
#include <cstdint>

using namespace blswit;

// ============================================================================
// Test Suite: mpz_get_u64
// ============================================================================

BOOST_AUTO_TEST_SUITE(MPZ_Get_U64_Tests)

BOOST_AUTO_TEST_CASE(zero_value) {
    mpz_class val(0);
    BOOST_CHECK_EQUAL(mpz_get_u64(val), 0ULL);
}

BOOST_AUTO_TEST_CASE(full_55_bit_limb) {
    mpz_class val;
    mpz_set_str(val.get_mpz_t(), "7fffffffffffff", 16);
    BOOST_CHECK_EQUAL(mpz_get_u64(val), 0x7fffffffffffffULL);
}

BOOST_AUTO_TEST_CASE(max_uint64) {
    mpz_class val;
    mpz_set_str(val.get_mpz_t(), "ffffffffffffffff", 16);
    BOOST_CHECK_EQUAL(mpz_get_u64(val), 0xffffffffffffffffULL);
}

BOOST_AUTO_TEST_CASE(field_element_returns_lowest_word) {
    // BLS12-381 G1 generator x coordinate
    mpz_class val(
        "17f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff97a1aeffb3af00adb22c6bb",
        16);
    BOOST_CHECK_EQUAL(mpz_get_u64(val), 0xfb3af00adb22c6bbULL);
}

BOOST_AUTO_TEST_CASE(mpz_t_variant) {
    mpz_t val;
    mpz_init(val);
    mpz_set_str(val, "0c8a2c57e2b1d5d4", 16);
    BOOST_CHECK_EQUAL(mpz_get_u64(val), 0x0c8a2c57e2b1d5d4ULL);
    mpz_clear(val);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: mpz_fits_u64
// ============================================================================

BOOST_AUTO_TEST_SUITE(MPZ_Narrow_Tests)

BOOST_AUTO_TEST_CASE(fits_u64_boundaries) {
    BOOST_CHECK(mpz_fits_u64(mpz_class(0)));
    BOOST_CHECK(mpz_fits_u64(mpz_class("ffffffffffffffff", 16)));
    BOOST_CHECK(!mpz_fits_u64(mpz_class("10000000000000000", 16)));
    BOOST_CHECK(!mpz_fits_u64(mpz_class(-1)));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Test Suite: Limbs read back as native words
// ============================================================================

BOOST_AUTO_TEST_SUITE(Limb_Word_Tests)

BOOST_AUTO_TEST_CASE(limbs_match_manual_shift) {
    mpz_class val(
        "17f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff97a1aeffb3af00adb22c6bb",
        16);
    limb_array limbs = encode(val);

    const uint64_t mask = (uint64_t(1) << params::limb_bits) - 1;
    mpz_class rest = val;
    for (const auto& limb : limbs) {
        BOOST_CHECK_EQUAL(mpz_get_u64(limb), mpz_get_u64(rest) & mask);
        rest >>= params::limb_bits;
    }
    BOOST_CHECK(rest == 0);
}

BOOST_AUTO_TEST_SUITE_END()
