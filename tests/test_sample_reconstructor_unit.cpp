/*
 * test_sample_reconstructor_unit.cpp - Unit tests for SampleReconstructor
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 */

#include "flacdec.h"
#include "test_framework.h"

using namespace FlacDec::FLAC;
using namespace TestFramework;

// Order 1: each sample is the previous plus the residual
void test_fixed_order_1() {
    SampleReconstructor reconstructor;

    // warm-up 100, then residuals
    int64_t samples[] = {100, 5, -10, 0, 3};
    ASSERT_TRUE(reconstructor.restoreFixed(samples, 5, 1, 16), "Restore order 1");

    const int64_t expected[] = {100, 105, 95, 95, 98};
    for (int i = 0; i < 5; i++) {
        ASSERT_EQUALS(expected[i], samples[i], "Order 1 sample");
    }
}

// Order 2 continues a straight line with zero residuals
void test_fixed_order_2_linear() {
    SampleReconstructor reconstructor;

    int64_t samples[] = {10, 20, 0, 0, 0, 0};
    ASSERT_TRUE(reconstructor.restoreFixed(samples, 6, 2, 16), "Restore order 2");

    for (int i = 0; i < 6; i++) {
        ASSERT_EQUALS(static_cast<int64_t>(10 * (i + 1)), samples[i], "Linear ramp");
    }
}

// Order 3 reproduces a quadratic, order 4 a cubic
void test_fixed_higher_orders() {
    SampleReconstructor reconstructor;

    int64_t quad[8] = {0, 1, 4};
    ASSERT_TRUE(reconstructor.restoreFixed(quad, 8, 3, 16), "Restore order 3");
    for (int i = 0; i < 8; i++) {
        ASSERT_EQUALS(static_cast<int64_t>(i * i), quad[i], "Quadratic sequence");
    }

    int64_t cubic[8] = {0, 1, 8, 27};
    ASSERT_TRUE(reconstructor.restoreFixed(cubic, 8, 4, 16), "Restore order 4");
    for (int i = 0; i < 8; i++) {
        ASSERT_EQUALS(static_cast<int64_t>(i * i * i), cubic[i], "Cubic sequence");
    }
}

void test_fixed_order_0() {
    SampleReconstructor reconstructor;

    int64_t samples[] = {7, -7, 300, -300};
    ASSERT_TRUE(reconstructor.restoreFixed(samples, 4, 0, 16), "Order 0 passes residuals through");
    ASSERT_EQUALS(static_cast<int64_t>(-300), samples[3], "Residual is the sample");
}

void test_lpc_restore() {
    SampleReconstructor reconstructor;

    // prediction = (3*s[n-1] - 1*s[n-2]) >> 1
    const int32_t coeffs[] = {3, -1};
    int64_t samples[] = {10, 12, 1, -2, 0};
    ASSERT_TRUE(reconstructor.restoreLPC(samples, 5, coeffs, 2, 1, 16), "Restore LPC order 2");

    // (36 - 10) >> 1 = 13, + 1 = 14
    ASSERT_EQUALS(static_cast<int64_t>(14), samples[2], "LPC sample 2");
    // (42 - 12) >> 1 = 15, - 2 = 13
    ASSERT_EQUALS(static_cast<int64_t>(13), samples[3], "LPC sample 3");
    // (39 - 14) >> 1 = 12
    ASSERT_EQUALS(static_cast<int64_t>(12), samples[4], "LPC sample 4");
}

// The shift is arithmetic: negative sums round toward negative infinity
void test_lpc_negative_shift_rounding() {
    SampleReconstructor reconstructor;

    const int32_t coeffs[] = {1};
    int64_t samples[] = {-3, 0};
    ASSERT_TRUE(reconstructor.restoreLPC(samples, 2, coeffs, 1, 1, 16), "Restore LPC order 1");
    ASSERT_EQUALS(static_cast<int64_t>(-2), samples[1], "-3 >> 1 is -2");
}

void test_lpc_max_order() {
    SampleReconstructor reconstructor;

    int32_t coeffs[32] = {0};
    coeffs[31] = 1;
    int64_t samples[40];
    for (int i = 0; i < 32; i++) {
        samples[i] = i - 16;
    }
    for (int i = 32; i < 40; i++) {
        samples[i] = 1000;
    }

    ASSERT_TRUE(reconstructor.restoreLPC(samples, 40, coeffs, 32, 0, 16), "Restore LPC order 32");
    ASSERT_EQUALS(static_cast<int64_t>(-16 + 1000), samples[32], "Uses s[n-32]");
}

void test_invalid_parameters() {
    SampleReconstructor reconstructor;
    int64_t samples[8] = {0};
    const int32_t coeffs[33] = {0};

    ASSERT_FALSE(reconstructor.restoreFixed(samples, 8, 5, 16), "Fixed order 5 rejected");
    ASSERT_EQUALS(FLACError::INVALID_SUBFRAME, reconstructor.getLastError(), "Fixed order error");

    ASSERT_FALSE(reconstructor.restoreFixed(samples, 3, 4, 16), "Order larger than block rejected");
    ASSERT_FALSE(reconstructor.restoreLPC(samples, 8, coeffs, 0, 0, 16), "LPC order 0 rejected");
    ASSERT_FALSE(reconstructor.restoreLPC(samples, 8, coeffs, 33, 0, 16), "LPC order 33 rejected");
    ASSERT_FALSE(reconstructor.restoreLPC(samples, 8, coeffs, 2, 32, 16), "Shift 32 rejected");
    ASSERT_EQUALS(FLACError::INVALID_SUBFRAME, reconstructor.getLastError(), "LPC parameter error");
}

void test_overflow_guard() {
    SampleReconstructor reconstructor;

    int64_t samples[] = {32767, 1};
    ASSERT_FALSE(reconstructor.restoreFixed(samples, 2, 1, 16), "32768 does not fit 16 bits");
    ASSERT_EQUALS(FLACError::ARITHMETIC_OVERFLOW_GUARD, reconstructor.getLastError(), "Overflow reported");

    // The same value is fine in a 17-bit side channel
    int64_t side[] = {32767, 1};
    ASSERT_TRUE(reconstructor.restoreFixed(side, 2, 1, 17), "32768 fits 17 bits");

    const int32_t coeffs[] = {16383};
    int64_t lpc[] = {-(static_cast<int64_t>(1) << 31), 0};
    ASSERT_FALSE(reconstructor.restoreLPC(lpc, 2, coeffs, 1, 0, 32), "LPC overflow at 32 bits");
    ASSERT_EQUALS(FLACError::ARITHMETIC_OVERFLOW_GUARD, reconstructor.getLastError(), "LPC overflow reported");
}

void test_fits_bit_depth() {
    ASSERT_TRUE(SampleReconstructor::fitsBitDepth(127, 8), "127 fits 8 bits");
    ASSERT_TRUE(SampleReconstructor::fitsBitDepth(-128, 8), "-128 fits 8 bits");
    ASSERT_FALSE(SampleReconstructor::fitsBitDepth(128, 8), "128 does not fit 8 bits");
    ASSERT_FALSE(SampleReconstructor::fitsBitDepth(-129, 8), "-129 does not fit 8 bits");

    const int64_t two32 = static_cast<int64_t>(1) << 32;
    ASSERT_TRUE(SampleReconstructor::fitsBitDepth(-two32, 33), "-2^32 fits 33 bits");
    ASSERT_FALSE(SampleReconstructor::fitsBitDepth(two32, 33), "2^32 does not fit 33 bits");
}

int main() {
    TestSuite suite("SampleReconstructor Unit Tests");

    suite.addTest("Fixed Order 1", test_fixed_order_1);
    suite.addTest("Fixed Order 2 Linear", test_fixed_order_2_linear);
    suite.addTest("Fixed Higher Orders", test_fixed_higher_orders);
    suite.addTest("Fixed Order 0", test_fixed_order_0);
    suite.addTest("LPC Restore", test_lpc_restore);
    suite.addTest("LPC Shift Rounding", test_lpc_negative_shift_rounding);
    suite.addTest("LPC Max Order", test_lpc_max_order);
    suite.addTest("Invalid Parameters", test_invalid_parameters);
    suite.addTest("Overflow Guard", test_overflow_guard);
    suite.addTest("Fits Bit Depth", test_fits_bit_depth);

    auto results = suite.runAll();
    suite.printResults(results);

    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
