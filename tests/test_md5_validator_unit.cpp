/*
 * test_md5_validator_unit.cpp - Unit tests for MD5Validator
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 */

#include "flacdec.h"
#include "test_framework.h"
#include "flac_test_data_utils.h"

using namespace FlacDec::FLAC;
using namespace TestFramework;

namespace {

void md5Of(MD5Validator& validator, const std::vector<std::vector<int64_t>>& pcm, uint32_t bps,
           uint8_t out[16]) {
    std::vector<const int64_t*> ptrs;
    for (const auto& ch : pcm) {
        ptrs.push_back(ch.data());
    }
    ASSERT_TRUE(validator.reset(), "Reset MD5 context");
    ASSERT_TRUE(validator.update(ptrs.data(), static_cast<uint32_t>(pcm[0].size()),
                                 static_cast<uint32_t>(pcm.size()), bps),
                "Update MD5");
    ASSERT_TRUE(validator.finalize(out), "Finalize MD5");
}

bool sameDigest(const uint8_t* a, const std::vector<uint8_t>& b) {
    return b.size() == 16 && std::memcmp(a, b.data(), 16) == 0;
}

} // anonymous namespace

// MD5 of no data: d41d8cd98f00b204e9800998ecf8427e
void test_empty_digest() {
    MD5Validator validator;
    ASSERT_TRUE(validator.reset(), "Reset");
    uint8_t digest[16];
    ASSERT_TRUE(validator.finalize(digest), "Finalize with no input");

    const uint8_t expected[16] = {0xd4, 0x1d, 0x8c, 0xd9, 0x8f, 0x00, 0xb2, 0x04,
                                  0xe9, 0x80, 0x09, 0x98, 0xec, 0xf8, 0x42, 0x7e};
    ASSERT_TRUE(std::memcmp(digest, expected, 16) == 0, "Empty-input MD5");
    ASSERT_TRUE(validator.compare(expected), "compare() agrees");
    ASSERT_FALSE(validator.isActive(), "Finalized context is inactive");
}

// 16-bit stereo: interleaved little-endian, two bytes per sample
void test_16bit_stereo_layout() {
    std::vector<std::vector<int64_t>> pcm = {{1, -1, 0x1234}, {-32768, 32767, 0}};
    MD5Validator validator;
    uint8_t digest[16];
    md5Of(validator, pcm, 16, digest);

    ASSERT_TRUE(sameDigest(digest, FLACTestData::computeAudioMD5(pcm, 16)), "Matches reference layout");
}

// Widths that are not whole bytes round up: 12 -> 2 bytes, 20 -> 3 bytes
void test_odd_bit_depths() {
    const uint32_t depths[] = {4, 8, 12, 20, 24, 32};
    for (uint32_t bps : depths) {
        std::vector<std::vector<int64_t>> pcm = {FLACTestData::makeNoise(100, bps, bps),
                                                 FLACTestData::makeNoise(100, bps, bps + 1),
                                                 FLACTestData::makeNoise(100, bps, bps + 2)};
        MD5Validator validator;
        uint8_t digest[16];
        md5Of(validator, pcm, bps, digest);
        ASSERT_TRUE(sameDigest(digest, FLACTestData::computeAudioMD5(pcm, bps)), "Digest for bit depth");
    }
}

// Feeding blocks one at a time hashes the same byte stream
void test_incremental_updates() {
    std::vector<int64_t> left = FLACTestData::makeSine(1000, 16, 50.0);
    std::vector<int64_t> right = FLACTestData::makeSine(1000, 16, 70.0);
    std::vector<std::vector<int64_t>> pcm = {left, right};

    MD5Validator validator;
    ASSERT_TRUE(validator.reset(), "Reset");
    for (size_t start = 0; start < 1000; start += 192) {
        size_t count = std::min<size_t>(192, 1000 - start);
        const int64_t* ptrs[] = {left.data() + start, right.data() + start};
        ASSERT_TRUE(validator.update(ptrs, static_cast<uint32_t>(count), 2, 16), "Update with block");
    }
    uint8_t digest[16];
    ASSERT_TRUE(validator.finalize(digest), "Finalize");
    ASSERT_TRUE(sameDigest(digest, FLACTestData::computeAudioMD5(pcm, 16)), "Block-wise digest");

    uint8_t again[16];
    validator.getMD5(again);
    ASSERT_TRUE(std::memcmp(digest, again, 16) == 0, "getMD5 returns the final digest");
}

void test_state_errors() {
    MD5Validator validator;
    const int64_t samples[] = {1, 2};
    const int64_t* ptrs[] = {samples};
    uint8_t digest[16];

    ASSERT_FALSE(validator.update(ptrs, 2, 1, 16), "Update before reset");
    ASSERT_FALSE(validator.finalize(digest), "Finalize before reset");

    ASSERT_TRUE(validator.reset(), "Reset");
    ASSERT_FALSE(validator.update(ptrs, 2, 1, 0), "Bit depth 0 rejected");
    ASSERT_FALSE(validator.update(ptrs, 2, 1, 33), "Bit depth 33 rejected");

    ASSERT_TRUE(validator.finalize(digest), "Finalize");
    ASSERT_FALSE(validator.update(ptrs, 2, 1, 16), "Update after finalize");
}

void test_zero_signature() {
    const uint8_t zero[16] = {0};
    uint8_t nonzero[16] = {0};
    nonzero[15] = 1;

    ASSERT_TRUE(MD5Validator::isZeroMD5(zero), "All-zero signature");
    ASSERT_FALSE(MD5Validator::isZeroMD5(nonzero), "Non-zero signature");
}

int main() {
    TestSuite suite("MD5Validator Unit Tests");

    suite.addTest("Empty Digest", test_empty_digest);
    suite.addTest("16-bit Stereo Layout", test_16bit_stereo_layout);
    suite.addTest("Odd Bit Depths", test_odd_bit_depths);
    suite.addTest("Incremental Updates", test_incremental_updates);
    suite.addTest("State Errors", test_state_errors);
    suite.addTest("Zero Signature", test_zero_signature);

    auto results = suite.runAll();
    suite.printResults(results);

    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
