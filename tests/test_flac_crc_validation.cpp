/*
 * test_flac_crc_validation.cpp - CRC-8 and CRC-16 checks per RFC 9639
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"
#include "test_framework.h"
#include "flac_test_data_utils.h"

using namespace FlacDec::FLAC;
using namespace TestFramework;

/**
 * Standard check string for both polynomials:
 *   CRC-8  (x^8 + x^2 + x + 1, init 0)        = 0xF4
 *   CRC-16 (x^16 + x^15 + x^2 + 1, init 0)    = 0xFEE8
 */
void test_check_values() {
    const uint8_t* check = reinterpret_cast<const uint8_t*>("123456789");

    ASSERT_EQUALS(0xF4u, static_cast<uint32_t>(CRCValidator::computeCRC8(check, 9)), "CRC-8 check value");
    ASSERT_EQUALS(0xFEE8u, static_cast<uint32_t>(CRCValidator::computeCRC16(check, 9)), "CRC-16 check value");
}

void test_empty_input() {
    ASSERT_EQUALS(0u, static_cast<uint32_t>(CRCValidator::computeCRC8(nullptr, 0)), "CRC-8 of nothing");
    ASSERT_EQUALS(0u, static_cast<uint32_t>(CRCValidator::computeCRC16(nullptr, 0)), "CRC-16 of nothing");
}

// Tables must agree with the bitwise definition
void test_tables_match_bitwise() {
    std::vector<uint8_t> data;
    for (int i = 0; i < 1024; i++) {
        data.push_back(static_cast<uint8_t>((i * 37 + 11) & 0xFF));
    }

    for (size_t len = 0; len <= data.size(); len += 61) {
        ASSERT_EQUALS(static_cast<uint32_t>(FLACTestData::referenceCRC8(data.data(), len)),
                      static_cast<uint32_t>(CRCValidator::computeCRC8(data.data(), len)),
                      "CRC-8 table matches bitwise CRC");
        ASSERT_EQUALS(static_cast<uint32_t>(FLACTestData::referenceCRC16(data.data(), len)),
                      static_cast<uint32_t>(CRCValidator::computeCRC16(data.data(), len)),
                      "CRC-16 table matches bitwise CRC");
    }
}

void test_incremental_matches_one_shot() {
    const uint8_t frame[] = {0xFF, 0xF8, 0x69, 0x18, 0x00, 0x00, 0x12, 0x34, 0x56};
    CRCValidator crc;

    crc.resetCRC8();
    crc.resetCRC16();
    for (uint8_t byte : frame) {
        crc.update(byte);
    }
    ASSERT_EQUALS(static_cast<uint32_t>(CRCValidator::computeCRC8(frame, sizeof(frame))),
                  static_cast<uint32_t>(crc.getCRC8()), "Streaming CRC-8");
    ASSERT_EQUALS(static_cast<uint32_t>(CRCValidator::computeCRC16(frame, sizeof(frame))),
                  static_cast<uint32_t>(crc.getCRC16()), "Streaming CRC-16");

    // Separate accumulators
    crc.resetCRC8();
    crc.updateCRC8(frame, 4);
    crc.updateCRC8(frame + 4, sizeof(frame) - 4);
    ASSERT_EQUALS(static_cast<uint32_t>(CRCValidator::computeCRC8(frame, sizeof(frame))),
                  static_cast<uint32_t>(crc.getCRC8()), "Split CRC-8");

    crc.resetCRC16();
    for (uint8_t byte : frame) {
        crc.updateCRC16(byte);
    }
    ASSERT_EQUALS(static_cast<uint32_t>(CRCValidator::computeCRC16(frame, sizeof(frame))),
                  static_cast<uint32_t>(crc.getCRC16()), "Byte-wise CRC-16");
}

// A message followed by its own CRC-16 leaves a zero remainder
void test_crc16_self_check() {
    std::vector<uint8_t> data = {0x10, 0x20, 0x30, 0x40, 0x50};
    uint16_t crc = CRCValidator::computeCRC16(data.data(), data.size());
    data.push_back(static_cast<uint8_t>(crc >> 8));
    data.push_back(static_cast<uint8_t>(crc & 0xFF));
    ASSERT_EQUALS(0u, static_cast<uint32_t>(CRCValidator::computeCRC16(data.data(), data.size())),
                  "Zero remainder over data plus CRC");
}

void test_reset_only_touches_one_accumulator() {
    CRCValidator crc;
    crc.update(0xAB);
    uint16_t crc16 = crc.getCRC16();

    crc.resetCRC8();
    ASSERT_EQUALS(0u, static_cast<uint32_t>(crc.getCRC8()), "CRC-8 reset");
    ASSERT_EQUALS(static_cast<uint32_t>(crc16), static_cast<uint32_t>(crc.getCRC16()), "CRC-16 untouched");
}

// Frame bytes are covered by CRC-8 and CRC-16, so flipping any one bit
// after the metadata must stop the decoder. MD5 is off so the frame
// checksums alone have to catch it.
void test_single_bit_flips_are_detected() {
    using namespace FlacDec;
    using FLACTestData::SubframeOptions;

    FLACTestData::FrameOptions layout;
    layout.channel_assignment = 10;
    layout.subframes = {SubframeOptions::lpc({3, -3, 1}, 12, 0), SubframeOptions::lpc({3, -3, 1}, 12, 0)};
    layout.subframes[0].partition_order = 2;
    layout.subframes[1].escape_bits = 24;

    std::vector<std::vector<int64_t>> pcm = {FLACTestData::makeSine(128, 16, 40.0),
                                             FLACTestData::makeSine(128, 16, 23.0, 1.0)};
    FLACTestData::FLACStreamBuilder builder(44100, 2, 16);
    builder.addFrame(pcm, layout);
    const std::vector<uint8_t> clean = builder.build();
    const size_t frame_start = builder.getFrameOffset(0);

    DecoderConfig config;
    config.verify_md5 = false;

    {
        IO::MemoryIOHandler source(clean.data(), clean.size());
        std::unique_ptr<DecodeSession> session;
        ASSERT_EQUALS(FLACError::NONE, DecodeSession::open(&source, session, config), "Open clean stream");
        DecodedBlock block;
        ASSERT_EQUALS(FLACError::NONE, session->nextBlock(block), "Clean frame decodes");
        ASSERT_TRUE(block.samples == pcm, "Clean frame matches the source");
    }

    size_t flips = 0;
    for (size_t offset = frame_start; offset < clean.size(); offset++) {
        for (int bit = 0; bit < 8; bit++) {
            std::vector<uint8_t> bytes = clean;
            bytes[offset] ^= static_cast<uint8_t>(1u << bit);

            IO::MemoryIOHandler source(bytes.data(), bytes.size());
            std::unique_ptr<DecodeSession> session;
            ASSERT_EQUALS(FLACError::NONE, DecodeSession::open(&source, session, config), "Metadata untouched");

            DecodedBlock block;
            FLACError err = session->nextBlock(block);
            if (err == FLACError::NONE || err == FLACError::END_OF_STREAM) {
                std::ostringstream oss;
                oss << "Flip of bit " << bit << " at frame byte " << (offset - frame_start)
                    << " went unnoticed";
                throw AssertionFailure(oss.str());
            }
            flips++;
        }
    }
    ASSERT_EQUALS((clean.size() - frame_start) * 8, flips, "Every bit flipped");
}

int main() {
    TestSuite suite("FLAC CRC Validation Tests");

    suite.addTest("Check Values", test_check_values);
    suite.addTest("Empty Input", test_empty_input);
    suite.addTest("Tables Match Bitwise", test_tables_match_bitwise);
    suite.addTest("Incremental Matches One-Shot", test_incremental_matches_one_shot);
    suite.addTest("CRC-16 Self Check", test_crc16_self_check);
    suite.addTest("Independent Reset", test_reset_only_touches_one_accumulator);
    suite.addTest("Single-Bit Flips Are Detected", test_single_bit_flips_are_detected);

    auto results = suite.runAll();
    suite.printResults(results);

    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
