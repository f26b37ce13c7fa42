/*
 * test_debug_logging.cpp - Tests for the channel-based debug logger
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 */

#include "flacdec.h"
#include "test_framework.h"
#include "flac_test_data_utils.h"

#include <cstdlib>

using namespace FlacDec;
using namespace TestFramework;

namespace {

const char* LOG_PATH = "flacdec_debug_test.log";

std::string readLog() {
    std::ifstream in(LOG_PATH);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void startLog(const std::vector<std::string>& channels) {
    Debug::shutdown();
    std::remove(LOG_PATH);
    Debug::init(LOG_PATH, channels);
}

void decodeSmallStream() {
    FLACTestData::FLACStreamBuilder builder(44100, 1, 16);
    builder.addFrames({FLACTestData::makeSine(400, 16, 30.0)}, 192);
    std::vector<uint8_t> bytes = builder.build();

    IO::MemoryIOHandler source(bytes.data(), bytes.size());
    std::unique_ptr<FLAC::DecodeSession> session;
    ASSERT_EQUALS(FLAC::FLACError::NONE, FLAC::DecodeSession::open(&source, session), "Open");
    FLAC::DecodedBlock block;
    while (session->nextBlock(block) == FLAC::FLACError::NONE) {
    }
}

} // anonymous namespace

void test_disabled_by_default() {
    Debug::shutdown();
    ASSERT_FALSE(Debug::isChannelEnabled("flac_codec"), "No channels after shutdown");
    ASSERT_FALSE(Debug::isChannelEnabled("all"), "Not even all");
}

void test_channel_filtering() {
    startLog({"flac_frame"});
    ASSERT_TRUE(Debug::isChannelEnabled("flac_frame"), "Enabled channel");
    ASSERT_FALSE(Debug::isChannelEnabled("flac_codec"), "Other channel stays off");

    decodeSmallStream();
    Debug::shutdown();

    std::string log = readLog();
    ASSERT_TRUE(log.find("[flac_frame]") != std::string::npos, "Frame channel written");
    ASSERT_TRUE(log.find("Frame at byte") != std::string::npos, "Per-frame header line");
    ASSERT_TRUE(log.find("[flac_codec]") == std::string::npos, "Session channel filtered out");
}

void test_all_channel() {
    startLog({"all"});
    ASSERT_TRUE(Debug::isChannelEnabled("anything"), "all enables every channel");

    decodeSmallStream();
    Debug::shutdown();

    std::string log = readLog();
    ASSERT_TRUE(log.find("[flac_codec]") != std::string::npos, "Session messages");
    ASSERT_TRUE(log.find("[flac_frame]") != std::string::npos, "Frame messages");
}

void test_location_logging() {
    startLog({"io"});
    DEBUG_LOG("io", "value ", 42, " hex 0x", std::hex, 255);
    Debug::log("io", "plain ", 7);
    Debug::shutdown();

    std::string log = readLog();
    ASSERT_TRUE(log.find("test_location_logging:") != std::string::npos, "Function name recorded");
    ASSERT_TRUE(log.find("value 42 hex 0xff") != std::string::npos, "Arguments streamed in order");
    ASSERT_TRUE(log.find("[io]: plain 7") != std::string::npos, "Plain log has no location");
}

void test_lazy_logging_skips_arguments() {
    Debug::shutdown();
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };
    DEBUG_LOG_LAZY("flac_codec", "count ", count());
    ASSERT_EQUALS(0, evaluated, "Arguments not evaluated while disabled");

    startLog({"flac_codec"});
    DEBUG_LOG_LAZY("flac_codec", "count ", count());
    Debug::shutdown();
    ASSERT_EQUALS(1, evaluated, "Arguments evaluated once enabled");
}

void test_environment_configuration() {
    Debug::shutdown();
    std::remove(LOG_PATH);
    setenv("FLACDEC_DEBUG", "residual_decoder,flac_frame", 1);
    setenv("FLACDEC_DEBUG_FILE", LOG_PATH, 1);
    Debug::initFromEnvironment();

    ASSERT_TRUE(Debug::isChannelEnabled("residual_decoder"), "First listed channel");
    ASSERT_TRUE(Debug::isChannelEnabled("flac_frame"), "Second listed channel");
    ASSERT_FALSE(Debug::isChannelEnabled("io"), "Unlisted channel");

    Debug::log("flac_frame", "from environment");
    Debug::shutdown();
    ASSERT_TRUE(readLog().find("from environment") != std::string::npos, "Written to FLACDEC_DEBUG_FILE");

    unsetenv("FLACDEC_DEBUG");
    unsetenv("FLACDEC_DEBUG_FILE");
    Debug::initFromEnvironment();
    ASSERT_FALSE(Debug::isChannelEnabled("flac_frame"), "Unset variable enables nothing");
    std::remove(LOG_PATH);
}

int main() {
    TestSuite suite("Debug Logging Tests");

    suite.addTest("Disabled By Default", test_disabled_by_default);
    suite.addTest("Channel Filtering", test_channel_filtering);
    suite.addTest("All Channel", test_all_channel);
    suite.addTest("Location Logging", test_location_logging);
    suite.addTest("Lazy Logging Skips Arguments", test_lazy_logging_skips_arguments);
    suite.addTest("Environment Configuration", test_environment_configuration);

    auto results = suite.runAll();
    suite.printResults(results);

    return (suite.getFailureCount(results) == 0) ? 0 : 1;
}
