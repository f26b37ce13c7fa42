/*
 * debug.h - Channel-based debug logging
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

#include <atomic>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * @brief Process-wide logger with named channels
 *
 * Nothing is written until a channel is enabled. The decoder logs on
 * "flac_codec" (session and metadata), "flac_frame" (headers, sync and
 * resync), "subframe_decoder", "residual_decoder" and "io". The channel
 * "all" enables every channel. Lines go to the log file when one was
 * opened, otherwise to stdout.
 */
class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);

    /**
     * @brief Enable channels from the environment
     *
     * FLACDEC_DEBUG holds a comma-separated channel list, FLACDEC_DEBUG_FILE
     * an optional log file. Does nothing when FLACDEC_DEBUG is unset.
     */
    static void initFromEnvironment();

    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);

    template<typename... Args>
    static void log(const std::string& channel, Args&&... args) {
        if (!isChannelEnabled(channel)) {
            return;
        }
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        write(channel, nullptr, 0, ss.str());
    }

    // Same as log() with the call site prepended
    template<typename... Args>
    static void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (!isChannelEnabled(channel)) {
            return;
        }
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        write(channel, function, line, ss.str());
    }

private:
    static void write(const std::string& channel, const char* function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static std::atomic<bool> m_any_enabled;
};

#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

// Arguments are only evaluated when the channel is enabled
#define DEBUG_LOG_LAZY(channel, ...) \
    do { \
        if (Debug::isChannelEnabled(channel)) { \
            Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#endif // DEBUG_H
