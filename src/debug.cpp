/*
 * debug.cpp - Channel-based debug logging
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"
#include <ctime>

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;
std::atomic<bool> Debug::m_any_enabled(false);

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty() && !m_logfile.is_open()) {
        m_logfile.open(logfile, std::ios::out | std::ios::app);
    }
    for (const auto& channel : channels) {
        if (!channel.empty()) {
            m_enabled_channels.insert(channel);
        }
    }
    m_any_enabled = !m_enabled_channels.empty();
}

void Debug::initFromEnvironment() {
    const char* list = std::getenv("FLACDEC_DEBUG");
    if (!list || !*list) {
        return;
    }

    std::vector<std::string> channels;
    std::stringstream ss(list);
    std::string channel;
    while (std::getline(ss, channel, ',')) {
        channels.push_back(channel);
    }

    const char* file = std::getenv("FLACDEC_DEBUG_FILE");
    init(file ? file : "", channels);
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile.close();
    }
    m_enabled_channels.clear();
    m_any_enabled = false;
}

bool Debug::isChannelEnabled(const std::string& channel) {
    // No lock while every channel is off
    if (!m_any_enabled) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_enabled_channels.count("all") > 0 || m_enabled_channels.count(channel) > 0;
}

void Debug::write(const std::string& channel, const char* function, int line, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::ostringstream line_text;
    line_text << std::put_time(&bt, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << us.count()
              << " [" << channel << "]";
    if (function) {
        line_text << " " << function << ":" << line;
    }
    line_text << ": " << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open()) {
        m_logfile << line_text.str() << std::endl;
    } else {
        std::cout << line_text.str() << std::endl;
    }
}
