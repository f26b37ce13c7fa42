/*
 * IOHandler.cpp - Abstract I/O handler base implementation
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"

namespace FlacDec {
namespace IO {

IOHandler::IOHandler() : m_error(0) {
}

IOHandler::~IOHandler() {
}

int IOHandler::getLastError() const {
    return m_error;
}

void IOHandler::updateErrorState(int error_code, const std::string& error_message) {
    m_error = error_code;
    if (error_code != 0) {
        Debug::log("io", "IOHandler error ", error_code, ": ",
                   error_message.empty() ? std::strerror(error_code) : error_message.c_str());
    }
}

} // namespace IO
} // namespace FlacDec
