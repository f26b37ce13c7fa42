/*
 * MemoryIOHandler.cpp - Memory-backed I/O handler
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"

namespace FlacDec {
namespace IO {

MemoryIOHandler::MemoryIOHandler(const void* data, size_t size, bool copy)
    : m_data(nullptr), m_size(0), m_pos(0) {
    if (!data || size == 0) {
        return;
    }
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    if (copy) {
        m_buffer.assign(bytes, bytes + size);
        m_data = m_buffer.data();
    } else {
        m_data = bytes;
    }
    m_size = size;
    Debug::log("io", "MemoryIOHandler: ", size, copy ? " bytes copied" : " bytes borrowed");
}

MemoryIOHandler::~MemoryIOHandler() {
}

size_t MemoryIOHandler::read(void* buffer, size_t size, size_t count) {
    if (!buffer) {
        updateErrorState(EINVAL);
        return 0;
    }

    updateErrorState(0);
    if (size == 0 || count == 0) {
        return 0;
    }
    if (count > std::numeric_limits<size_t>::max() / size) {
        updateErrorState(EOVERFLOW);
        return 0;
    }

    // fread semantics: only whole elements are transferred
    size_t available = m_size - m_pos;
    size_t elements = std::min(size * count, available) / size;
    size_t to_read = elements * size;

    if (to_read > 0) {
        std::memcpy(buffer, m_data + m_pos, to_read);
        m_pos += to_read;
    }
    return elements;
}

bool MemoryIOHandler::eof() {
    return m_pos >= m_size;
}

off_t MemoryIOHandler::tell() {
    return static_cast<off_t>(m_pos);
}

} // namespace IO
} // namespace FlacDec
