/*
 * MemoryIOHandler.h - Memory-backed I/O handler
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef MEMORYIOHANDLER_H
#define MEMORYIOHANDLER_H

#include <cstdint>
#include <vector>

#include "io/IOHandler.h"

namespace FlacDec {
namespace IO {

/**
 * @brief Serves a memory buffer as a byte source
 *
 * The handler either keeps its own copy of the data or reads the
 * caller's buffer in place, in which case the buffer must outlive it.
 */
class MemoryIOHandler : public IOHandler {
public:
    /**
     * @param data Pointer to data
     * @param size Size of data
     * @param copy If true, copies data to an internal buffer
     */
    MemoryIOHandler(const void* data, size_t size, bool copy = true);
    ~MemoryIOHandler() override;

    size_t read(void* buffer, size_t size, size_t count) override;
    bool eof() override;
    off_t tell() override;

    size_t size() const { return m_size; }

private:
    std::vector<uint8_t> m_buffer;
    const uint8_t* m_data;
    size_t m_size;
    size_t m_pos;
};

} // namespace IO
} // namespace FlacDec

#endif // MEMORYIOHANDLER_H
