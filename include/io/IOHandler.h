/*
 * IOHandler.h - Abstract I/O handler interface
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef IOHANDLER_H
#define IOHANDLER_H

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace FlacDec {
namespace IO {

/**
 * @brief Base IOHandler interface for sequential byte sources
 *
 * The decoder only ever pulls bytes forward through read(). A short
 * read is the sole signal that the source is exhausted; the decoder
 * turns it into END_OF_STREAM or UNEXPECTED_END depending on where it
 * happens. Adapters for files, sockets or pipes derive from this class.
 */
class IOHandler {
public:
    IOHandler();
    virtual ~IOHandler();

    /**
     * @brief Read data from the source with fread-like semantics
     * @param buffer Buffer to read data into
     * @param size Size of each element to read
     * @param count Number of elements to read
     * @return Number of whole elements read
     */
    virtual size_t read(void* buffer, size_t size, size_t count) = 0;

    /**
     * @brief Check if at end-of-stream condition
     */
    virtual bool eof() = 0;

    /**
     * @brief Bytes consumed so far
     */
    virtual off_t tell() = 0;

    /**
     * @brief Get the last error code
     * @return errno-style error code (0 = no error)
     */
    int getLastError() const;

protected:
    /**
     * @brief Record an errno-style code, logged on the "io" channel
     */
    void updateErrorState(int error_code, const std::string& error_message = "");

private:
    int m_error;
};

} // namespace IO
} // namespace FlacDec

#endif // IOHANDLER_H
