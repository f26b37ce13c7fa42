#ifndef BITSTREAMREADER_H
#define BITSTREAMREADER_H

#include <cstdint>
#include <cstddef>
#include <vector>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace IO {
class IOHandler;
}

namespace FLAC {

class CRCValidator;

/**
 * BitstreamReader - Bit-level reading from a pull-based byte source
 *
 * Provides bit-level access to a FLAC bitstream with support for:
 * - Unsigned and sign-extended fields of 0-64 bits
 * - Unary-coded values with an upper bound
 * - Byte alignment and whole-byte transfers
 * - A frame mark that the resync path can rewind to
 *
 * Uses big-endian bit ordering per RFC 9639. Input is pulled from the
 * IOHandler in chunks. Every byte is handed to the attached CRCValidator
 * the moment its last bit is consumed.
 *
 * A read that cannot be satisfied fails with UNEXPECTED_END and leaves
 * the output untouched.
 */
class BitstreamReader {
public:
    explicit BitstreamReader(IO::IOHandler* source, size_t chunk_size = 4096);
    ~BitstreamReader();

    BitstreamReader(const BitstreamReader&) = delete;
    BitstreamReader& operator=(const BitstreamReader&) = delete;

    void attachCRC(CRCValidator* crc) { m_crc = crc; }

    // Basic bit reading
    bool readBits(uint32_t& value, uint32_t bit_count);
    bool readBits64(uint64_t& value, uint32_t bit_count);
    bool readBitsSigned(int32_t& value, uint32_t bit_count);
    bool readBitsSigned64(int64_t& value, uint32_t bit_count);
    bool readBit(bool& value);

    // Zero bits before the terminating one; fails past max_zeros
    bool readUnary(uint32_t& value, uint32_t max_zeros);

    // Whole-byte access, reader must be aligned
    bool readBytes(uint8_t* data, size_t count);
    bool skipBytes(uint64_t count);

    // Alignment
    bool alignToByte(uint32_t* padding = nullptr);
    bool isAligned() const { return m_bit_position == 0; }

    /**
     * True when aligned and neither the buffer nor the source has more bytes.
     * May pull from the source.
     */
    bool atEnd();

    // Position tracking (absolute, from the start of the source)
    uint64_t getBitPosition() const;
    uint64_t getBytePosition() const { return m_buffer_base + m_byte_position; }

    /**
     * Mark the current byte position. Bytes before the mark may be
     * dropped on the next refill. The reader must be aligned.
     */
    void setMark();
    uint64_t getMarkPosition() const { return m_buffer_base + m_mark; }

    /**
     * Reposition to mark + offset without feeding the CRC.
     * Fails with UNEXPECTED_END if that byte is not available.
     */
    bool rewindToMark(size_t offset);

    FLACError getLastError() const { return m_last_error; }
    void clearError();

private:
    IO::IOHandler* m_source;
    CRCValidator* m_crc;
    size_t m_chunk_size;

    // Input buffer
    std::vector<uint8_t> m_buffer;
    uint64_t m_buffer_base;      // Stream offset of m_buffer[0]
    size_t m_byte_position;      // Current byte position in buffer
    uint32_t m_bit_position;     // Bit position within current byte (0-7)
    size_t m_mark;               // Buffer index the caller may rewind to

    FLACError m_last_error;

    // Internal helpers
    bool ensureBytes(size_t byte_count);
    bool refill();
    void consumeBits(uint64_t& value, uint32_t bit_count);
    void finishByte();
    bool fail(FLACError error);
};

} // namespace FLAC
} // namespace FlacDec

#endif // BITSTREAMREADER_H
