#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

BitstreamReader::BitstreamReader(IO::IOHandler* source, size_t chunk_size)
    : m_source(source)
    , m_crc(nullptr)
    , m_chunk_size(chunk_size > 0 ? chunk_size : 4096)
    , m_buffer_base(0)
    , m_byte_position(0)
    , m_bit_position(0)
    , m_mark(0)
    , m_last_error(FLACError::NONE)
{
}

BitstreamReader::~BitstreamReader()
{
}

bool BitstreamReader::fail(FLACError error)
{
    m_last_error = error;
    return false;
}

void BitstreamReader::clearError()
{
    m_last_error = FLACError::NONE;
}

bool BitstreamReader::refill()
{
    if (!m_source) {
        return false;
    }

    // Drop everything before the mark
    size_t drop = std::min(m_mark, m_byte_position);
    if (drop > 0) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + drop);
        m_buffer_base += drop;
        m_byte_position -= drop;
        m_mark -= drop;
    }

    size_t old_size = m_buffer.size();
    m_buffer.resize(old_size + m_chunk_size);
    size_t got = m_source->read(m_buffer.data() + old_size, 1, m_chunk_size);
    m_buffer.resize(old_size + got);

    if (got == 0 && m_source->getLastError() != 0) {
        Debug::log("flac_codec", "[BitstreamReader::refill] Source read failed, error ",
                   m_source->getLastError());
    }

    return got > 0;
}

bool BitstreamReader::ensureBytes(size_t byte_count)
{
    while (m_buffer.size() - m_byte_position < byte_count) {
        if (!refill()) {
            return false;
        }
    }
    return true;
}

void BitstreamReader::finishByte()
{
    if (m_crc) {
        m_crc->update(m_buffer[m_byte_position]);
    }
    m_byte_position++;
    m_bit_position = 0;
}

void BitstreamReader::consumeBits(uint64_t& value, uint32_t bit_count)
{
    // Caller has made sure every touched byte is buffered
    while (bit_count > 0) {
        uint32_t avail = 8 - m_bit_position;
        uint32_t take = std::min(avail, bit_count);
        uint32_t byte = m_buffer[m_byte_position];
        uint32_t bits = (byte >> (avail - take)) & ((1u << take) - 1);

        value = (value << take) | bits;
        m_bit_position += take;
        bit_count -= take;

        if (m_bit_position == 8) {
            finishByte();
        }
    }
}

bool BitstreamReader::readBits64(uint64_t& value, uint32_t bit_count)
{
    if (bit_count == 0) {
        value = 0;
        return true;
    }

    if (bit_count > 64) {
        return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD);
    }

    size_t needed = (m_bit_position + bit_count + 7) / 8;
    if (!ensureBytes(needed)) {
        return fail(FLACError::UNEXPECTED_END);
    }

    uint64_t result = 0;
    consumeBits(result, bit_count);
    value = result;
    return true;
}

bool BitstreamReader::readBits(uint32_t& value, uint32_t bit_count)
{
    if (bit_count > 32) {
        return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD);
    }

    uint64_t wide;
    if (!readBits64(wide, bit_count)) {
        return false;
    }

    value = static_cast<uint32_t>(wide);
    return true;
}

bool BitstreamReader::readBitsSigned64(int64_t& value, uint32_t bit_count)
{
    uint64_t raw;
    if (!readBits64(raw, bit_count)) {
        return false;
    }

    // Sign extend from bit_count bits
    if (bit_count > 0 && bit_count < 64 && (raw & (1ULL << (bit_count - 1)))) {
        raw |= ~((1ULL << bit_count) - 1);
    }

    value = static_cast<int64_t>(raw);
    return true;
}

bool BitstreamReader::readBitsSigned(int32_t& value, uint32_t bit_count)
{
    if (bit_count > 32) {
        return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD);
    }

    int64_t wide;
    if (!readBitsSigned64(wide, bit_count)) {
        return false;
    }

    value = static_cast<int32_t>(wide);
    return true;
}

bool BitstreamReader::readBit(bool& value)
{
    uint32_t bit;
    if (!readBits(bit, 1)) {
        return false;
    }
    value = (bit != 0);
    return true;
}

bool BitstreamReader::readUnary(uint32_t& value, uint32_t max_zeros)
{
    uint64_t zeros = 0;

    while (true) {
        if (!ensureBytes(1)) {
            return fail(FLACError::UNEXPECTED_END);
        }

        uint32_t avail = 8 - m_bit_position;
        uint32_t remaining = (static_cast<uint32_t>(m_buffer[m_byte_position]) << m_bit_position) & 0xFF;

        if (remaining == 0) {
            zeros += avail;
            finishByte();
            if (zeros > max_zeros) {
                return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD);
            }
            continue;
        }

        uint32_t leading = 0;
        while ((remaining & 0x80) == 0) {
            remaining <<= 1;
            leading++;
        }

        zeros += leading;
        m_bit_position += leading + 1;
        if (m_bit_position == 8) {
            finishByte();
        }

        if (zeros > max_zeros) {
            return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD);
        }

        value = static_cast<uint32_t>(zeros);
        return true;
    }
}

bool BitstreamReader::readBytes(uint8_t* data, size_t count)
{
    if (count == 0) {
        return true;
    }

    size_t needed = count + (m_bit_position > 0 ? 1 : 0);
    if (!ensureBytes(needed)) {
        return fail(FLACError::UNEXPECTED_END);
    }

    for (size_t i = 0; i < count; i++) {
        uint64_t byte = 0;
        consumeBits(byte, 8);
        data[i] = static_cast<uint8_t>(byte);
    }
    return true;
}

bool BitstreamReader::skipBytes(uint64_t count)
{
    if (!isAligned()) {
        uint32_t padding;
        if (!alignToByte(&padding)) {
            return false;
        }
    }

    while (count > 0) {
        if (m_byte_position == m_buffer.size()) {
            // Nothing to rewind to inside skipped data
            m_mark = m_byte_position;
            if (!refill()) {
                return fail(FLACError::UNEXPECTED_END);
            }
            continue;
        }

        size_t chunk = static_cast<size_t>(std::min<uint64_t>(count, m_buffer.size() - m_byte_position));
        for (size_t i = 0; i < chunk; i++) {
            finishByte();
        }
        count -= chunk;
    }
    return true;
}

bool BitstreamReader::alignToByte(uint32_t* padding)
{
    uint32_t bits_to_skip = (8 - m_bit_position) % 8;
    uint32_t value = 0;

    if (bits_to_skip > 0 && !readBits(value, bits_to_skip)) {
        return false;
    }

    if (padding) {
        *padding = value;
    }
    return true;
}

bool BitstreamReader::atEnd()
{
    return isAligned() && !ensureBytes(1);
}

uint64_t BitstreamReader::getBitPosition() const
{
    return (m_buffer_base + m_byte_position) * 8 + m_bit_position;
}

void BitstreamReader::setMark()
{
    m_mark = m_byte_position;
}

bool BitstreamReader::rewindToMark(size_t offset)
{
    while (m_buffer.size() < m_mark + offset) {
        if (!refill()) {
            return fail(FLACError::UNEXPECTED_END);
        }
    }

    m_byte_position = m_mark + offset;
    m_bit_position = 0;
    return true;
}

} // namespace FLAC
} // namespace FlacDec
