#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

/**
 * FrameParser Implementation
 *
 * This file implements FLAC frame parsing per RFC 9639 Section 9.
 *
 * FORBIDDEN AND RESERVED PATTERNS:
 * The following bit patterns are rejected here:
 *
 * 1. Reserved bit after the sync code, reserved bit after the bit depth
 *    - RESERVED_BIT_SET
 *
 * 2. Block size bits = 0b0000, uncommon block size = 65536
 *    - INVALID_FRAME_HEADER
 *
 * 3. Sample rate bits = 0b1111
 *    - INVALID_FRAME_HEADER
 *
 * 4. Channel assignment 0b1011-0b1111, bit depth bits = 0b011
 *    - INVALID_FRAME_HEADER
 *
 * 5. Malformed or overlong coded number
 *    - INVALID_FRAME_HEADER
 *
 * All of them result in immediate frame rejection.
 */

namespace {

const uint32_t block_size_table[16] = {
    0,     // 0000: reserved
    192,   // 0001: 192
    576,   // 0010: 576
    1152,  // 0011: 1152
    2304,  // 0100: 2304
    4608,  // 0101: 4608
    0,     // 0110: 8-bit follows
    0,     // 0111: 16-bit follows
    256,   // 1000: 256
    512,   // 1001: 512
    1024,  // 1010: 1024
    2048,  // 1011: 2048
    4096,  // 1100: 4096
    8192,  // 1101: 8192
    16384, // 1110: 16384
    32768  // 1111: 32768
};

const uint32_t sample_rate_table[12] = {
    0,      // 0000: get from STREAMINFO
    88200,  // 0001: 88.2 kHz
    176400, // 0010: 176.4 kHz
    192000, // 0011: 192 kHz
    8000,   // 0100: 8 kHz
    16000,  // 0101: 16 kHz
    22050,  // 0110: 22.05 kHz
    24000,  // 0111: 24 kHz
    32000,  // 1000: 32 kHz
    44100,  // 1001: 44.1 kHz
    48000,  // 1010: 48 kHz
    96000   // 1011: 96 kHz
};

const uint32_t bit_depth_table[8] = {
    0,  // 000: get from STREAMINFO
    8,  // 001: 8 bits
    12, // 010: 12 bits
    0,  // 011: reserved
    16, // 100: 16 bits
    20, // 101: 20 bits
    24, // 110: 24 bits
    32  // 111: 32 bits
};

} // anonymous namespace

const char* getChannelAssignmentName(ChannelAssignment assignment)
{
    switch (assignment) {
        case ChannelAssignment::INDEPENDENT: return "independent";
        case ChannelAssignment::LEFT_SIDE: return "left-side";
        case ChannelAssignment::RIGHT_SIDE: return "right-side";
        case ChannelAssignment::MID_SIDE: return "mid-side";
        default: return "reserved";
    }
}

FrameParser::FrameParser(BitstreamReader* reader, CRCValidator* crc)
    : m_reader(reader)
    , m_crc(crc)
    , m_last_error(FLACError::NONE)
{
}

FrameParser::~FrameParser()
{
}

bool FrameParser::fail(FLACError error, const char* message)
{
    m_last_error = error;
    Debug::log("flac_frame", "[FrameParser] ", message, " (", getErrorName(error), ")");
    return false;
}

bool FrameParser::readerFailed(const char* what)
{
    m_last_error = m_reader->getLastError();
    Debug::log("flac_frame", "[FrameParser] Failed to read ", what, " (", getErrorName(m_last_error), ")");
    return false;
}

bool FrameParser::parseFrameHeader(FrameHeader& header)
{
    if (!m_reader->isAligned()) {
        return fail(FLACError::SYNC_LOST, "Frame does not start on a byte boundary");
    }

    header = FrameHeader();
    header.frame_offset = m_reader->getBytePosition();

    // Both checksums start at the sync code
    m_crc->resetCRC8();
    m_crc->resetCRC16();

    // 14-bit sync pattern
    uint32_t sync = 0;
    if (!m_reader->readBits(sync, 14)) {
        return readerFailed("frame sync");
    }
    if (sync != SYNC_CODE) {
        Debug::log("flac_frame", "[FrameParser] Invalid frame sync 0x", std::hex, sync, std::dec,
                   " at byte ", header.frame_offset);
        m_last_error = FLACError::SYNC_LOST;
        return false;
    }

    // Reserved bit, must be 0
    uint32_t reserved = 0;
    if (!m_reader->readBits(reserved, 1)) {
        return readerFailed("reserved bit");
    }
    if (reserved != 0) {
        return fail(FLACError::RESERVED_BIT_SET, "Reserved bit after sync code is set");
    }

    // Blocking strategy: 0 = fixed, 1 = variable
    uint32_t blocking_strategy = 0;
    if (!m_reader->readBits(blocking_strategy, 1)) {
        return readerFailed("blocking strategy");
    }
    header.is_variable_block_size = (blocking_strategy == 1);

    uint32_t block_size_bits = 0;
    uint32_t sample_rate_bits = 0;
    uint32_t channel_bits = 0;
    uint32_t bit_depth_bits = 0;
    if (!m_reader->readBits(block_size_bits, 4)) {
        return readerFailed("block size bits");
    }
    if (!m_reader->readBits(sample_rate_bits, 4)) {
        return readerFailed("sample rate bits");
    }
    if (!m_reader->readBits(channel_bits, 4)) {
        return readerFailed("channel assignment");
    }
    if (!m_reader->readBits(bit_depth_bits, 3)) {
        return readerFailed("bit depth bits");
    }
    if (!m_reader->readBits(reserved, 1)) {
        return readerFailed("reserved bit");
    }

    if (block_size_bits == 0) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Reserved block size bits 0b0000");
    }
    if (sample_rate_bits == 0b1111) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Forbidden sample rate bits 0b1111");
    }

    // Decode channel assignment
    if (channel_bits <= 7) {
        header.channels = channel_bits + 1;
        header.channel_assignment = ChannelAssignment::INDEPENDENT;
    } else if (channel_bits == 8) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::LEFT_SIDE;
    } else if (channel_bits == 9) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::RIGHT_SIDE;
    } else if (channel_bits == 10) {
        header.channels = 2;
        header.channel_assignment = ChannelAssignment::MID_SIDE;
    } else {
        return fail(FLACError::INVALID_FRAME_HEADER, "Reserved channel assignment");
    }

    if (bit_depth_bits == 0b011) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Reserved bit depth bits 0b011");
    }
    header.bit_depth = bit_depth_table[bit_depth_bits];

    if (reserved != 0) {
        return fail(FLACError::RESERVED_BIT_SET, "Reserved bit after bit depth is set");
    }

    // Frame or sample number
    if (!parseCodedNumber(header)) {
        return false;
    }

    // Uncommon block size follows the coded number
    if (block_size_bits == 0b0110) {
        if (!parseUncommonBlockSize(header, 8)) {
            return false;
        }
    } else if (block_size_bits == 0b0111) {
        if (!parseUncommonBlockSize(header, 16)) {
            return false;
        }
    } else {
        header.block_size = block_size_table[block_size_bits];
    }

    // Uncommon sample rate follows the block size
    if (sample_rate_bits >= 0b1100) {
        if (!parseUncommonSampleRate(header, sample_rate_bits)) {
            return false;
        }
    } else {
        header.sample_rate = sample_rate_table[sample_rate_bits];
    }

    // Every header byte has been fed to the accumulator at this point
    uint8_t computed_crc8 = m_crc->getCRC8();

    uint32_t crc8 = 0;
    if (!m_reader->readBits(crc8, 8)) {
        return readerFailed("header CRC-8");
    }
    header.crc8 = static_cast<uint8_t>(crc8);

    if (computed_crc8 != header.crc8) {
        Debug::log("flac_frame", "[FrameParser] Header CRC-8 mismatch at byte ", header.frame_offset,
                   ": computed=0x", std::hex, static_cast<int>(computed_crc8),
                   ", stored=0x", static_cast<int>(header.crc8), std::dec);
        m_last_error = FLACError::CHECKSUM_MISMATCH;
        return false;
    }

    DEBUG_LOG_LAZY("flac_frame", "Frame at byte ", header.frame_offset,
                   ": block_size=", header.block_size, ", sample_rate=", header.sample_rate,
                   ", channels=", header.channels, " (", getChannelAssignmentName(header.channel_assignment),
                   "), bit_depth=", header.bit_depth, ", ", header.is_variable_block_size ? "sample" : "frame",
                   " number=", header.coded_number);

    m_last_error = FLACError::NONE;
    return true;
}

/**
 * Parse UTF-8 coded number (frame or sample number)
 * Per RFC 9639 Section 9.1.5: UTF-8-like encoding extended to 7 bytes
 *
 * 1 byte:  0xxxxxxx                           (7 bits)
 * 2 bytes: 110xxxxx 10xxxxxx                  (11 bits)
 * 3 bytes: 1110xxxx 10xxxxxx 10xxxxxx         (16 bits)
 * 4 bytes: 11110xxx 10xxxxxx x2               (21 bits)
 * 5 bytes: 111110xx 10xxxxxx x3               (26 bits)
 * 6 bytes: 1111110x 10xxxxxx x4               (31 bits)
 * 7 bytes: 11111110 10xxxxxx x5               (36 bits, variable blocking only)
 */
bool FrameParser::parseCodedNumber(FrameHeader& header)
{
    uint32_t first = 0;
    if (!m_reader->readBits(first, 8)) {
        return readerFailed("coded number");
    }

    // Length is the count of leading one bits
    uint32_t length = 0;
    while (length < 8 && (first & (0x80u >> length))) {
        length++;
    }

    if (length == 0) {
        header.coded_number = first;
        return true;
    }

    uint32_t max_length = header.is_variable_block_size ? 7 : 6;
    if (length == 1 || length > max_length) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Invalid coded number lead byte");
    }

    uint64_t value = first & (0x7Fu >> length);
    for (uint32_t i = 1; i < length; i++) {
        uint32_t byte = 0;
        if (!m_reader->readBits(byte, 8)) {
            return readerFailed("coded number continuation");
        }
        if ((byte & 0xC0) != 0x80) {
            return fail(FLACError::INVALID_FRAME_HEADER, "Invalid coded number continuation byte");
        }
        value = (value << 6) | (byte & 0x3F);
    }

    header.coded_number = value;
    return true;
}

bool FrameParser::parseUncommonBlockSize(FrameHeader& header, uint32_t bits)
{
    uint32_t value = 0;
    if (!m_reader->readBits(value, bits)) {
        return readerFailed("uncommon block size");
    }

    // Stored as block size - 1; 65536 is forbidden
    if (value == 0xFFFF) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Forbidden block size 65536");
    }

    header.block_size = value + 1;
    return true;
}

bool FrameParser::parseUncommonSampleRate(FrameHeader& header, uint32_t code)
{
    uint32_t value = 0;

    switch (code) {
        case 0b1100:
            // 8-bit, kHz
            if (!m_reader->readBits(value, 8)) {
                return readerFailed("uncommon sample rate");
            }
            header.sample_rate = value * 1000;
            break;
        case 0b1101:
            // 16-bit, Hz
            if (!m_reader->readBits(value, 16)) {
                return readerFailed("uncommon sample rate");
            }
            header.sample_rate = value;
            break;
        case 0b1110:
            // 16-bit, tens of Hz
            if (!m_reader->readBits(value, 16)) {
                return readerFailed("uncommon sample rate");
            }
            header.sample_rate = value * 10;
            break;
        default:
            return fail(FLACError::INVALID_FRAME_HEADER, "Invalid sample rate code");
    }

    if (header.sample_rate == 0) {
        return fail(FLACError::INVALID_FRAME_HEADER, "Explicit sample rate of 0 Hz");
    }
    return true;
}

bool FrameParser::parseFrameFooter(FrameFooter& footer)
{
    uint32_t padding = 0;
    if (!m_reader->alignToByte(&padding)) {
        return readerFailed("frame padding");
    }
    footer.padding = padding;
    if (padding != 0) {
        // RFC 9639 requires zero padding; the CRC-16 still covers it
        Debug::log("flac_frame", "[FrameParser] Non-zero frame padding bits: 0x", std::hex, padding, std::dec);
    }

    footer.computed_crc16 = m_crc->getCRC16();

    uint32_t crc16 = 0;
    if (!m_reader->readBits(crc16, 16)) {
        return readerFailed("frame CRC-16");
    }
    footer.crc16 = static_cast<uint16_t>(crc16);
    return true;
}

bool FrameParser::validateFrame(const FrameFooter& footer)
{
    if (footer.crc16 != footer.computed_crc16) {
        Debug::log("flac_frame", "[FrameParser] Frame CRC-16 mismatch: computed=0x", std::hex,
                   footer.computed_crc16, ", stored=0x", footer.crc16, std::dec);
        m_last_error = FLACError::CHECKSUM_MISMATCH;
        return false;
    }
    return true;
}

bool FrameParser::resync(FrameHeader& header, uint32_t max_bytes)
{
    uint64_t start = m_reader->getMarkPosition();

    for (uint32_t attempt = 1; attempt <= max_bytes; attempt++) {
        // Advance one byte past the previous candidate
        if (!m_reader->rewindToMark(1)) {
            Debug::log("flac_frame", "[FrameParser] Source exhausted during resync after ",
                       attempt - 1, " bytes");
            return fail(FLACError::DESYNC_RECOVERY_FAILED, "No frame found before end of stream");
        }
        m_reader->setMark();
        m_reader->clearError();

        if (parseFrameHeader(header)) {
            Debug::log("flac_frame", "[FrameParser] Resynchronized at byte ", header.frame_offset,
                       " after skipping ", header.frame_offset - start, " bytes");
            return true;
        }
    }

    return fail(FLACError::DESYNC_RECOVERY_FAILED, "Resync window exhausted");
}

} // namespace FLAC
} // namespace FlacDec
