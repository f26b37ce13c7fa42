#ifndef FRAMEPARSER_H
#define FRAMEPARSER_H

#include <cstdint>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace FLAC {

// Forward declarations
class BitstreamReader;
class CRCValidator;

/**
 * Channel assignment modes for FLAC frames
 * Per RFC 9639 Section 9.1.3
 */
enum class ChannelAssignment {
    INDEPENDENT = 0,    // Independent channels (1-8 channels)
    LEFT_SIDE = 8,      // Left-side stereo (left, side)
    RIGHT_SIDE = 9,     // Right-side stereo (side, right)
    MID_SIDE = 10       // Mid-side stereo (mid, side)
};

const char* getChannelAssignmentName(ChannelAssignment assignment);

/**
 * FLAC frame header structure
 * Per RFC 9639 Section 9.1
 */
struct FrameHeader {
    // Blocking strategy
    bool is_variable_block_size;  // false = fixed, true = variable

    // Block size in samples (1-65535)
    uint32_t block_size;

    // Sample rate in Hz, 0 = take from STREAMINFO
    uint32_t sample_rate;

    // Number of channels (1-8)
    uint32_t channels;

    // Channel assignment mode
    ChannelAssignment channel_assignment;

    // Bits per sample, 0 = take from STREAMINFO
    uint32_t bit_depth;

    // Frame number if fixed, first sample number if variable
    uint64_t coded_number;

    // CRC-8 of frame header
    uint8_t crc8;

    // Byte offset of the sync code in the source
    uint64_t frame_offset;

    FrameHeader()
        : is_variable_block_size(false)
        , block_size(0)
        , sample_rate(0)
        , channels(0)
        , channel_assignment(ChannelAssignment::INDEPENDENT)
        , bit_depth(0)
        , coded_number(0)
        , crc8(0)
        , frame_offset(0)
    {}
};

/**
 * FLAC frame footer structure
 * Per RFC 9639 Section 9.3
 */
struct FrameFooter {
    // CRC-16 stored in the stream
    uint16_t crc16;

    // CRC-16 computed over the frame bytes
    uint16_t computed_crc16;

    // Value of the bits skipped to reach the byte boundary
    uint32_t padding;

    FrameFooter() : crc16(0), computed_crc16(0), padding(0) {}
};

/**
 * FrameParser - Parses FLAC frame headers and footers
 *
 * This class handles:
 * - Frame sync validation (14-bit 0b11111111111110 on a byte boundary)
 * - Frame header parsing with all fields
 * - Header CRC-8 and frame CRC-16 validation
 * - Bounded byte-by-byte resynchronization
 *
 * The header parser does not know STREAMINFO; a zero sample_rate or
 * bit_depth means "as declared in STREAMINFO" and is resolved by the
 * FrameAssembler.
 *
 * Per RFC 9639 Section 9
 */
class FrameParser {
public:
    /**
     * Constructor
     * @param reader BitstreamReader for reading frame data
     * @param crc CRCValidator attached to the reader
     */
    FrameParser(BitstreamReader* reader, CRCValidator* crc);

    ~FrameParser();

    /**
     * Parse frame header starting at the current (byte aligned) position
     * Resets both CRC accumulators before the sync code.
     * @param header Output frame header structure
     * @return true if header parsed and its CRC-8 matched
     */
    bool parseFrameHeader(FrameHeader& header);

    /**
     * Parse frame footer
     * Skips the zero padding to the byte boundary and reads the CRC-16
     * @param footer Output frame footer structure
     * @return true if footer was read
     */
    bool parseFrameFooter(FrameFooter& footer);

    /**
     * Validate complete frame
     * @return true if stored and computed CRC-16 agree
     */
    bool validateFrame(const FrameFooter& footer);

    /**
     * Scan forward from one byte past the reader mark for a header that
     * parses and passes CRC-8. Gives up after max_bytes candidates.
     * On success the mark sits on the new frame.
     */
    bool resync(FrameHeader& header, uint32_t max_bytes);

    FLACError getLastError() const { return m_last_error; }

    // 0b11111111111110
    static constexpr uint32_t SYNC_CODE = 0x3FFE;

private:
    BitstreamReader* m_reader;
    CRCValidator* m_crc;
    FLACError m_last_error;

    // Frame header parsing helpers
    bool parseCodedNumber(FrameHeader& header);
    bool parseUncommonBlockSize(FrameHeader& header, uint32_t bits);
    bool parseUncommonSampleRate(FrameHeader& header, uint32_t code);

    bool fail(FLACError error, const char* message);
    bool readerFailed(const char* what);
};

} // namespace FLAC
} // namespace FlacDec

#endif // FRAMEPARSER_H
