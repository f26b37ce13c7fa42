// CRCValidator.h - CRC-8 and CRC-16 validation for FLAC frames
// Implements RFC 9639 CRC validation with polynomials:
// - CRC-8: 0x07 (x^8 + x^2 + x^1 + x^0), initial value 0
// - CRC-16: 0x8005 (x^16 + x^15 + x^2 + x^0), initial value 0
//
// References:
// - RFC 9639: FLAC specification, sections 9.1.8 and 9.3

#ifndef CRCVALIDATOR_H
#define CRCVALIDATOR_H

#include <array>
#include <cstdint>
#include <cstddef>

namespace FlacDec {
namespace FLAC {

/**
 * CRCValidator provides CRC-8 and CRC-16 checksum computation and validation
 * for FLAC frame integrity checking per RFC 9639.
 *
 * CRC-8 covers the frame header up to (not including) the CRC-8 byte.
 * CRC-16 covers the whole frame up to (not including) the CRC-16 itself.
 *
 * The BitstreamReader feeds every byte it finishes consuming into both
 * accumulators; the FrameParser resets them at each frame sync code.
 */
class CRCValidator {
public:
    CRCValidator();
    ~CRCValidator() = default;

    // Prevent copying (use references instead)
    CRCValidator(const CRCValidator&) = delete;
    CRCValidator& operator=(const CRCValidator&) = delete;

    // ========================================================================
    // One-shot CRC computation
    // ========================================================================

    /**
     * Compute CRC-8 checksum over data buffer.
     *
     * @param data Pointer to data buffer
     * @param length Number of bytes to process
     * @return 8-bit CRC checksum
     */
    static uint8_t computeCRC8(const uint8_t* data, size_t length);

    /**
     * Compute CRC-16 checksum over data buffer.
     *
     * @param data Pointer to data buffer
     * @param length Number of bytes to process
     * @return 16-bit CRC checksum
     */
    static uint16_t computeCRC16(const uint8_t* data, size_t length);

    // ========================================================================
    // Incremental CRC computation (for streaming)
    // ========================================================================

    void resetCRC8();
    void resetCRC16();

    /**
     * Update both accumulators with one byte.
     */
    void update(uint8_t byte) {
        m_crc8 = CRC8_TABLE[m_crc8 ^ byte];
        m_crc16 = static_cast<uint16_t>((m_crc16 << 8) ^ CRC16_TABLE[(m_crc16 >> 8) ^ byte]);
    }

    void updateCRC8(uint8_t byte);
    void updateCRC16(uint8_t byte);
    void updateCRC8(const uint8_t* data, size_t length);
    void updateCRC16(const uint8_t* data, size_t length);

    uint8_t getCRC8() const { return m_crc8; }
    uint16_t getCRC16() const { return m_crc16; }

private:
    static const std::array<uint8_t, 256> CRC8_TABLE;
    static const std::array<uint16_t, 256> CRC16_TABLE;

    // Current CRC accumulators for incremental computation
    uint8_t m_crc8;
    uint16_t m_crc16;
};

} // namespace FLAC
} // namespace FlacDec

#endif // CRCVALIDATOR_H
