// ChannelDecorrelator.h - FLAC channel decorrelation component
// Part of the flacdec decode engine
// Handles stereo decorrelation (left-side, right-side, mid-side) and multi-channel support

#ifndef CHANNEL_DECORRELATOR_H
#define CHANNEL_DECORRELATOR_H

#include <cstdint>
#include <cstddef>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace FLAC {

// Forward declaration - ChannelAssignment is defined in FrameParser.h
enum class ChannelAssignment;

/**
 * ChannelDecorrelator - Handles FLAC channel decorrelation
 *
 * FLAC uses stereo decorrelation to improve compression by encoding
 * correlated channels. This class reverses the decorrelation to
 * reconstruct independent left and right channels.
 *
 * Decorrelation modes:
 * - INDEPENDENT: No decorrelation, channels are independent
 * - LEFT_SIDE: Right = Left - Side
 * - RIGHT_SIDE: Left = Right + Side
 * - MID_SIDE: Left = ((Mid << 1 | Side & 1) + Side) >> 1,
 *             Right = ((Mid << 1 | Side & 1) - Side) >> 1
 *
 * Buffers are modified in place. After decorrelation every sample must fit
 * the frame bit depth; a sample that does not is reported as
 * ARITHMETIC_OVERFLOW_GUARD.
 *
 * RFC 9639 Section: 9.1.3 (Channel Assignment)
 */
class ChannelDecorrelator {
public:
    ChannelDecorrelator();
    ~ChannelDecorrelator();

    /**
     * Decorrelate channels based on channel assignment mode
     *
     * @param channels Array of channel buffers (modified in-place)
     * @param block_size Number of samples per channel
     * @param channel_count Number of channels (1-8)
     * @param assignment Channel assignment mode
     * @param bit_depth Frame bit depth the output must fit
     * @return true if decorrelation succeeded, false on error
     */
    bool decorrelate(int64_t** channels, uint32_t block_size,
                     uint32_t channel_count, ChannelAssignment assignment,
                     uint32_t bit_depth);

    FLACError getLastError() const { return m_last_error; }

    /**
     * Check if channel assignment is valid for the given channel count
     */
    static bool validateChannelAssignment(uint32_t channel_count, ChannelAssignment assignment);

private:
    FLACError m_last_error;

    // Right = Left - Side, written over the side buffer
    void decorrelateLeftSide(int64_t* left, int64_t* side, uint32_t count);

    // Left = Right + Side, written over the side buffer
    void decorrelateRightSide(int64_t* side, int64_t* right, uint32_t count);

    // Mid buffer becomes left, side buffer becomes right
    void decorrelateMidSide(int64_t* mid, int64_t* side, uint32_t count);

    bool checkRange(int64_t** channels, uint32_t block_size,
                    uint32_t channel_count, uint32_t bit_depth);
};

} // namespace FLAC
} // namespace FlacDec

#endif // CHANNEL_DECORRELATOR_H
