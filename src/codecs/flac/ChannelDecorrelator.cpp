// ChannelDecorrelator.cpp - FLAC channel decorrelation implementation
// Part of the flacdec decode engine

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

ChannelDecorrelator::ChannelDecorrelator()
    : m_last_error(FLACError::NONE)
{
}

ChannelDecorrelator::~ChannelDecorrelator() {
}

bool ChannelDecorrelator::validateChannelAssignment(uint32_t channel_count, ChannelAssignment assignment) {
    switch (assignment) {
        case ChannelAssignment::INDEPENDENT:
            return channel_count >= 1 && channel_count <= 8;
        case ChannelAssignment::LEFT_SIDE:
        case ChannelAssignment::RIGHT_SIDE:
        case ChannelAssignment::MID_SIDE:
            return channel_count == 2;
        default:
            return false;
    }
}

bool ChannelDecorrelator::decorrelate(int64_t** channels, uint32_t block_size,
                                      uint32_t channel_count, ChannelAssignment assignment,
                                      uint32_t bit_depth) {
    if (!channels || block_size == 0) {
        Debug::log("flac_codec", "ChannelDecorrelator: no channel data");
        m_last_error = FLACError::INCONSISTENT_FRAME_PARAMETERS;
        return false;
    }

    if (!validateChannelAssignment(channel_count, assignment)) {
        Debug::log("flac_codec", "ChannelDecorrelator: ", getChannelAssignmentName(assignment),
                   " not valid for ", channel_count, " channels");
        m_last_error = FLACError::INVALID_FRAME_HEADER;
        return false;
    }

    switch (assignment) {
        case ChannelAssignment::INDEPENDENT:
            break;

        case ChannelAssignment::LEFT_SIDE:
            decorrelateLeftSide(channels[0], channels[1], block_size);
            break;

        case ChannelAssignment::RIGHT_SIDE:
            decorrelateRightSide(channels[0], channels[1], block_size);
            break;

        case ChannelAssignment::MID_SIDE:
            decorrelateMidSide(channels[0], channels[1], block_size);
            break;
    }

    return checkRange(channels, block_size, channel_count, bit_depth);
}

void ChannelDecorrelator::decorrelateLeftSide(int64_t* left, int64_t* side, uint32_t count) {
    for (uint32_t i = 0; i < count; ++i) {
        side[i] = left[i] - side[i];
    }
}

void ChannelDecorrelator::decorrelateRightSide(int64_t* side, int64_t* right, uint32_t count) {
    for (uint32_t i = 0; i < count; ++i) {
        side[i] = right[i] + side[i];
    }
}

void ChannelDecorrelator::decorrelateMidSide(int64_t* mid, int64_t* side, uint32_t count) {
    // The low bit lost when mid was halved is the low bit of side
    for (uint32_t i = 0; i < count; ++i) {
        int64_t side_sample = side[i];
        int64_t combined = mid[i] * 2 + (side_sample & 1);
        mid[i] = (combined + side_sample) >> 1;
        side[i] = (combined - side_sample) >> 1;
    }
}

bool ChannelDecorrelator::checkRange(int64_t** channels, uint32_t block_size,
                                     uint32_t channel_count, uint32_t bit_depth) {
    for (uint32_t ch = 0; ch < channel_count; ++ch) {
        for (uint32_t i = 0; i < block_size; ++i) {
            if (!SampleReconstructor::fitsBitDepth(channels[ch][i], bit_depth)) {
                Debug::log("flac_codec", "ChannelDecorrelator: channel ", ch, " sample ", i,
                           " = ", channels[ch][i], " exceeds ", bit_depth, " bits");
                m_last_error = FLACError::ARITHMETIC_OVERFLOW_GUARD;
                return false;
            }
        }
    }

    m_last_error = FLACError::NONE;
    return true;
}

} // namespace FLAC
} // namespace FlacDec
