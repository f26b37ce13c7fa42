/*
 * FrameAssembler.h - Turns one FLAC frame into a decoded block
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FRAMEASSEMBLER_H
#define FRAMEASSEMBLER_H

#include <cstdint>
#include <vector>

#include "codecs/flac/FLACError.h"
#include "codecs/flac/FLACTypes.h"

namespace FlacDec {
namespace FLAC {

class FrameParser;
class SubframeDecoder;
class ChannelDecorrelator;
struct FrameHeader;

/**
 * FrameAssembler - Drives one frame from header to decoded block
 *
 * Order of work for a frame:
 *   header (already parsed) -> consistency checks against STREAMINFO
 *   -> one subframe per channel into the scratch buffers
 *   -> stereo decorrelation -> footer and CRC-16 -> DecodedBlock
 *
 * The per-channel scratch buffers are allocated once at construction,
 * sized to the STREAMINFO maximum block size, and reused for every frame.
 */
class FrameAssembler {
public:
    FrameAssembler(FrameParser* frame_parser, SubframeDecoder* subframes,
                   ChannelDecorrelator* decorrelator, const StreamParameters& params,
                   const DecoderConfig& config);
    ~FrameAssembler();

    FrameAssembler(const FrameAssembler&) = delete;
    FrameAssembler& operator=(const FrameAssembler&) = delete;

    /**
     * Decode the body of the frame whose header was just parsed.
     * On success block holds a fresh copy of the frame's samples.
     */
    bool assembleFrame(const FrameHeader& header, DecodedBlock& block);

    /**
     * Reject a header that contradicts STREAMINFO or the stream so far
     */
    bool validateHeader(const FrameHeader& header);

    FLACError getLastError() const { return m_last_error; }

    // Samples emitted so far, counted from the first frame
    uint64_t getSamplesAssembled() const { return m_samples_assembled; }

private:
    FrameParser* m_frame_parser;
    SubframeDecoder* m_subframes;
    ChannelDecorrelator* m_decorrelator;
    const StreamParameters& m_params;
    const DecoderConfig& m_config;

    std::vector<std::vector<int64_t>> m_scratch;
    std::vector<int64_t*> m_channel_ptrs;

    bool m_strategy_known;
    bool m_variable_block_size;
    uint64_t m_samples_assembled;
    uint32_t m_fixed_block_size;     ///< Frame spacing of a fixed-blocking stream, 0 until known
    FLACError m_last_error;

    bool fail(FLACError error, const char* message);
    uint64_t firstSampleOf(const FrameHeader& header) const;
};

} // namespace FLAC
} // namespace FlacDec

#endif // FRAMEASSEMBLER_H
