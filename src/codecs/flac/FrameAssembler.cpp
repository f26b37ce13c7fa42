/*
 * FrameAssembler.cpp - Turns one FLAC frame into a decoded block
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

FrameAssembler::FrameAssembler(FrameParser* frame_parser, SubframeDecoder* subframes,
                               ChannelDecorrelator* decorrelator, const StreamParameters& params,
                               const DecoderConfig& config)
    : m_frame_parser(frame_parser)
    , m_subframes(subframes)
    , m_decorrelator(decorrelator)
    , m_params(params)
    , m_config(config)
    , m_strategy_known(false)
    , m_variable_block_size(false)
    , m_samples_assembled(0)
    , m_fixed_block_size(params.min_block_size == params.max_block_size ? params.max_block_size : 0)
    , m_last_error(FLACError::NONE)
{
    m_scratch.resize(params.channels);
    m_channel_ptrs.resize(params.channels);
    for (uint32_t ch = 0; ch < params.channels; ch++) {
        m_scratch[ch].resize(params.max_block_size);
        m_channel_ptrs[ch] = m_scratch[ch].data();
    }

    Debug::log("flac_codec", "[FrameAssembler] Scratch buffers: ", params.channels, " x ",
               params.max_block_size, " samples");
}

FrameAssembler::~FrameAssembler()
{
}

bool FrameAssembler::fail(FLACError error, const char* message)
{
    m_last_error = error;
    Debug::log("flac_codec", "[FrameAssembler] ", message, " (", getErrorName(error), ")");
    return false;
}

bool FrameAssembler::validateHeader(const FrameHeader& header)
{
    if (header.block_size > m_params.max_block_size) {
        Debug::log("flac_codec", "[FrameAssembler] Block size ", header.block_size,
                   " exceeds STREAMINFO maximum ", m_params.max_block_size);
        return fail(FLACError::INCONSISTENT_FRAME_PARAMETERS, "Block larger than declared maximum");
    }

    if (header.channels != m_params.channels) {
        Debug::log("flac_codec", "[FrameAssembler] Frame has ", header.channels,
                   " channels, STREAMINFO declares ", m_params.channels);
        return fail(FLACError::INCONSISTENT_FRAME_PARAMETERS, "Channel count differs from STREAMINFO");
    }

    if (header.bit_depth != 0 && header.bit_depth != m_params.bits_per_sample) {
        Debug::log("flac_codec", "[FrameAssembler] Frame has ", header.bit_depth,
                   "-bit samples, STREAMINFO declares ", m_params.bits_per_sample);
        return fail(FLACError::INCONSISTENT_FRAME_PARAMETERS, "Bit depth differs from STREAMINFO");
    }

    if (m_strategy_known && header.is_variable_block_size != m_variable_block_size) {
        return fail(FLACError::INCONSISTENT_FRAME_PARAMETERS, "Blocking strategy changed mid-stream");
    }

    if (m_params.hasTotalSamples() &&
        m_samples_assembled + header.block_size > m_params.total_samples) {
        Debug::log("flac_codec", "[FrameAssembler] Frame would bring the stream to ",
                   m_samples_assembled + header.block_size, " samples, STREAMINFO declares ",
                   m_params.total_samples);
        return fail(FLACError::INCONSISTENT_FRAME_PARAMETERS, "More samples than declared");
    }

    if (header.sample_rate != 0 && header.sample_rate != m_params.sample_rate) {
        Debug::log("flac_codec", "[FrameAssembler] Frame sample rate ", header.sample_rate,
                   " Hz differs from STREAMINFO ", m_params.sample_rate, " Hz");
    }

    return true;
}

uint64_t FrameAssembler::firstSampleOf(const FrameHeader& header) const
{
    if (header.is_variable_block_size) {
        return header.coded_number;
    }
    // Fixed blocking: every frame but the last holds the same number of
    // samples. STREAMINFO gives that size when min == max; otherwise the
    // first frame decoded sets it.
    uint64_t spacing = m_fixed_block_size != 0 ? m_fixed_block_size : header.block_size;
    return header.coded_number * spacing;
}

bool FrameAssembler::assembleFrame(const FrameHeader& header, DecodedBlock& block)
{
    if (!validateHeader(header)) {
        return false;
    }

    const uint32_t block_size = header.block_size;
    const uint32_t bit_depth = m_params.bits_per_sample;

    for (uint32_t ch = 0; ch < header.channels; ch++) {
        bool is_side = false;
        switch (header.channel_assignment) {
            case ChannelAssignment::LEFT_SIDE:
            case ChannelAssignment::MID_SIDE:
                is_side = (ch == 1);
                break;
            case ChannelAssignment::RIGHT_SIDE:
                is_side = (ch == 0);
                break;
            default:
                break;
        }

        if (!m_subframes->decodeSubframe(m_channel_ptrs[ch], block_size, bit_depth, is_side)) {
            m_last_error = m_subframes->getLastError();
            Debug::log("flac_codec", "[FrameAssembler] Subframe ", ch, " of frame at byte ",
                       header.frame_offset, " failed (", getErrorName(m_last_error), ")");
            return false;
        }
    }

    if (!m_decorrelator->decorrelate(m_channel_ptrs.data(), block_size, header.channels,
                                     header.channel_assignment, bit_depth)) {
        m_last_error = m_decorrelator->getLastError();
        return false;
    }

    FrameFooter footer;
    if (!m_frame_parser->parseFrameFooter(footer)) {
        m_last_error = m_frame_parser->getLastError();
        return false;
    }

    if (m_config.verify_frame_crc && !m_frame_parser->validateFrame(footer)) {
        m_last_error = m_frame_parser->getLastError();
        return false;
    }

    block.channels = header.channels;
    block.bits_per_sample = bit_depth;
    block.sample_rate = header.sample_rate != 0 ? header.sample_rate : m_params.sample_rate;
    block.first_sample = firstSampleOf(header);
    block.samples.resize(header.channels);
    for (uint32_t ch = 0; ch < header.channels; ch++) {
        block.samples[ch].assign(m_scratch[ch].begin(), m_scratch[ch].begin() + block_size);
    }

    m_strategy_known = true;
    m_variable_block_size = header.is_variable_block_size;
    if (!header.is_variable_block_size && m_fixed_block_size == 0) {
        m_fixed_block_size = block_size;
    }
    m_samples_assembled += block_size;
    m_last_error = FLACError::NONE;
    return true;
}

} // namespace FLAC
} // namespace FlacDec
