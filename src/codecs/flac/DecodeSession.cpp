/*
 * DecodeSession.cpp - Pull-based FLAC stream decoder
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

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

// ============================================================================
// BlockIterator Implementation
// ============================================================================

BlockIterator::BlockIterator(DecodeSession* session)
    : m_session(session)
{
    advance();
}

BlockIterator& BlockIterator::operator++()
{
    advance();
    return *this;
}

void BlockIterator::advance()
{
    if (!m_session) {
        return;
    }

    FLACError result = m_session->nextBlock(m_block);
    if (result == FLACError::NONE) {
        return;
    }

    m_session = nullptr;
    m_block = DecodedBlock();
    if (result != FLACError::END_OF_STREAM) {
        throw FLACException(result);
    }
}

// ============================================================================
// DecodeSession Implementation
// ============================================================================

DecodeSession::DecodeSession(IO::IOHandler* source, const DecoderConfig& config)
    : m_config(config)
    , m_reader(source, config.read_chunk_size)
    , m_metadata_parser(&m_reader)
    , m_frame_parser(&m_reader, &m_crc)
    , m_residual(&m_reader)
    , m_subframes(&m_reader, &m_residual, &m_reconstructor)
    , m_error(FLACError::NONE)
    , m_finished(false)
    , m_md5_active(false)
    , m_stream_position(0)
    , m_has_pending_header(false)
{
    m_reader.attachCRC(&m_crc);
}

DecodeSession::~DecodeSession()
{
    Debug::log("flac_codec", "[DecodeSession] Closing after ", m_stats.frames_decoded, " frames, ",
               m_stats.samples_decoded, " samples");
}

FLACError DecodeSession::open(IO::IOHandler* source, std::unique_ptr<DecodeSession>& session,
                              const DecoderConfig& config)
{
    session.reset();

    if (!source) {
        Debug::log("flac_codec", "[DecodeSession::open] No byte source");
        return FLACError::SESSION_NOT_OPEN;
    }

    std::unique_ptr<DecodeSession> candidate(new DecodeSession(source, config));
    FLACError result = candidate->initialize();
    if (result != FLACError::NONE) {
        Debug::log("flac_codec", "[DecodeSession::open] Failed: ", getErrorMessage(result));
        return result;
    }

    session = std::move(candidate);
    return FLACError::NONE;
}

FLACError DecodeSession::initialize()
{
    if (!m_metadata_parser.parseHeaders(m_params, m_metadata_blocks, m_config)) {
        return m_metadata_parser.getLastError();
    }

    m_assembler = std::make_unique<FrameAssembler>(&m_frame_parser, &m_subframes, &m_decorrelator,
                                                   m_params, m_config);

    if (m_config.verify_md5 && m_params.hasMD5Signature()) {
        m_md5_active = m_md5.reset();
        if (!m_md5_active) {
            Debug::log("flac_codec", "[DecodeSession] MD5 unavailable, signature will not be checked");
        }
    }

    m_stats.bytes_consumed = m_reader.getBytePosition();

    Debug::log("flac_codec", "[DecodeSession] Opened stream: ", m_params.sample_rate, "Hz, ",
               m_params.channels, " channels, ", m_params.bits_per_sample, " bits, ",
               m_params.total_samples, " samples (", m_params.getDurationMs(), " ms), blocks ",
               m_params.min_block_size, "-",
               m_params.max_block_size, ", ", m_metadata_blocks.size(), " extra metadata blocks");
    return FLACError::NONE;
}

FLACError DecodeSession::latch(FLACError error)
{
    m_error = error;

    switch (error) {
        case FLACError::CHECKSUM_MISMATCH:
            m_stats.crc_errors++;
            break;
        case FLACError::SYNC_LOST:
            m_stats.sync_errors++;
            break;
        default:
            break;
    }

    Debug::log("flac_codec", "[DecodeSession] Stopped at byte ", m_reader.getMarkPosition(), ": ",
               getErrorMessage(error));
    return error;
}

bool DecodeSession::isRecoverable(FLACError error)
{
    switch (error) {
        case FLACError::SYNC_LOST:
        case FLACError::RESERVED_BIT_SET:
        case FLACError::INVALID_FRAME_HEADER:
        case FLACError::INVALID_SUBFRAME:
        case FLACError::INVALID_PARTITION_ORDER:
        case FLACError::CHECKSUM_MISMATCH:
        case FLACError::INCONSISTENT_FRAME_PARAMETERS:
        case FLACError::ARITHMETIC_OVERFLOW_GUARD:
            return true;
        default:
            return false;
    }
}

FLACError DecodeSession::nextBlock(DecodedBlock& block)
{
    if (m_error != FLACError::NONE) {
        return m_error;
    }
    if (m_finished) {
        return FLACError::END_OF_STREAM;
    }

    FrameHeader header;
    if (m_has_pending_header) {
        header = m_pending_header;
        m_has_pending_header = false;
    } else {
        m_reader.setMark();
        if (m_reader.atEnd()) {
            return finishStream();
        }
        if (!m_frame_parser.parseFrameHeader(header)) {
            return latch(m_frame_parser.getLastError());
        }
    }

    if (!m_assembler->assembleFrame(header, block)) {
        return latch(m_assembler->getLastError());
    }

    updateSignature(block);

    m_stream_position = block.first_sample + block.getSampleCount();
    m_stats.frames_decoded++;
    m_stats.samples_decoded += block.getSampleCount();
    m_stats.bytes_consumed = m_reader.getBytePosition();
    return FLACError::NONE;
}

void DecodeSession::updateSignature(const DecodedBlock& block)
{
    if (!m_md5_active) {
        return;
    }

    std::vector<const int64_t*> channels(block.channels);
    for (uint32_t ch = 0; ch < block.channels; ch++) {
        channels[ch] = block.samples[ch].data();
    }

    if (!m_md5.update(channels.data(), static_cast<uint32_t>(block.getSampleCount()),
                      block.channels, block.bits_per_sample)) {
        Debug::log("flac_codec", "[DecodeSession] MD5 update failed, signature will not be checked");
        m_md5_active = false;
    }
}

FLACError DecodeSession::finishStream()
{
    m_finished = true;
    m_stats.bytes_consumed = m_reader.getBytePosition();

    if (m_params.hasTotalSamples() && m_stream_position < m_params.total_samples) {
        Debug::log("flac_codec", "[DecodeSession] Stream ended at sample ", m_stream_position,
                   " of ", m_params.total_samples);
        return latch(FLACError::UNEXPECTED_END);
    }

    if (m_md5_active) {
        m_md5_active = false;
        uint8_t computed[16];
        if (!m_md5.finalize(computed)) {
            Debug::log("flac_codec", "[DecodeSession] MD5 finalization failed, signature not checked");
        } else if (!m_md5.compare(m_params.md5_signature)) {
            return latch(FLACError::SIGNATURE_MISMATCH);
        } else {
            Debug::log("flac_codec", "[DecodeSession] MD5 signature verified");
        }
    }

    Debug::log("flac_codec", "[DecodeSession] End of stream after ", m_stats.frames_decoded,
               " frames");
    return FLACError::END_OF_STREAM;
}

FLACError DecodeSession::resynchronize()
{
    if (m_error == FLACError::NONE) {
        return m_finished ? FLACError::END_OF_STREAM : FLACError::NONE;
    }
    if (!isRecoverable(m_error)) {
        return m_error;
    }

    FrameHeader header;
    if (!m_frame_parser.resync(header, m_config.max_resync_bytes)) {
        return latch(FLACError::DESYNC_RECOVERY_FAILED);
    }

    if (m_md5_active) {
        // Skipped audio makes the whole-stream signature unverifiable
        Debug::log("flac_codec", "[DecodeSession] Resynchronized, MD5 check disabled");
        m_md5_active = false;
    }

    m_pending_header = header;
    m_has_pending_header = true;
    m_error = FLACError::NONE;
    m_stats.resync_count++;
    m_stats.bytes_consumed = m_reader.getBytePosition();
    return FLACError::NONE;
}

} // namespace FLAC
} // namespace FlacDec
