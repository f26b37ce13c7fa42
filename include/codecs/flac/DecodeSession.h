/*
 * DecodeSession.h - Pull-based FLAC stream decoder
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

#ifndef DECODESESSION_H
#define DECODESESSION_H

#include <cstdint>
#include <iterator>
#include <memory>
#include <vector>

#include "codecs/flac/FLACError.h"
#include "codecs/flac/FLACTypes.h"
#include "codecs/flac/CRCValidator.h"
#include "codecs/flac/BitstreamReader.h"
#include "codecs/flac/MetadataParser.h"
#include "codecs/flac/FrameParser.h"
#include "codecs/flac/ResidualDecoder.h"
#include "codecs/flac/SampleReconstructor.h"
#include "codecs/flac/SubframeDecoder.h"
#include "codecs/flac/ChannelDecorrelator.h"
#include "codecs/flac/MD5Validator.h"
#include "codecs/flac/FrameAssembler.h"

namespace FlacDec {
namespace IO {
class IOHandler;
}

namespace FLAC {

class DecodeSession;

/**
 * @brief Forward iterator over the blocks of a session
 *
 * Dereferencing yields the most recently decoded block. Advancing pulls
 * the next frame; any error other than end of stream is thrown as
 * FLACException.
 */
class BlockIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = DecodedBlock;
    using difference_type = std::ptrdiff_t;
    using pointer = const DecodedBlock*;
    using reference = const DecodedBlock&;

    BlockIterator() : m_session(nullptr) {}
    explicit BlockIterator(DecodeSession* session);

    reference operator*() const { return m_block; }
    pointer operator->() const { return &m_block; }

    BlockIterator& operator++();

    bool operator==(const BlockIterator& other) const { return m_session == other.m_session; }
    bool operator!=(const BlockIterator& other) const { return m_session != other.m_session; }

private:
    DecodeSession* m_session;   // nullptr once the sequence has ended
    DecodedBlock m_block;

    void advance();
};

/**
 * @brief Range adaptor so a session can drive a range-based for loop
 */
class BlockRange {
public:
    explicit BlockRange(DecodeSession* session) : m_session(session) {}

    BlockIterator begin() { return BlockIterator(m_session); }
    BlockIterator end() { return BlockIterator(); }

private:
    DecodeSession* m_session;
};

/**
 * @brief Decodes a complete FLAC stream from an IOHandler, one frame per call
 *
 * open() consumes the stream marker and every metadata block. Each
 * nextBlock() then decodes exactly one frame:
 *
 *   NONE                 block holds the frame
 *   END_OF_STREAM        source exhausted at a frame boundary
 *   anything else        the stream is broken at this point
 *
 * The first error is latched: later calls return it again without reading.
 * For errors inside a frame, resynchronize() scans forward for the next
 * valid frame header and clears the latch. Truncation mid-frame cannot be
 * recovered from.
 *
 * The session does not own the IOHandler. Not thread-safe.
 */
class DecodeSession {
public:
    static FLACError open(IO::IOHandler* source, std::unique_ptr<DecodeSession>& session,
                          const DecoderConfig& config = DecoderConfig());

    ~DecodeSession();

    DecodeSession(const DecodeSession&) = delete;
    DecodeSession& operator=(const DecodeSession&) = delete;

    const StreamParameters& getStreamParameters() const { return m_params; }
    const std::vector<MetadataBlock>& getMetadataBlocks() const { return m_metadata_blocks; }

    /**
     * @brief Decode the next frame into block
     */
    FLACError nextBlock(DecodedBlock& block);

    /**
     * @brief Skip ahead to the next valid frame after a frame error
     *
     * Returns NONE when a frame was found (the next nextBlock() decodes
     * it), DESYNC_RECOVERY_FAILED when the scan gave up, or the latched
     * error if it cannot be recovered from.
     */
    FLACError resynchronize();

    BlockRange blocks() { return BlockRange(this); }

    FLACCodecStats getStats() const { return m_stats; }

    // Latched error, NONE while the session is healthy
    FLACError getLastError() const { return m_error; }

    bool isFinished() const { return m_finished; }

private:
    DecodeSession(IO::IOHandler* source, const DecoderConfig& config);

    FLACError initialize();
    FLACError finishStream();
    FLACError latch(FLACError error);
    void updateSignature(const DecodedBlock& block);

    static bool isRecoverable(FLACError error);

    DecoderConfig m_config;

    // Decode pipeline, in construction order
    CRCValidator m_crc;
    BitstreamReader m_reader;
    MetadataParser m_metadata_parser;
    FrameParser m_frame_parser;
    ResidualDecoder m_residual;
    SampleReconstructor m_reconstructor;
    SubframeDecoder m_subframes;
    ChannelDecorrelator m_decorrelator;
    MD5Validator m_md5;
    std::unique_ptr<FrameAssembler> m_assembler;

    StreamParameters m_params;
    std::vector<MetadataBlock> m_metadata_blocks;
    FLACCodecStats m_stats;

    FLACError m_error;
    bool m_finished;
    bool m_md5_active;
    uint64_t m_stream_position;     // One past the last sample emitted

    FrameHeader m_pending_header;   // Header found by resynchronize()
    bool m_has_pending_header;
};

} // namespace FLAC
} // namespace FlacDec

#endif // DECODESESSION_H
