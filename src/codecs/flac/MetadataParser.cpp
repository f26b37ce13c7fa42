/*
 * MetadataParser.cpp - FLAC stream marker, STREAMINFO and metadata block walker
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

MetadataParser::MetadataParser(BitstreamReader* reader)
    : m_reader(reader)
    , m_last_error(FLACError::NONE)
{
}

bool MetadataParser::fail(FLACError error, const char* message) {
    m_last_error = error;
    Debug::log("flac_codec", "[MetadataParser] ", message, " (", getErrorName(error), ")");
    return false;
}

bool MetadataParser::readerFailed() {
    m_last_error = m_reader->getLastError();
    Debug::log("flac_codec", "[MetadataParser] Read failed: ", getErrorName(m_last_error));
    return false;
}

bool MetadataParser::parseHeaders(StreamParameters& params, std::vector<MetadataBlock>& blocks,
                                  const DecoderConfig& config) {
    if (!m_reader) {
        return fail(FLACError::SESSION_NOT_OPEN, "No reader");
    }

    if (!parseStreamMarker()) {
        return false;
    }

    bool is_last = false;
    uint8_t type = 0;
    uint32_t length = 0;
    if (!parseMetadataBlockHeader(is_last, type, length)) {
        if (m_last_error == FLACError::INVALID_METADATA) {
            m_last_error = FLACError::INVALID_STREAM_INFO;
        }
        return false;
    }

    if (type != static_cast<uint8_t>(MetadataType::STREAMINFO)) {
        return fail(FLACError::INVALID_STREAM_INFO, "First metadata block is not STREAMINFO");
    }
    if (length != STREAMINFO_LENGTH) {
        return fail(FLACError::INVALID_STREAM_INFO, "STREAMINFO length is not 34 bytes");
    }

    if (!parseStreamInfo(params)) {
        return false;
    }

    // Remaining blocks are carried opaquely
    uint32_t block_count = 0;
    while (!is_last) {
        MetadataBlock block;
        if (!parseMetadataBlockHeader(block.is_last, block.type, block.length)) {
            return false;
        }
        if (block.type == static_cast<uint8_t>(MetadataType::STREAMINFO)) {
            return fail(FLACError::INVALID_METADATA, "Duplicate STREAMINFO block");
        }
        if (!readMetadataBlock(block, config.retain_metadata, config.max_metadata_size)) {
            return false;
        }

        Debug::log("flac_codec", "[MetadataParser] Metadata block ", block_count,
                   ": type=", static_cast<int>(block.type), " length=", block.length,
                   block.retained ? " (retained)" : " (skipped)");

        is_last = block.is_last;
        blocks.push_back(std::move(block));
        block_count++;
    }

    m_last_error = FLACError::NONE;
    return true;
}

bool MetadataParser::parseStreamMarker() {
    static const uint8_t marker[4] = { 'f', 'L', 'a', 'C' };

    for (int i = 0; i < 4; i++) {
        uint32_t byte;
        if (!m_reader->readBits(byte, 8)) {
            return readerFailed();
        }
        if (byte != marker[i]) {
            return fail(FLACError::INVALID_STREAM_MARKER, "Stream does not start with fLaC");
        }
    }
    return true;
}

bool MetadataParser::parseMetadataBlockHeader(bool& is_last, uint8_t& type, uint32_t& length) {
    // Read 1-bit last-block flag
    bool last_flag;
    if (!m_reader->readBit(last_flag)) {
        return readerFailed();
    }

    // Read 7-bit block type
    uint32_t block_type;
    if (!m_reader->readBits(block_type, 7)) {
        return readerFailed();
    }

    // Reject forbidden type 127
    if (block_type == static_cast<uint32_t>(MetadataType::FORBIDDEN)) {
        return fail(FLACError::INVALID_METADATA, "Forbidden metadata block type 127");
    }

    // Read 24-bit block length
    uint32_t block_length;
    if (!m_reader->readBits(block_length, 24)) {
        return readerFailed();
    }

    is_last = last_flag;
    type = static_cast<uint8_t>(block_type);
    length = block_length;
    return true;
}

bool MetadataParser::parseStreamInfo(StreamParameters& params) {
    StreamParameters info;
    uint32_t value;

    if (!m_reader->readBits(value, 16)) return readerFailed();
    info.min_block_size = value;

    if (!m_reader->readBits(value, 16)) return readerFailed();
    info.max_block_size = value;

    if (!m_reader->readBits(value, 24)) return readerFailed();
    info.min_frame_size = value;

    if (!m_reader->readBits(value, 24)) return readerFailed();
    info.max_frame_size = value;

    if (!m_reader->readBits(value, 20)) return readerFailed();
    info.sample_rate = value;

    // Stored as channels - 1
    if (!m_reader->readBits(value, 3)) return readerFailed();
    info.channels = value + 1;

    // Stored as bps - 1
    if (!m_reader->readBits(value, 5)) return readerFailed();
    info.bits_per_sample = value + 1;

    uint64_t total;
    if (!m_reader->readBits64(total, 36)) return readerFailed();
    info.total_samples = total;

    if (!m_reader->readBytes(info.md5_signature, 16)) return readerFailed();

    if (!validateStreamInfo(info)) {
        return false;
    }

    Debug::log("flac_codec", "[MetadataParser] STREAMINFO: ", info.sample_rate, " Hz, ",
               info.channels, " ch, ", info.bits_per_sample, " bps, blocks ",
               info.min_block_size, "-", info.max_block_size, ", ", info.total_samples, " samples");

    params = info;
    return true;
}

bool MetadataParser::validateStreamInfo(const StreamParameters& params) {
    if (params.sample_rate == 0) {
        return fail(FLACError::INVALID_STREAM_INFO, "Sample rate is zero");
    }
    if (params.channels < 1 || params.channels > 8) {
        return fail(FLACError::INVALID_STREAM_INFO, "Channel count out of range");
    }
    if (params.bits_per_sample < 4 || params.bits_per_sample > 32) {
        return fail(FLACError::INVALID_STREAM_INFO, "Bits per sample out of range");
    }
    if (params.min_block_size < 16) {
        return fail(FLACError::INVALID_STREAM_INFO, "Minimum block size below 16");
    }
    if (params.max_block_size < params.min_block_size) {
        return fail(FLACError::INVALID_STREAM_INFO, "Maximum block size below minimum");
    }
    if (params.min_frame_size != 0 && params.max_frame_size != 0 &&
        params.min_frame_size > params.max_frame_size) {
        return fail(FLACError::INVALID_STREAM_INFO, "Minimum frame size above maximum");
    }
    return true;
}

bool MetadataParser::readMetadataBlock(MetadataBlock& block, bool retain, uint32_t max_size) {
    if (retain && block.length <= max_size) {
        block.data.resize(block.length);
        if (!m_reader->readBytes(block.data.data(), block.length)) {
            block.data.clear();
            return readerFailed();
        }
        block.retained = true;
        return true;
    }

    block.data.clear();
    block.retained = false;
    return skipMetadataBlock(block.length);
}

bool MetadataParser::skipMetadataBlock(uint32_t block_length) {
    if (!m_reader->skipBytes(block_length)) {
        return readerFailed();
    }
    return true;
}

} // namespace FLAC
} // namespace FlacDec
