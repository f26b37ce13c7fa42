/*
 * MetadataParser.h - FLAC stream marker, STREAMINFO and metadata block walker
 * This file is part of flacdec.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef METADATAPARSER_H
#define METADATAPARSER_H

#include <cstdint>
#include <vector>

#include "codecs/flac/FLACError.h"
#include "codecs/flac/FLACTypes.h"

namespace FlacDec {
namespace FLAC {

// Forward declaration
class BitstreamReader;

/**
 * MetadataParser - Parses everything in front of the first audio frame
 *
 * Stream layout (RFC 9639 section 6):
 *   "fLaC" | STREAMINFO | metadata block* | frame*
 *
 * Each metadata block starts with a 32-bit header:
 *   1 bit  last-metadata-block flag
 *   7 bits block type (127 forbidden)
 *   24 bits payload length in bytes
 *
 * STREAMINFO is decoded into StreamParameters. Every other block is
 * carried opaquely as a MetadataBlock and its payload either skipped or
 * retained, never interpreted.
 */
class MetadataParser {
public:
    explicit MetadataParser(BitstreamReader* reader);

    /**
     * Parse marker, STREAMINFO and all remaining metadata blocks.
     * Leaves the reader at the first frame.
     */
    bool parseHeaders(StreamParameters& params, std::vector<MetadataBlock>& blocks,
                      const DecoderConfig& config);

    bool parseStreamMarker();
    bool parseMetadataBlockHeader(bool& is_last, uint8_t& type, uint32_t& length);
    bool parseStreamInfo(StreamParameters& params);
    bool validateStreamInfo(const StreamParameters& params);

    /**
     * Consume one block payload, keeping it in block.data when retain is
     * set and the payload is no larger than max_size.
     */
    bool readMetadataBlock(MetadataBlock& block, bool retain, uint32_t max_size);
    bool skipMetadataBlock(uint32_t block_length);

    FLACError getLastError() const { return m_last_error; }

    static constexpr uint32_t STREAMINFO_LENGTH = 34;

private:
    BitstreamReader* m_reader;
    FLACError m_last_error;

    bool fail(FLACError error, const char* message);
    bool readerFailed();
};

} // namespace FLAC
} // namespace FlacDec

#endif // METADATAPARSER_H
