/*
 * FLACTypes.h - Shared value types for the FLAC decoder
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

#ifndef FLACTYPES_H
#define FLACTYPES_H

#include <cstdint>
#include <cstddef>
#include <vector>

namespace FlacDec {
namespace FLAC {

/**
 * @brief Stream parameters decoded from the STREAMINFO block
 *
 * Immutable once parsed. Every frame is validated against these.
 */
struct StreamParameters {
    uint32_t min_block_size = 0;     ///< Minimum block size in samples (16-65535)
    uint32_t max_block_size = 0;     ///< Maximum block size in samples (16-65535)
    uint32_t min_frame_size = 0;     ///< Minimum frame size in bytes (0 = unknown)
    uint32_t max_frame_size = 0;     ///< Maximum frame size in bytes (0 = unknown)
    uint32_t sample_rate = 0;        ///< Sample rate in Hz (1-1048575)
    uint32_t channels = 0;           ///< Channel count (1-8)
    uint32_t bits_per_sample = 0;    ///< Bits per sample (4-32)
    uint64_t total_samples = 0;      ///< Inter-channel samples in stream (0 = unknown)
    uint8_t md5_signature[16] = {0}; ///< MD5 of the decoded audio (all zero = unknown)

    bool hasTotalSamples() const { return total_samples != 0; }

    bool hasMD5Signature() const {
        for (int i = 0; i < 16; i++) {
            if (md5_signature[i] != 0) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Stream duration in milliseconds, 0 when the total is unknown
     */
    uint64_t getDurationMs() const {
        if (sample_rate == 0 || total_samples == 0) return 0;
        return (total_samples * 1000ULL) / sample_rate;
    }
};

/**
 * @brief Metadata block types per RFC 9639 section 8.1
 */
enum class MetadataType : uint8_t {
    STREAMINFO = 0,
    PADDING = 1,
    APPLICATION = 2,
    SEEKTABLE = 3,
    VORBIS_COMMENT = 4,
    CUESHEET = 5,
    PICTURE = 6,
    FORBIDDEN = 127
};

/**
 * @brief Opaque metadata block following STREAMINFO
 *
 * The payload is only kept when DecoderConfig::retain_metadata is set
 * and the block fits within DecoderConfig::max_metadata_size.
 */
struct MetadataBlock {
    bool is_last = false;
    uint8_t type = 0;
    uint32_t length = 0;
    bool retained = false;           ///< True when data holds the whole payload
    std::vector<uint8_t> data;
};

/**
 * @brief One decoded frame worth of PCM, owned by the caller
 *
 * Samples are stored per channel as 64-bit values. Each value fits in
 * bits_per_sample bits after decorrelation.
 */
struct DecodedBlock {
    uint32_t channels = 0;
    uint32_t bits_per_sample = 0;
    uint32_t sample_rate = 0;
    uint64_t first_sample = 0;       ///< Absolute index of the first inter-channel sample
    std::vector<std::vector<int64_t>> samples;

    size_t getSampleCount() const { return samples.empty() ? 0 : samples[0].size(); }

    /**
     * @brief Channel-interleaved copy of the block
     *
     * Every sample fits 32 bits for any valid stream, so the narrowing
     * is lossless.
     */
    std::vector<int32_t> interleave() const {
        std::vector<int32_t> out;
        size_t count = getSampleCount();
        out.reserve(count * samples.size());
        for (size_t i = 0; i < count; i++) {
            for (const auto& channel : samples) {
                out.push_back(static_cast<int32_t>(channel[i]));
            }
        }
        return out;
    }
};

/**
 * @brief Run-time options for a decode session
 */
struct DecoderConfig {
    bool verify_frame_crc = true;             ///< Check the CRC-16 footer of every frame
    bool verify_md5 = true;                   ///< Compare the MD5 of the decoded audio at end of stream
    bool retain_metadata = false;             ///< Keep payloads of non-STREAMINFO metadata blocks
    uint32_t max_metadata_size = 64 * 1024;   ///< Largest payload kept when retaining metadata
    uint32_t max_resync_bytes = 1024 * 1024;  ///< Bytes scanned by resynchronize() before giving up
    size_t read_chunk_size = 4096;            ///< Bytes requested from the source per refill
};

/**
 * @brief Decode session statistics
 */
struct FLACCodecStats {
    size_t frames_decoded = 0;        ///< Total number of FLAC frames decoded
    uint64_t samples_decoded = 0;     ///< Total inter-channel samples decoded
    uint64_t bytes_consumed = 0;      ///< Input bytes consumed, including metadata
    size_t crc_errors = 0;            ///< CRC validation failures
    size_t sync_errors = 0;           ///< Frame synchronization errors
    size_t resync_count = 0;          ///< Successful resynchronizations
};

} // namespace FLAC
} // namespace FlacDec

#endif // FLACTYPES_H
