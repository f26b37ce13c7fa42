/*
 * MD5Validator.cpp - MD5 checksum validation for FLAC decoded audio
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

MD5Validator::MD5Validator()
    : m_state(State::IDLE)
{
    std::memset(m_digest, 0, sizeof(m_digest));
}

void MD5Validator::abandon(const char* reason)
{
    Debug::log("flac_codec", "[MD5Validator] ", reason);
    m_ctx.reset();
    m_state = State::IDLE;
}

bool MD5Validator::reset()
{
    std::memset(m_digest, 0, sizeof(m_digest));

    m_ctx.reset(EVP_MD_CTX_new());
    if (!m_ctx) {
        abandon("EVP_MD_CTX_new failed");
        return false;
    }
    if (EVP_DigestInit_ex(m_ctx.get(), EVP_md5(), nullptr) != 1) {
        abandon("EVP_DigestInit_ex(md5) failed");
        return false;
    }

    m_state = State::ACTIVE;
    return true;
}

bool MD5Validator::update(const int64_t* const* samples, uint32_t sample_count,
                          uint32_t channel_count, uint32_t bit_depth)
{
    if (m_state != State::ACTIVE) {
        Debug::log("flac_codec", "[MD5Validator] update() without an active digest");
        return false;
    }
    if (!samples || sample_count == 0 || channel_count == 0) {
        return true;
    }
    if (bit_depth < 4 || bit_depth > 32) {
        Debug::log("flac_codec", "[MD5Validator] Bit depth ", bit_depth, " out of range");
        return false;
    }

    const uint32_t bytes_per_sample = (bit_depth + 7) / 8;
    m_packed.resize(static_cast<size_t>(sample_count) * channel_count * bytes_per_sample);
    packSamples(samples, sample_count, channel_count, bytes_per_sample, m_packed.data());

    if (EVP_DigestUpdate(m_ctx.get(), m_packed.data(), m_packed.size()) != 1) {
        abandon("EVP_DigestUpdate failed");
        return false;
    }
    return true;
}

bool MD5Validator::finalize(uint8_t md5_out[16])
{
    if (m_state == State::FINALIZED) {
        getMD5(md5_out);
        return true;
    }
    if (m_state != State::ACTIVE) {
        Debug::log("flac_codec", "[MD5Validator] finalize() without an active digest");
        return false;
    }

    unsigned int length = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), m_digest, &length) != 1 || length != sizeof(m_digest)) {
        abandon("EVP_DigestFinal_ex failed");
        return false;
    }

    m_ctx.reset();
    m_state = State::FINALIZED;
    getMD5(md5_out);
    return true;
}

bool MD5Validator::compare(const uint8_t expected_md5[16]) const
{
    return m_state == State::FINALIZED && std::memcmp(m_digest, expected_md5, sizeof(m_digest)) == 0;
}

void MD5Validator::getMD5(uint8_t md5_out[16]) const
{
    std::memcpy(md5_out, m_digest, sizeof(m_digest));
}

bool MD5Validator::isZeroMD5(const uint8_t md5[16])
{
    return std::all_of(md5, md5 + 16, [](uint8_t b) { return b == 0; });
}

// Two's complement truncation keeps the sign out to the byte boundary
void MD5Validator::packSamples(const int64_t* const* samples, uint32_t sample_count,
                               uint32_t channel_count, uint32_t bytes_per_sample, uint8_t* out)
{
    for (uint32_t i = 0; i < sample_count; i++) {
        for (uint32_t ch = 0; ch < channel_count; ch++) {
            const uint32_t v = static_cast<uint32_t>(samples[ch][i]);
            switch (bytes_per_sample) {
                case 4:
                    out[3] = static_cast<uint8_t>(v >> 24);
                    // fall through
                case 3:
                    out[2] = static_cast<uint8_t>(v >> 16);
                    // fall through
                case 2:
                    out[1] = static_cast<uint8_t>(v >> 8);
                    // fall through
                default:
                    out[0] = static_cast<uint8_t>(v);
                    break;
            }
            out += bytes_per_sample;
        }
    }
}

} // namespace FLAC
} // namespace FlacDec
