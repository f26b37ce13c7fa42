/*
 * MD5Validator.h - MD5 checksum validation for FLAC decoded audio
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

#ifndef MD5VALIDATOR_H
#define MD5VALIDATOR_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace FlacDec {
namespace FLAC {

/**
 * @brief Running MD5 of decoded audio, as STREAMINFO records it
 *
 * Samples are hashed interleaved (all channels of sample n before
 * sample n+1), each written signed little-endian in ceil(bit_depth / 8)
 * bytes. Blocks must be fed in stream order.
 *
 *   reset() -> update()* -> finalize() -> compare()
 *
 * Not thread-safe.
 *
 * @see RFC 9639 Section 8.2
 */
class MD5Validator {
public:
    MD5Validator();
    ~MD5Validator() = default;

    MD5Validator(const MD5Validator&) = delete;
    MD5Validator& operator=(const MD5Validator&) = delete;

    /**
     * @brief Start a new digest, discarding any previous one
     * @return false if OpenSSL could not provide an MD5 context
     */
    bool reset();

    /**
     * @brief Hash one decoded block
     *
     * An empty block is accepted and changes nothing. Fails before
     * reset(), after finalize(), or for a bit depth outside 4-32.
     */
    bool update(const int64_t* const* samples, uint32_t sample_count,
                uint32_t channel_count, uint32_t bit_depth);

    /**
     * @brief Finish the digest; repeated calls return the same result
     */
    bool finalize(uint8_t md5_out[16]);

    // False until finalize() succeeded
    bool compare(const uint8_t expected_md5[16]) const;

    void getMD5(uint8_t md5_out[16]) const;

    bool isActive() const { return m_state == State::ACTIVE; }

    static bool isZeroMD5(const uint8_t md5[16]);

private:
    enum class State { IDLE, ACTIVE, FINALIZED };

    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, ContextDeleter> m_ctx;
    State m_state;
    uint8_t m_digest[16];
    std::vector<uint8_t> m_packed;     // Interleaved little-endian bytes of one block

    void abandon(const char* reason);

    static void packSamples(const int64_t* const* samples, uint32_t sample_count,
                            uint32_t channel_count, uint32_t bytes_per_sample, uint8_t* out);
};

} // namespace FLAC
} // namespace FlacDec

#endif // MD5VALIDATOR_H
