#ifndef FLACDEC_CODECS_FLAC_SAMPLERECONSTRUCTOR_H
#define FLACDEC_CODECS_FLAC_SAMPLERECONSTRUCTOR_H

#include <cstdint>
#include <cstddef>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace FLAC {

/**
 * SampleReconstructor - Turns warm-up samples plus residuals into signal
 *
 * Both predictors work in place on one channel buffer: samples[0..order-1]
 * hold the warm-up samples and samples[order..block_size-1] hold the
 * residuals on entry, the reconstructed signal on return.
 *
 * Prediction is computed in a 64-bit accumulator, arithmetically shifted,
 * and only then added to the residual. Every reconstructed value must fit
 * the subframe bit depth (up to 33 bits for a side channel); anything
 * else is corruption and fails with ARITHMETIC_OVERFLOW_GUARD.
 */
class SampleReconstructor {
public:
    static constexpr uint32_t MAX_FIXED_ORDER = 4;
    static constexpr uint32_t MAX_LPC_ORDER = 32;
    static constexpr uint32_t MAX_SAMPLE_BITS = 33;
    static constexpr uint32_t MAX_COEFF_BITS = 15;

    SampleReconstructor();
    ~SampleReconstructor();

    /**
     * Fixed polynomial predictor, order 0-4 (RFC 9639 Section 9.2.5)
     *
     * @param samples Channel buffer, warm-up followed by residuals
     * @param block_size Number of samples in the buffer
     * @param order Predictor order
     * @param bit_depth Subframe bit depth the results must fit
     */
    bool restoreFixed(int64_t* samples, uint32_t block_size, uint32_t order, uint32_t bit_depth);

    /**
     * Linear predictor, order 1-32 (RFC 9639 Section 9.2.6)
     *
     * coeffs[0] applies to the most recent sample.
     */
    bool restoreLPC(int64_t* samples, uint32_t block_size, const int32_t* coeffs,
                    uint32_t order, uint32_t shift, uint32_t bit_depth);

    /**
     * Check that value is representable as a signed bit_depth-bit integer
     */
    static inline bool fitsBitDepth(int64_t value, uint32_t bit_depth) {
        const int64_t limit = static_cast<int64_t>(1) << (bit_depth - 1);
        return value >= -limit && value < limit;
    }

    FLACError getLastError() const { return m_last_error; }

private:
    FLACError m_last_error;

    bool overflow(uint32_t index, int64_t value, uint32_t bit_depth);
};

} // namespace FLAC
} // namespace FlacDec

#endif // FLACDEC_CODECS_FLAC_SAMPLERECONSTRUCTOR_H
