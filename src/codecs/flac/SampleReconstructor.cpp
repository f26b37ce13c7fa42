#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

// |coeff| < 2^14, |sample| <= 2^32, at most 2^5 terms: |sum| < 2^51
static_assert((SampleReconstructor::MAX_COEFF_BITS - 1) + (SampleReconstructor::MAX_SAMPLE_BITS - 1) + 5
                  < std::numeric_limits<int64_t>::digits,
              "LPC accumulator too narrow");
static_assert(SampleReconstructor::MAX_LPC_ORDER <= 32, "LPC order bound changed");

SampleReconstructor::SampleReconstructor()
    : m_last_error(FLACError::NONE)
{
}

SampleReconstructor::~SampleReconstructor()
{
}

bool SampleReconstructor::overflow(uint32_t index, int64_t value, uint32_t bit_depth)
{
    Debug::log("subframe_decoder", "[SampleReconstructor] Sample ", index, " = ", value,
               " does not fit ", bit_depth, " bits");
    m_last_error = FLACError::ARITHMETIC_OVERFLOW_GUARD;
    return false;
}

bool SampleReconstructor::restoreFixed(int64_t* samples, uint32_t block_size, uint32_t order, uint32_t bit_depth)
{
    if (order > MAX_FIXED_ORDER || order > block_size) {
        m_last_error = FLACError::INVALID_SUBFRAME;
        return false;
    }

    for (uint32_t i = order; i < block_size; i++) {
        int64_t prediction = 0;
        switch (order) {
        case 0:
            prediction = 0;
            break;
        case 1:
            prediction = samples[i - 1];
            break;
        case 2:
            prediction = 2 * samples[i - 1] - samples[i - 2];
            break;
        case 3:
            prediction = 3 * samples[i - 1] - 3 * samples[i - 2] + samples[i - 3];
            break;
        case 4:
            prediction = 4 * samples[i - 1] - 6 * samples[i - 2] + 4 * samples[i - 3] - samples[i - 4];
            break;
        }

        int64_t value = prediction + samples[i];
        if (!fitsBitDepth(value, bit_depth)) {
            return overflow(i, value, bit_depth);
        }
        samples[i] = value;
    }

    m_last_error = FLACError::NONE;
    return true;
}

bool SampleReconstructor::restoreLPC(int64_t* samples, uint32_t block_size, const int32_t* coeffs,
                                     uint32_t order, uint32_t shift, uint32_t bit_depth)
{
    if (order == 0 || order > MAX_LPC_ORDER || order > block_size || shift > 31) {
        m_last_error = FLACError::INVALID_SUBFRAME;
        return false;
    }

    for (uint32_t i = order; i < block_size; i++) {
        // prediction = sum(coeff[j] * sample[n-j-1]) >> shift
        int64_t sum = 0;
        const int64_t* history = samples + i - 1;
        for (uint32_t j = 0; j < order; j++) {
            sum += static_cast<int64_t>(coeffs[j]) * history[-static_cast<int64_t>(j)];
        }

        // Arithmetic shift first, then the residual
        int64_t value = (sum >> shift) + samples[i];
        if (!fitsBitDepth(value, bit_depth)) {
            return overflow(i, value, bit_depth);
        }
        samples[i] = value;
    }

    m_last_error = FLACError::NONE;
    return true;
}

} // namespace FLAC
} // namespace FlacDec
