#ifndef RESIDUAL_DECODER_H
#define RESIDUAL_DECODER_H

#include <cstdint>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace FLAC {

// Forward declarations
class BitstreamReader;

/**
 * Residual coding methods per RFC 9639 Section 9.2.7
 */
enum class CodingMethod {
    RICE_4BIT = 0,  // 4-bit Rice parameter, escape code 0b1111
    RICE_5BIT = 1   // 5-bit Rice parameter, escape code 0b11111
};

/**
 * Information about one residual partition
 */
struct PartitionInfo {
    uint32_t rice_parameter;  // Rice parameter for this partition
    bool is_escaped;          // True if partition uses escape code
    uint32_t escape_bits;     // Bit width for escaped samples (0 = all zero)
    uint32_t sample_count;    // Number of samples in this partition

    PartitionInfo() : rice_parameter(0), is_escaped(false), escape_bits(0), sample_count(0) {}
};

/**
 * ResidualDecoder - Decodes partitioned Rice residuals
 *
 * Layout (RFC 9639 Section 9.2.7):
 *   2 bits  coding method (0b10 and 0b11 reserved)
 *   4 bits  partition order p
 *   2^p partitions, each:
 *     4/5 bits Rice parameter, or the escape code followed by a 5-bit width
 *     residuals
 *
 * Partition size is block_size >> p. The first partition carries
 * predictor_order fewer residuals because of the warm-up samples.
 *
 * Residuals are written straight into the channel buffer following the
 * warm-up samples. Each Rice-coded value must fold into 32 bits; a longer
 * unary run is rejected with ARITHMETIC_OVERFLOW_GUARD.
 */
class ResidualDecoder {
public:
    explicit ResidualDecoder(BitstreamReader* reader);

    /**
     * Decode block_size - predictor_order residuals into output
     */
    bool decodeResidual(int64_t* output, uint32_t block_size, uint32_t predictor_order);

    FLACError getLastError() const { return m_last_error; }

private:
    BitstreamReader* m_reader;  // Bitstream reader (not owned)
    FLACError m_last_error;

    bool parseResidualHeader(CodingMethod& method, uint32_t& partition_order);
    bool decodeRicePartition(int64_t* output, const PartitionInfo& info);
    bool decodeEscapedPartition(int64_t* output, const PartitionInfo& info);

    bool fail(FLACError error, const char* message);
    bool readerFailed();

    // Zig-zag: 0, 1, 2, 3, 4 -> 0, -1, 1, -2, 2
    static inline int64_t unfoldSigned(uint32_t folded) {
        return (folded & 1) ? -static_cast<int64_t>(folded >> 1) - 1
                            : static_cast<int64_t>(folded >> 1);
    }
};

} // namespace FLAC
} // namespace FlacDec

#endif // RESIDUAL_DECODER_H
