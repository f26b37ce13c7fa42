#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

ResidualDecoder::ResidualDecoder(BitstreamReader* reader)
    : m_reader(reader)
    , m_last_error(FLACError::NONE)
{
}

bool ResidualDecoder::fail(FLACError error, const char* message)
{
    m_last_error = error;
    Debug::log("residual_decoder", message, " (", getErrorName(error), ")");
    return false;
}

bool ResidualDecoder::readerFailed()
{
    m_last_error = m_reader->getLastError();
    return false;
}

bool ResidualDecoder::decodeResidual(int64_t* output, uint32_t block_size, uint32_t predictor_order)
{
    if (predictor_order > block_size) {
        return fail(FLACError::INVALID_SUBFRAME, "Predictor order exceeds block size");
    }

    CodingMethod method;
    uint32_t partition_order;
    if (!parseResidualHeader(method, partition_order)) {
        return false;
    }

    // RFC 9639 Section 9.2.7: block_size must be evenly divisible by 2^partition_order
    uint32_t partition_count = 1u << partition_order;
    if (block_size % partition_count != 0) {
        Debug::log("residual_decoder", "Block size ", block_size, " not divisible by ", partition_count);
        return fail(FLACError::INVALID_PARTITION_ORDER, "Partition size is not integral");
    }

    uint32_t samples_per_partition = block_size >> partition_order;
    if (partition_order > 0 && samples_per_partition < predictor_order) {
        Debug::log("residual_decoder", "Partition size ", samples_per_partition,
                   " below predictor order ", predictor_order);
        return fail(FLACError::INVALID_PARTITION_ORDER, "First partition shorter than predictor order");
    }

    uint32_t param_bits = (method == CodingMethod::RICE_4BIT) ? 4 : 5;
    uint32_t escape_code = (1u << param_bits) - 1;  // 0b1111 or 0b11111

    uint32_t output_offset = 0;
    for (uint32_t p = 0; p < partition_count; ++p) {
        PartitionInfo info;

        // First partition has fewer samples due to predictor warm-up samples
        info.sample_count = (p == 0) ? samples_per_partition - predictor_order : samples_per_partition;

        uint32_t rice_param;
        if (!m_reader->readBits(rice_param, param_bits)) {
            return readerFailed();
        }

        bool ok;
        if (rice_param == escape_code) {
            info.is_escaped = true;
            if (!m_reader->readBits(info.escape_bits, 5)) {
                return readerFailed();
            }
            ok = decodeEscapedPartition(output + output_offset, info);
        } else {
            info.rice_parameter = rice_param;
            ok = decodeRicePartition(output + output_offset, info);
        }

        if (!ok) {
            return false;
        }

        output_offset += info.sample_count;
    }

    m_last_error = FLACError::NONE;
    return true;
}

bool ResidualDecoder::parseResidualHeader(CodingMethod& method, uint32_t& partition_order)
{
    uint32_t method_bits;
    if (!m_reader->readBits(method_bits, 2)) {
        return readerFailed();
    }

    if (method_bits > 1) {
        Debug::log("residual_decoder", "Reserved coding method ", method_bits);
        return fail(FLACError::INVALID_SUBFRAME, "Reserved residual coding method");
    }
    method = static_cast<CodingMethod>(method_bits);

    if (!m_reader->readBits(partition_order, 4)) {
        return readerFailed();
    }
    return true;
}

bool ResidualDecoder::decodeRicePartition(int64_t* output, const PartitionInfo& info)
{
    const uint32_t param = info.rice_parameter;

    // The folded value (quotient << param) | remainder must fit in 32 bits
    const uint32_t max_quotient = 0xFFFFFFFFu >> param;

    for (uint32_t i = 0; i < info.sample_count; ++i) {
        uint32_t quotient;
        if (!m_reader->readUnary(quotient, max_quotient)) {
            if (m_reader->getLastError() == FLACError::ARITHMETIC_OVERFLOW_GUARD) {
                return fail(FLACError::ARITHMETIC_OVERFLOW_GUARD, "Rice quotient exceeds 32 bits");
            }
            return readerFailed();
        }

        uint32_t remainder = 0;
        if (param > 0 && !m_reader->readBits(remainder, param)) {
            return readerFailed();
        }

        uint32_t folded = (quotient << param) | remainder;
        output[i] = unfoldSigned(folded);
    }
    return true;
}

bool ResidualDecoder::decodeEscapedPartition(int64_t* output, const PartitionInfo& info)
{
    if (info.escape_bits == 0) {
        // Width 0: every residual in the partition is zero
        for (uint32_t i = 0; i < info.sample_count; ++i) {
            output[i] = 0;
        }
        return true;
    }

    for (uint32_t i = 0; i < info.sample_count; ++i) {
        int32_t value;
        if (!m_reader->readBitsSigned(value, info.escape_bits)) {
            return readerFailed();
        }
        output[i] = value;
    }
    return true;
}

} // namespace FLAC
} // namespace FlacDec
