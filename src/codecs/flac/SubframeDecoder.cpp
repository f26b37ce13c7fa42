/*
 * SubframeDecoder.cpp - FLAC subframe decoding implementation
 * This file is part of flacdec.
 * Copyright © 2025-2026 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "flacdec.h"

namespace FlacDec {
namespace FLAC {

const char *getSubframeTypeName(SubframeType type) {
  switch (type) {
  case SubframeType::CONSTANT:
    return "CONSTANT";
  case SubframeType::VERBATIM:
    return "VERBATIM";
  case SubframeType::FIXED:
    return "FIXED";
  case SubframeType::LPC:
    return "LPC";
  case SubframeType::RESERVED:
  default:
    return "RESERVED";
  }
}

SubframeDecoder::SubframeDecoder(BitstreamReader *reader,
                                 ResidualDecoder *residual,
                                 SampleReconstructor *reconstructor)
    : m_reader(reader), m_residual(residual), m_reconstructor(reconstructor),
      m_last_error(FLACError::NONE) {}

SubframeDecoder::~SubframeDecoder() {}

bool SubframeDecoder::fail(FLACError error, const char *message) {
  m_last_error = error;
  Debug::log("subframe_decoder", message, " (", getErrorName(error), ")");
  return false;
}

bool SubframeDecoder::readerFailed() {
  m_last_error = m_reader->getLastError();
  return false;
}

bool SubframeDecoder::decodeSubframe(int64_t *output, uint32_t block_size,
                                     uint32_t bit_depth, bool is_side_channel) {
  if (!output || block_size == 0) {
    return fail(FLACError::INVALID_SUBFRAME, "Invalid subframe parameters");
  }

  SubframeHeader header;
  if (!parseSubframeHeader(header, bit_depth, is_side_channel)) {
    return false;
  }
  m_last_header = header;

  bool success = false;
  switch (header.type) {
  case SubframeType::CONSTANT:
    success = decodeConstant(output, block_size, header);
    break;

  case SubframeType::VERBATIM:
    success = decodeVerbatim(output, block_size, header);
    break;

  case SubframeType::FIXED:
    success = decodeFixed(output, block_size, header);
    break;

  case SubframeType::LPC:
    success = decodeLPC(output, block_size, header);
    break;

  case SubframeType::RESERVED:
  default:
    return fail(FLACError::INVALID_SUBFRAME, "Reserved subframe type");
  }

  if (!success) {
    return false;
  }

  // Restore wasted bits. Multiplying keeps negative samples well defined.
  if (header.wasted_bits > 0) {
    const int64_t scale = static_cast<int64_t>(1) << header.wasted_bits;
    for (uint32_t i = 0; i < block_size; i++) {
      output[i] *= scale;
    }
  }

  m_last_error = FLACError::NONE;
  return true;
}

bool SubframeDecoder::parseSubframeHeader(SubframeHeader &header,
                                          uint32_t frame_bit_depth,
                                          bool is_side_channel) {
  // RFC 9639 Section 9.2.1: zero bit, 6-bit type, wasted bits flag
  bool zero_bit;
  if (!m_reader->readBit(zero_bit)) {
    return readerFailed();
  }
  if (zero_bit) {
    return fail(FLACError::RESERVED_BIT_SET, "Subframe padding bit is set");
  }

  uint32_t type_bits;
  if (!m_reader->readBits(type_bits, 6)) {
    return readerFailed();
  }

  if (type_bits == 0) {
    header.type = SubframeType::CONSTANT;
    header.predictor_order = 0;
  } else if (type_bits == 1) {
    header.type = SubframeType::VERBATIM;
    header.predictor_order = 0;
  } else if (type_bits >= 8 && type_bits <= 12) {
    header.type = SubframeType::FIXED;
    header.predictor_order = type_bits - 8;
  } else if (type_bits >= 32) {
    header.type = SubframeType::LPC;
    header.predictor_order = type_bits - 31;
  } else {
    Debug::log("subframe_decoder", "Reserved subframe type code ", type_bits);
    return fail(FLACError::INVALID_SUBFRAME, "Reserved subframe type");
  }

  uint32_t depth = frame_bit_depth + (is_side_channel ? 1 : 0);

  bool has_wasted_bits;
  if (!m_reader->readBit(has_wasted_bits)) {
    return readerFailed();
  }

  header.wasted_bits = 0;
  if (has_wasted_bits) {
    // Unary count of zeros, plus one
    uint32_t zeros;
    if (!m_reader->readUnary(zeros, depth)) {
      if (m_reader->getLastError() == FLACError::ARITHMETIC_OVERFLOW_GUARD) {
        return fail(FLACError::INVALID_SUBFRAME, "Wasted bits run too long");
      }
      return readerFailed();
    }
    header.wasted_bits = zeros + 1;
    if (header.wasted_bits >= depth) {
      Debug::log("subframe_decoder", "Wasted bits ", header.wasted_bits,
                 " leave nothing of ", depth, "-bit samples");
      return fail(FLACError::INVALID_SUBFRAME, "Too many wasted bits");
    }
  }

  header.bit_depth = depth - header.wasted_bits;
  return true;
}

bool SubframeDecoder::decodeConstant(int64_t *output, uint32_t block_size,
                                     const SubframeHeader &header) {
  int64_t value;
  if (!m_reader->readBitsSigned64(value, header.bit_depth)) {
    return readerFailed();
  }

  for (uint32_t i = 0; i < block_size; i++) {
    output[i] = value;
  }
  return true;
}

bool SubframeDecoder::decodeVerbatim(int64_t *output, uint32_t block_size,
                                     const SubframeHeader &header) {
  for (uint32_t i = 0; i < block_size; i++) {
    if (!m_reader->readBitsSigned64(output[i], header.bit_depth)) {
      return readerFailed();
    }
  }
  return true;
}

bool SubframeDecoder::readWarmup(int64_t *output,
                                 const SubframeHeader &header) {
  for (uint32_t i = 0; i < header.predictor_order; i++) {
    if (!m_reader->readBitsSigned64(output[i], header.bit_depth)) {
      return readerFailed();
    }
  }
  return true;
}

bool SubframeDecoder::decodeFixed(int64_t *output, uint32_t block_size,
                                  const SubframeHeader &header) {
  if (header.predictor_order > block_size) {
    Debug::log("subframe_decoder", "FIXED order ", header.predictor_order,
               " exceeds block size ", block_size);
    return fail(FLACError::INVALID_SUBFRAME, "Predictor order exceeds block");
  }

  if (!readWarmup(output, header)) {
    return false;
  }

  if (!m_residual->decodeResidual(output + header.predictor_order, block_size,
                                  header.predictor_order)) {
    m_last_error = m_residual->getLastError();
    return false;
  }

  if (!m_reconstructor->restoreFixed(output, block_size,
                                     header.predictor_order,
                                     header.bit_depth)) {
    m_last_error = m_reconstructor->getLastError();
    return false;
  }
  return true;
}

bool SubframeDecoder::decodeLPC(int64_t *output, uint32_t block_size,
                                const SubframeHeader &header) {
  if (header.predictor_order > block_size) {
    Debug::log("subframe_decoder", "LPC order ", header.predictor_order,
               " exceeds block size ", block_size);
    return fail(FLACError::INVALID_SUBFRAME, "Predictor order exceeds block");
  }

  if (!readWarmup(output, header)) {
    return false;
  }

  // RFC 9639 Section 9.2.6: 4-bit precision minus one, 0b1111 is invalid
  uint32_t precision_bits;
  if (!m_reader->readBits(precision_bits, 4)) {
    return readerFailed();
  }
  if (precision_bits == 0x0F) {
    return fail(FLACError::INVALID_SUBFRAME, "Invalid LPC coefficient precision");
  }
  uint32_t precision = precision_bits + 1;

  // 5-bit signed shift; negative shifts are not permitted
  int32_t shift;
  if (!m_reader->readBitsSigned(shift, 5)) {
    return readerFailed();
  }
  if (shift < 0) {
    Debug::log("subframe_decoder", "Negative LPC shift ", shift);
    return fail(FLACError::INVALID_SUBFRAME, "Negative LPC shift");
  }

  std::array<int32_t, SampleReconstructor::MAX_LPC_ORDER> coefficients;
  for (uint32_t i = 0; i < header.predictor_order; i++) {
    if (!m_reader->readBitsSigned(coefficients[i], precision)) {
      return readerFailed();
    }
  }

  if (!m_residual->decodeResidual(output + header.predictor_order, block_size,
                                  header.predictor_order)) {
    m_last_error = m_residual->getLastError();
    return false;
  }

  if (!m_reconstructor->restoreLPC(output, block_size, coefficients.data(),
                                   header.predictor_order,
                                   static_cast<uint32_t>(shift),
                                   header.bit_depth)) {
    m_last_error = m_reconstructor->getLastError();
    return false;
  }
  return true;
}

} // namespace FLAC
} // namespace FlacDec
