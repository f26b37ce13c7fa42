/*
 * FLACError.h - Error types and exception handling for the FLAC decoder
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

#ifndef FLACERROR_H
#define FLACERROR_H

#include <ostream>
#include <stdexcept>
#include <string>

namespace FlacDec {
namespace FLAC {

/**
 * @brief Error codes for FLAC decoder operations
 *
 * Every decoder component reports failure through one of these codes.
 * None of them is fatal to the process; the session stores the first
 * one it sees and refuses further progress until the caller either
 * gives up or asks for resynchronization.
 */
enum class FLACError {
    /**
     * @brief No error occurred
     */
    NONE = 0,

    /**
     * @brief Source exhausted cleanly at a frame boundary
     *
     * Not a failure: marks the end of the block sequence.
     */
    END_OF_STREAM,

    /**
     * @brief Source exhausted in the middle of a structure
     */
    UNEXPECTED_END,

    /**
     * @brief Stream does not begin with "fLaC"
     */
    INVALID_STREAM_MARKER,

    /**
     * @brief STREAMINFO missing, malformed or out of range
     */
    INVALID_STREAM_INFO,

    /**
     * @brief Metadata block header is malformed (forbidden type, duplicate STREAMINFO)
     */
    INVALID_METADATA,

    /**
     * @brief Frame sync pattern not found where a frame should start
     *
     * Recovery: DecodeSession::resynchronize()
     */
    SYNC_LOST,

    /**
     * @brief Bounded resynchronization scan found no valid frame header
     */
    DESYNC_RECOVERY_FAILED,

    /**
     * @brief A reserved bit in a frame or subframe header is set
     */
    RESERVED_BIT_SET,

    /**
     * @brief Frame header uses a reserved or forbidden code
     */
    INVALID_FRAME_HEADER,

    /**
     * @brief Subframe type, predictor parameters or coding method invalid
     */
    INVALID_SUBFRAME,

    /**
     * @brief Partition order does not divide the block into usable partitions
     */
    INVALID_PARTITION_ORDER,

    /**
     * @brief Header CRC-8 or frame CRC-16 disagrees with the stream
     */
    CHECKSUM_MISMATCH,

    /**
     * @brief Frame disagrees with the declared stream parameters
     */
    INCONSISTENT_FRAME_PARAMETERS,

    /**
     * @brief Decoded value exceeds the range reserved for it
     *
     * Treated as corruption, never wrapped.
     */
    ARITHMETIC_OVERFLOW_GUARD,

    /**
     * @brief MD5 of the decoded audio differs from the STREAMINFO signature
     */
    SIGNATURE_MISMATCH,

    /**
     * @brief Operation attempted on a session that failed to open
     */
    SESSION_NOT_OPEN
};

/**
 * @brief Get the enumerator name of an error code
 *
 * @param error Error code
 * @return Enumerator name, e.g. "CHECKSUM_MISMATCH"
 */
inline const char* getErrorName(FLACError error) {
    switch (error) {
        case FLACError::NONE:
            return "NONE";
        case FLACError::END_OF_STREAM:
            return "END_OF_STREAM";
        case FLACError::UNEXPECTED_END:
            return "UNEXPECTED_END";
        case FLACError::INVALID_STREAM_MARKER:
            return "INVALID_STREAM_MARKER";
        case FLACError::INVALID_STREAM_INFO:
            return "INVALID_STREAM_INFO";
        case FLACError::INVALID_METADATA:
            return "INVALID_METADATA";
        case FLACError::SYNC_LOST:
            return "SYNC_LOST";
        case FLACError::DESYNC_RECOVERY_FAILED:
            return "DESYNC_RECOVERY_FAILED";
        case FLACError::RESERVED_BIT_SET:
            return "RESERVED_BIT_SET";
        case FLACError::INVALID_FRAME_HEADER:
            return "INVALID_FRAME_HEADER";
        case FLACError::INVALID_SUBFRAME:
            return "INVALID_SUBFRAME";
        case FLACError::INVALID_PARTITION_ORDER:
            return "INVALID_PARTITION_ORDER";
        case FLACError::CHECKSUM_MISMATCH:
            return "CHECKSUM_MISMATCH";
        case FLACError::INCONSISTENT_FRAME_PARAMETERS:
            return "INCONSISTENT_FRAME_PARAMETERS";
        case FLACError::ARITHMETIC_OVERFLOW_GUARD:
            return "ARITHMETIC_OVERFLOW_GUARD";
        case FLACError::SIGNATURE_MISMATCH:
            return "SIGNATURE_MISMATCH";
        case FLACError::SESSION_NOT_OPEN:
            return "SESSION_NOT_OPEN";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Get human-readable error message for error code
 *
 * @param error Error code
 * @return Descriptive error message
 */
inline const char* getErrorMessage(FLACError error) {
    switch (error) {
        case FLACError::NONE:
            return "No error";
        case FLACError::END_OF_STREAM:
            return "End of stream";
        case FLACError::UNEXPECTED_END:
            return "Stream ended in the middle of a structure";
        case FLACError::INVALID_STREAM_MARKER:
            return "Missing fLaC stream marker";
        case FLACError::INVALID_STREAM_INFO:
            return "Invalid STREAMINFO block";
        case FLACError::INVALID_METADATA:
            return "Invalid metadata block header";
        case FLACError::SYNC_LOST:
            return "Frame sync pattern not found";
        case FLACError::DESYNC_RECOVERY_FAILED:
            return "No valid frame found within the resynchronization window";
        case FLACError::RESERVED_BIT_SET:
            return "Reserved bit set";
        case FLACError::INVALID_FRAME_HEADER:
            return "Invalid or reserved frame header field";
        case FLACError::INVALID_SUBFRAME:
            return "Invalid subframe";
        case FLACError::INVALID_PARTITION_ORDER:
            return "Partition order does not fit the block";
        case FLACError::CHECKSUM_MISMATCH:
            return "CRC checksum validation failed";
        case FLACError::INCONSISTENT_FRAME_PARAMETERS:
            return "Frame parameters disagree with STREAMINFO";
        case FLACError::ARITHMETIC_OVERFLOW_GUARD:
            return "Decoded value exceeds its permitted range";
        case FLACError::SIGNATURE_MISMATCH:
            return "MD5 signature of decoded audio does not match STREAMINFO";
        case FLACError::SESSION_NOT_OPEN:
            return "Decode session is not open";
        default:
            return "Unknown error";
    }
}

inline std::ostream& operator<<(std::ostream& os, FLACError error) {
    return os << getErrorName(error);
}

/**
 * @brief Exception class for FLAC decoder errors
 *
 * Only thrown by the block iterator; the rest of the decoder reports
 * errors by return value.
 *
 * USAGE:
 * ======
 * try {
 *     for (const DecodedBlock& block : session->blocks()) {
 *         // consume block
 *     }
 * } catch (const FLACException& e) {
 *     if (e.getError() == FLACError::SYNC_LOST) {
 *         session->resynchronize();
 *     }
 * }
 */
class FLACException : public std::runtime_error {
public:
    /**
     * @brief Construct FLAC exception with error code and message
     *
     * @param error Error code indicating type of failure
     * @param message Descriptive error message
     */
    FLACException(FLACError error, const std::string& message)
        : std::runtime_error(message), m_error(error) {}

    explicit FLACException(FLACError error)
        : std::runtime_error(getErrorMessage(error)), m_error(error) {}

    FLACError getError() const { return m_error; }

    const char* getErrorName() const { return FLAC::getErrorName(m_error); }

private:
    FLACError m_error;
};

} // namespace FLAC
} // namespace FlacDec

#endif // FLACERROR_H
