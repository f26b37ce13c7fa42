#ifndef SUBFRAME_DECODER_H
#define SUBFRAME_DECODER_H

#include <cstdint>
#include <cstddef>

#include "codecs/flac/FLACError.h"

namespace FlacDec {
namespace FLAC {

// Forward declarations
class BitstreamReader;
class ResidualDecoder;
class SampleReconstructor;

/**
 * SubframeType - Type of subframe encoding
 */
enum class SubframeType {
    CONSTANT,   // Single constant value for all samples
    VERBATIM,   // Uncompressed samples
    FIXED,      // Fixed predictor (order 0-4)
    LPC,        // Linear predictive coding (order 1-32)
    RESERVED    // Reserved/invalid type
};

const char* getSubframeTypeName(SubframeType type);

/**
 * SubframeHeader - Parsed subframe header information
 */
struct SubframeHeader {
    SubframeType type;           // Type of subframe
    uint32_t predictor_order;    // 0 for CONSTANT/VERBATIM, 0-4 for FIXED, 1-32 for LPC
    uint32_t wasted_bits;        // Number of wasted (zero) LSBs
    uint32_t bit_depth;          // Depth the coded samples are read at (after wasted bits)

    SubframeHeader()
        : type(SubframeType::RESERVED)
        , predictor_order(0)
        , wasted_bits(0)
        , bit_depth(0)
    {}
};

/**
 * SubframeDecoder - Decodes one channel of a FLAC frame
 *
 * Implements RFC 9639 Section 9.2:
 * - CONSTANT subframes (single value replicated)
 * - VERBATIM subframes (uncompressed samples)
 * - FIXED predictors (orders 0-4)
 * - LPC predictors (orders 1-32)
 *
 * The side channel of a stereo-decorrelated frame is coded one bit wider
 * than the frame bit depth. Wasted bits are removed from that depth while
 * decoding and shifted back in before the subframe is returned, so the
 * output is always at full subframe scale.
 */
class SubframeDecoder {
public:
    /**
     * Constructor
     * @param reader BitstreamReader for reading subframe data
     * @param residual ResidualDecoder for decoding residuals
     * @param reconstructor Predictor restoration
     */
    SubframeDecoder(BitstreamReader* reader, ResidualDecoder* residual,
                    SampleReconstructor* reconstructor);

    ~SubframeDecoder();

    /**
     * Decode a subframe
     * @param output Output buffer for decoded samples (block_size entries)
     * @param block_size Number of samples in this block
     * @param bit_depth Frame bit depth (before wasted bits adjustment)
     * @param is_side_channel True if this is a side channel (needs +1 bit depth)
     * @return true on success, false on error (see getLastError)
     */
    bool decodeSubframe(int64_t* output, uint32_t block_size,
                        uint32_t bit_depth, bool is_side_channel);

    FLACError getLastError() const { return m_last_error; }

    /**
     * Header of the most recently parsed subframe
     */
    const SubframeHeader& getLastHeader() const { return m_last_header; }

private:
    BitstreamReader* m_reader;              // Bitstream reader
    ResidualDecoder* m_residual;            // Residual decoder
    SampleReconstructor* m_reconstructor;   // Predictor restoration
    FLACError m_last_error;
    SubframeHeader m_last_header;

    bool parseSubframeHeader(SubframeHeader& header, uint32_t frame_bit_depth,
                             bool is_side_channel);

    bool decodeConstant(int64_t* output, uint32_t block_size,
                        const SubframeHeader& header);
    bool decodeVerbatim(int64_t* output, uint32_t block_size,
                        const SubframeHeader& header);
    bool decodeFixed(int64_t* output, uint32_t block_size,
                     const SubframeHeader& header);
    bool decodeLPC(int64_t* output, uint32_t block_size,
                   const SubframeHeader& header);

    bool readWarmup(int64_t* output, const SubframeHeader& header);

    bool fail(FLACError error, const char* message);
    bool readerFailed();
};

} // namespace FLAC
} // namespace FlacDec

#endif // SUBFRAME_DECODER_H
