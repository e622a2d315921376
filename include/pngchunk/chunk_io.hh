/**
 * @file chunk_io.hh
 * @brief Reading and writing single chunk frames on standard streams
 *
 * These functions handle one frame at a time. Walking the chunk sequence
 * of a whole file (signature, ordering, IEND) is left to the caller.
 */

#pragma once

#include <iosfwd>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief Read one chunk frame from the current stream position
     *
     * The frame is validated exactly like chunk::parse. On success the
     * stream is positioned right after the frame's CRC.
     *
     * @param stream Input stream
     * @param options Strictness, length limit and warning handler
     * @return The decoded chunk
     * @throws io_error if the stream ends before the frame is complete
     * @throws invalid_chunk_error if the frame is malformed
     * @throws crc_mismatch_error if the stored CRC is wrong (strict mode)
     */
    PNGCHUNK_EXPORT chunk read_chunk(std::istream& stream, const parse_options& options);

    /**
     * @brief Read one chunk frame with default options
     */
    PNGCHUNK_EXPORT chunk read_chunk(std::istream& stream);

    /**
     * @brief Write the frame of a chunk
     * @throws io_error if the stream fails
     */
    PNGCHUNK_EXPORT void write_chunk(std::ostream& stream, const chunk& c);

} // namespace pngchunk
