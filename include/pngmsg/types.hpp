#ifndef PNGMSG_TYPES_HPP_
#define PNGMSG_TYPES_HPP_

#include <pngmsg/pngmsg_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace pngmsg {

// ============================================================================
// Chunk Errors
// ============================================================================

enum class chunk_error {
    none,
    invalid_type_code,
    truncated_data,
    crc_mismatch,
    bad_signature,
    not_found,
    invalid_utf8,
    length_exceeded
};

[[nodiscard]] PNGMSG_EXPORT const char* to_string(chunk_error err) noexcept;

// ============================================================================
// Chunk Result
// ============================================================================

struct chunk_result {
    bool ok = false;
    chunk_error error = chunk_error::none;
    std::string message;

    // Only set for chunk_error::crc_mismatch.
    // expected_crc is the value stored in the stream, actual_crc the value
    // recomputed over the type code and payload.
    std::uint32_t expected_crc = 0;
    std::uint32_t actual_crc = 0;

    [[nodiscard]] static chunk_result success() {
        return {true, chunk_error::none, {}};
    }

    [[nodiscard]] static chunk_result failure(chunk_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    [[nodiscard]] static chunk_result crc_failure(std::uint32_t expected, std::uint32_t actual,
                                                  std::string msg = {}) {
        return {false, chunk_error::crc_mismatch, std::move(msg), expected, actual};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Parse Options
// ============================================================================

// Largest chunk length allowed by the PNG format (2^31 - 1)
constexpr std::uint32_t DEFAULT_MAX_CHUNK_LENGTH = 0x7FFFFFFFu;

struct parse_options {
    // Maximum accepted declared chunk length (0 = use default)
    std::uint32_t max_chunk_length = DEFAULT_MAX_CHUNK_LENGTH;

    // Reject chunks whose stored CRC does not match their contents
    bool verify_crc = true;

    // Maximum number of chunks in a file (0 = unlimited)
    std::size_t max_chunks = 0;
};

} // namespace pngmsg

#endif // PNGMSG_TYPES_HPP_
