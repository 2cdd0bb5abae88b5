#ifndef PNGMSG_CHUNK_HPP_
#define PNGMSG_CHUNK_HPP_

#include <pngmsg/pngmsg_export.h>
#include <pngmsg/types.hpp>
#include <pngmsg/chunk_type.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pngmsg {

// ============================================================================
// Chunk
// ============================================================================

/**
 * A single length-framed PNG chunk.
 *
 * Wire layout:
 *   [4] length (big-endian, payload size only)
 *   [4] type code
 *   [length] payload
 *   [4] CRC-32 over type code + payload (big-endian)
 */
class PNGMSG_EXPORT chunk {
public:
    static constexpr std::size_t LENGTH_SIZE = 4;
    static constexpr std::size_t TYPE_SIZE = chunk_type::size;
    static constexpr std::size_t CRC_SIZE = 4;
    static constexpr std::size_t FRAMING_SIZE = LENGTH_SIZE + TYPE_SIZE + CRC_SIZE;

    // All-zero type code, empty payload, matching CRC
    chunk();

    /**
     * Build a chunk from a type code and payload, computing its CRC.
     * The payload must not exceed DEFAULT_MAX_CHUNK_LENGTH bytes;
     * use create() when the size is not known to fit.
     */
    chunk(const chunk_type& type, std::vector<std::uint8_t> data);

    /**
     * Build a chunk, rejecting payloads longer than options.max_chunk_length.
     * @param type Type code
     * @param data Payload
     * @param out Receives the chunk on success
     * @param options Parse options (only max_chunk_length is used)
     * @return length_exceeded if the payload is too long
     */
    [[nodiscard]] static chunk_result create(const chunk_type& type,
                                             std::vector<std::uint8_t> data,
                                             chunk& out,
                                             const parse_options& options = {});

    /**
     * Decode the chunk starting at offset 0 of data.
     * Trailing bytes after the chunk are ignored.
     * @param data Buffer holding at least one framed chunk
     * @param out Receives the chunk on success
     * @param options Parse options
     * @return truncated_data, length_exceeded or crc_mismatch on failure
     */
    [[nodiscard]] static chunk_result parse(std::span<const std::uint8_t> data,
                                            chunk& out,
                                            const parse_options& options = {});

    /**
     * Serialize to the wire layout. Exact inverse of parse().
     */
    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    /**
     * Append the wire layout to out.
     */
    void encode_to(std::vector<std::uint8_t>& out) const;

    /**
     * Interpret the payload as UTF-8 text.
     * @return invalid_utf8 if the payload is not well-formed UTF-8
     */
    [[nodiscard]] chunk_result data_as_text(std::string& out) const;

    [[nodiscard]] std::uint32_t length() const noexcept {
        return static_cast<std::uint32_t>(data_.size());
    }

    [[nodiscard]] const chunk_type& type() const noexcept { return type_; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }
    [[nodiscard]] std::uint32_t crc() const noexcept { return crc_; }

    // Bytes occupied on the wire (framing + payload)
    [[nodiscard]] std::size_t encoded_size() const noexcept {
        return FRAMING_SIZE + data_.size();
    }

    // One line summary: type, length and CRC
    [[nodiscard]] std::string describe() const;

private:
    chunk_type type_;
    std::vector<std::uint8_t> data_;
    std::uint32_t crc_;
};

} // namespace pngmsg

#endif // PNGMSG_CHUNK_HPP_
