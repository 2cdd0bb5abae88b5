#ifndef PNGMSG_PNG_FILE_HPP_
#define PNGMSG_PNG_FILE_HPP_

#include <pngmsg/pngmsg_export.h>
#include <pngmsg/types.hpp>
#include <pngmsg/chunk.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace pngmsg {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
inline constexpr std::array<std::uint8_t, 8> PNG_SIGNATURE = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

// ============================================================================
// PNG File
// ============================================================================

/**
 * PNG container: the file signature followed by an ordered chunk list.
 * Chunk payloads are treated as opaque bytes; no image decoding and no
 * ordering rules (IHDR first, IEND last) are enforced.
 */
class PNGMSG_EXPORT png_file {
public:
    png_file() = default;
    explicit png_file(std::vector<chunk> chunks)
        : chunks_(std::move(chunks)) {}

    [[nodiscard]] static constexpr const std::array<std::uint8_t, 8>& signature() noexcept {
        return PNG_SIGNATURE;
    }

    /**
     * Check if data starts with the PNG signature.
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Split a complete PNG file into chunks.
     * @param data Raw file data
     * @param out Receives the container on success
     * @param options Parse options
     * @return bad_signature, truncated_data, length_exceeded or crc_mismatch on failure
     */
    [[nodiscard]] static chunk_result parse(std::span<const std::uint8_t> data,
                                            png_file& out,
                                            const parse_options& options = {});

    /**
     * Serialize signature and chunks. Reproduces the parsed input exactly.
     */
    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    /**
     * Append a chunk after the last one. No reordering is performed.
     */
    void append(chunk c);

    /**
     * Insert a chunk before the first IEND chunk, or append if there is none.
     */
    void insert_before_end(chunk c);

    /**
     * First chunk whose type code equals code, or nullptr.
     */
    [[nodiscard]] const chunk* find_by_type(std::string_view code) const noexcept;

    [[nodiscard]] std::vector<const chunk*> find_all_by_type(std::string_view code) const;

    /**
     * Remove the first chunk whose type code equals code.
     * Order of the remaining chunks is preserved.
     * @param code Type code text
     * @param removed Receives the removed chunk on success
     * @return not_found if no chunk has that type code
     */
    [[nodiscard]] chunk_result remove_by_type(std::string_view code, chunk& removed);

    [[nodiscard]] std::span<const chunk> chunks() const noexcept { return chunks_; }
    [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks_.size(); }

private:
    std::vector<chunk> chunks_;
};

} // namespace pngmsg

#endif // PNGMSG_PNG_FILE_HPP_
