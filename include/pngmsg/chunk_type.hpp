#ifndef PNGMSG_CHUNK_TYPE_HPP_
#define PNGMSG_CHUNK_TYPE_HPP_

#include <pngmsg/pngmsg_export.h>
#include <pngmsg/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pngmsg {

// ============================================================================
// Chunk Type Code
// ============================================================================

/**
 * Four byte chunk type code.
 * The case of each letter carries one property bit (bit 5 of the byte):
 *   byte 0 - ancillary bit  (uppercase = critical)
 *   byte 1 - private bit    (uppercase = public)
 *   byte 2 - reserved bit   (must be uppercase)
 *   byte 3 - safe-to-copy   (lowercase = safe to copy)
 */
class PNGMSG_EXPORT chunk_type {
public:
    static constexpr std::size_t size = 4;
    using bytes_type = std::array<std::uint8_t, size>;

    chunk_type() = default;

    /**
     * Wrap raw type bytes without validation.
     * Used by the chunk decoder, which accepts any type bytes structurally;
     * use is_valid() to query the result.
     */
    explicit chunk_type(const bytes_type& bytes) noexcept
        : bytes_(bytes) {}

    /**
     * Create a type code from four bytes.
     * @param bytes Raw type bytes
     * @param out Receives the type code on success
     * @return invalid_type_code if any byte is not an ASCII letter
     */
    [[nodiscard]] static chunk_result from_bytes(const bytes_type& bytes, chunk_type& out);

    /**
     * Create a type code from a four character string.
     * @param text Type code text, e.g. "ruSt"
     * @param out Receives the type code on success
     * @return invalid_type_code if text is not exactly four ASCII letters
     */
    [[nodiscard]] static chunk_result from_string(std::string_view text, chunk_type& out);

    [[nodiscard]] const bytes_type& bytes() const noexcept { return bytes_; }
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_critical() const noexcept;
    [[nodiscard]] bool is_public() const noexcept;
    [[nodiscard]] bool is_reserved_bit_valid() const noexcept;
    [[nodiscard]] bool is_safe_to_copy() const noexcept;
    [[nodiscard]] bool is_valid() const noexcept;

    /**
     * Human readable summary, e.g. "RuSt (critical, private, safe-to-copy)".
     */
    [[nodiscard]] std::string describe() const;

    friend bool operator==(const chunk_type&, const chunk_type&) = default;

private:
    bytes_type bytes_{};
};

} // namespace pngmsg

#endif // PNGMSG_CHUNK_TYPE_HPP_
