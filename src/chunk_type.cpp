#include <pngmsg/chunk_type.hpp>

namespace pngmsg {

namespace {

// Bit 5 distinguishes lowercase from uppercase ASCII letters
constexpr std::uint8_t PROPERTY_BIT = 0x20;

inline bool is_ascii_letter(std::uint8_t b) noexcept {
    return (b >= 'A' && b <= 'Z') || (b >= 'a' && b <= 'z');
}

inline bool is_upper(std::uint8_t b) noexcept {
    return (b & PROPERTY_BIT) == 0;
}

} // namespace

chunk_result chunk_type::from_bytes(const bytes_type& bytes, chunk_type& out) {
    for (std::uint8_t b : bytes) {
        if (!is_ascii_letter(b)) {
            return chunk_result::failure(chunk_error::invalid_type_code,
                "Chunk type bytes must be ASCII letters (A-Z, a-z)");
        }
    }

    out = chunk_type(bytes);
    return chunk_result::success();
}

chunk_result chunk_type::from_string(std::string_view text, chunk_type& out) {
    if (text.size() != size) {
        return chunk_result::failure(chunk_error::invalid_type_code,
            "Chunk type must be exactly 4 characters, got " + std::to_string(text.size()));
    }

    bytes_type bytes{};
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::uint8_t>(text[i]);
    }

    return from_bytes(bytes, out);
}

std::string chunk_type::to_string() const {
    return std::string(bytes_.begin(), bytes_.end());
}

bool chunk_type::is_critical() const noexcept {
    return is_upper(bytes_[0]);
}

bool chunk_type::is_public() const noexcept {
    return is_upper(bytes_[1]);
}

bool chunk_type::is_reserved_bit_valid() const noexcept {
    return is_upper(bytes_[2]);
}

bool chunk_type::is_safe_to_copy() const noexcept {
    return !is_upper(bytes_[3]);
}

bool chunk_type::is_valid() const noexcept {
    if (!is_reserved_bit_valid()) {
        return false;
    }

    for (std::uint8_t b : bytes_) {
        if (!is_ascii_letter(b)) {
            return false;
        }
    }

    return true;
}

std::string chunk_type::describe() const {
    std::string result = to_string();
    result += is_critical() ? " (critical, " : " (ancillary, ";
    result += is_public() ? "public, " : "private, ";
    result += is_safe_to_copy() ? "safe-to-copy" : "unsafe-to-copy";
    if (!is_valid()) {
        result += ", invalid";
    }
    result += ")";
    return result;
}

} // namespace pngmsg
