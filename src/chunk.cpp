#include <pngmsg/chunk.hpp>
#include "byte_io.hpp"
#include "crc.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace pngmsg {

namespace {

constexpr std::size_t TYPE_OFFSET = chunk::LENGTH_SIZE;
constexpr std::size_t DATA_OFFSET = chunk::LENGTH_SIZE + chunk::TYPE_SIZE;

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool is_valid_utf8(std::span<const std::uint8_t> data) noexcept {
    std::size_t i = 0;
    const std::size_t n = data.size();

    while (i < n) {
        const std::uint8_t lead = data[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead == 0xE0) {
            extra = 2;
            lo = 0xA0;
        } else if (lead >= 0xE1 && lead <= 0xEC) {
            extra = 2;
        } else if (lead == 0xED) {
            extra = 2;
            hi = 0x9F;
        } else if (lead >= 0xEE && lead <= 0xEF) {
            extra = 2;
        } else if (lead == 0xF0) {
            extra = 3;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            extra = 3;
        } else if (lead == 0xF4) {
            extra = 3;
            hi = 0x8F;
        } else {
            return false;
        }

        if (n - i - 1 < extra) {
            return false;
        }

        // Only the first continuation byte has a narrowed range
        const std::uint8_t second = data[i + 1];
        if (second < lo || second > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= extra; ++k) {
            const std::uint8_t cont = data[i + k];
            if (cont < 0x80 || cont > 0xBF) {
                return false;
            }
        }

        i += extra + 1;
    }

    return true;
}

inline std::uint32_t effective_max_length(const parse_options& options) noexcept {
    return options.max_chunk_length > 0 ? options.max_chunk_length : DEFAULT_MAX_CHUNK_LENGTH;
}

} // namespace

chunk::chunk()
    : crc_(compute_crc(type_.bytes(), {})) {
}

chunk::chunk(const chunk_type& type, std::vector<std::uint8_t> data)
    : type_(type),
      data_(std::move(data)),
      crc_(compute_crc(type_.bytes(), data_)) {
}

chunk_result chunk::create(const chunk_type& type,
                           std::vector<std::uint8_t> data,
                           chunk& out,
                           const parse_options& options) {
    if (data.size() > effective_max_length(options)) {
        return chunk_result::failure(chunk_error::length_exceeded,
            "Chunk payload of " + std::to_string(data.size()) + " bytes exceeds limit");
    }

    out = chunk(type, std::move(data));
    return chunk_result::success();
}

chunk_result chunk::parse(std::span<const std::uint8_t> data,
                          chunk& out,
                          const parse_options& options) {
    if (data.size() < FRAMING_SIZE) {
        return chunk_result::failure(chunk_error::truncated_data,
            "Chunk too small: " + std::to_string(data.size()) + " bytes");
    }

    const std::uint32_t length = read_be32(data.data());

    if (length > effective_max_length(options)) {
        return chunk_result::failure(chunk_error::length_exceeded,
            "Chunk length " + std::to_string(length) + " exceeds limit");
    }

    // Check against the remaining buffer before trusting the length
    if (length > data.size() - FRAMING_SIZE) {
        return chunk_result::failure(chunk_error::truncated_data,
            "Chunk declares " + std::to_string(length) + " payload bytes, only " +
            std::to_string(data.size() - FRAMING_SIZE) + " available");
    }

    chunk_type::bytes_type type_bytes{};
    std::copy_n(data.begin() + TYPE_OFFSET, TYPE_SIZE, type_bytes.begin());

    const auto payload = data.subspan(DATA_OFFSET, length);
    const std::uint32_t stored_crc = read_be32(data.data() + DATA_OFFSET + length);

    if (options.verify_crc) {
        // Type code and payload are contiguous in the input; hash them in place
        const std::uint32_t computed_crc = compute_crc(data.subspan(TYPE_OFFSET, TYPE_SIZE + length));
        if (computed_crc != stored_crc) {
            return chunk_result::crc_failure(stored_crc, computed_crc,
                "CRC mismatch in chunk " + chunk_type(type_bytes).to_string());
        }
    }

    out.type_ = chunk_type(type_bytes);
    out.data_.assign(payload.begin(), payload.end());
    out.crc_ = stored_crc;

    return chunk_result::success();
}

std::vector<std::uint8_t> chunk::encode() const {
    std::vector<std::uint8_t> out;
    out.reserve(encoded_size());
    encode_to(out);
    return out;
}

void chunk::encode_to(std::vector<std::uint8_t>& out) const {
    append_be32(out, length());
    out.insert(out.end(), type_.bytes().begin(), type_.bytes().end());
    out.insert(out.end(), data_.begin(), data_.end());
    append_be32(out, crc_);
}

chunk_result chunk::data_as_text(std::string& out) const {
    if (!is_valid_utf8(data_)) {
        return chunk_result::failure(chunk_error::invalid_utf8,
            "Chunk " + type_.to_string() + " payload is not valid UTF-8");
    }

    out.assign(data_.begin(), data_.end());
    return chunk_result::success();
}

std::string chunk::describe() const {
    char crc_text[11];
    std::snprintf(crc_text, sizeof(crc_text), "0x%08X", static_cast<unsigned>(crc_));

    return type_.to_string() + " length=" + std::to_string(length()) + " crc=" + crc_text;
}

} // namespace pngmsg
