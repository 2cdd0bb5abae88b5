#include "crc.hpp"
#include <lodepng.h>

#include <vector>

namespace pngmsg {

std::uint32_t compute_crc(std::span<const std::uint8_t> type_and_payload) {
    return static_cast<std::uint32_t>(lodepng_crc32(type_and_payload.data(), type_and_payload.size()));
}

std::uint32_t compute_crc(const chunk_type::bytes_type& type_bytes,
                          std::span<const std::uint8_t> payload) {
    // lodepng_crc32 has no incremental form, so hash one contiguous buffer
    std::vector<std::uint8_t> buf;
    buf.reserve(type_bytes.size() + payload.size());
    buf.insert(buf.end(), type_bytes.begin(), type_bytes.end());
    buf.insert(buf.end(), payload.begin(), payload.end());

    return compute_crc(buf);
}

} // namespace pngmsg
