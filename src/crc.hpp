#pragma once

#include <pngmsg/chunk_type.hpp>

#include <cstdint>
#include <span>

namespace pngmsg {

// CRC-32 (ISO-HDLC) over a contiguous type code + payload region, as it
// appears on the wire. Used in place when verifying a parsed chunk.
std::uint32_t compute_crc(std::span<const std::uint8_t> type_and_payload);

// Same CRC for a type code and payload held separately (chunk construction).
std::uint32_t compute_crc(const chunk_type::bytes_type& type_bytes,
                          std::span<const std::uint8_t> payload);

} // namespace pngmsg
