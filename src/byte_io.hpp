#pragma once

#include <cstdint>
#include <vector>

namespace pngmsg {

// Big-endian reader
inline std::uint32_t read_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

// Big-endian writers
inline void write_be32(std::uint8_t* p, std::uint32_t value) {
    p[0] = static_cast<std::uint8_t>(value >> 24);
    p[1] = static_cast<std::uint8_t>(value >> 16);
    p[2] = static_cast<std::uint8_t>(value >> 8);
    p[3] = static_cast<std::uint8_t>(value);
}

inline void append_be32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    std::uint8_t buf[4];
    write_be32(buf, value);
    out.insert(out.end(), buf, buf + 4);
}

} // namespace pngmsg
