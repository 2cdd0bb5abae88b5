#include <pngmsg/types.hpp>

namespace pngmsg {

const char* to_string(chunk_error err) noexcept {
    switch (err) {
        case chunk_error::none:              return "none";
        case chunk_error::invalid_type_code: return "invalid_type_code";
        case chunk_error::truncated_data:    return "truncated_data";
        case chunk_error::crc_mismatch:      return "crc_mismatch";
        case chunk_error::bad_signature:     return "bad_signature";
        case chunk_error::not_found:         return "not_found";
        case chunk_error::invalid_utf8:      return "invalid_utf8";
        case chunk_error::length_exceeded:   return "length_exceeded";
    }
    return "unknown";
}

} // namespace pngmsg
