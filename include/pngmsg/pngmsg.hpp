#ifndef PNGMSG_PNGMSG_HPP_
#define PNGMSG_PNGMSG_HPP_

#include <pngmsg/pngmsg_export.h>
#include <pngmsg/types.hpp>
#include <pngmsg/chunk_type.hpp>
#include <pngmsg/chunk.hpp>
#include <pngmsg/png_file.hpp>
#include <pngmsg/message.hpp>

namespace pngmsg {

// All public API is included via the headers above.
// See:
//   - types.hpp:      chunk_error, chunk_result, parse_options
//   - chunk_type.hpp: chunk_type (four letter type code and its property bits)
//   - chunk.hpp:      chunk (length framing, CRC-32)
//   - png_file.hpp:   png_file (signature + ordered chunk list)
//   - message.hpp:    encode/decode/remove/list helpers for hidden messages

} // namespace pngmsg

#endif // PNGMSG_PNGMSG_HPP_
