#ifndef PNGMSG_MESSAGE_HPP_
#define PNGMSG_MESSAGE_HPP_

#include <pngmsg/pngmsg_export.h>
#include <pngmsg/types.hpp>
#include <pngmsg/png_file.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace pngmsg {

// ============================================================================
// Message Operations
// ============================================================================

/**
 * Hide a text message in a new chunk appended to the file.
 * @param file Target container
 * @param type_code Chunk type code text, e.g. "ruSt"
 * @param message Message text stored verbatim as the payload
 * @return invalid_type_code or length_exceeded on failure
 */
[[nodiscard]] PNGMSG_EXPORT chunk_result encode_message(png_file& file,
                                                         std::string_view type_code,
                                                         std::string_view message);

/**
 * Read the message stored in the first chunk of the given type.
 * A missing chunk is not an error: found is set to false.
 * @param file Source container
 * @param type_code Chunk type code text
 * @param out Receives the message text
 * @param found Set to true if a chunk of that type exists
 * @return invalid_utf8 if the chunk payload is not text
 */
[[nodiscard]] PNGMSG_EXPORT chunk_result decode_message(const png_file& file,
                                                         std::string_view type_code,
                                                         std::string& out,
                                                         bool& found);

/**
 * Remove the first chunk of the given type.
 * @return not_found if there is no such chunk
 */
[[nodiscard]] PNGMSG_EXPORT chunk_result remove_message(png_file& file,
                                                         std::string_view type_code);

/**
 * One describe() line per chunk, in file order.
 */
[[nodiscard]] PNGMSG_EXPORT std::vector<std::string> list_chunks(const png_file& file);

} // namespace pngmsg

#endif // PNGMSG_MESSAGE_HPP_
