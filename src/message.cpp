#include <pngmsg/message.hpp>

#include <utility>

namespace pngmsg {

chunk_result encode_message(png_file& file, std::string_view type_code, std::string_view message) {
    chunk_type type;
    auto result = chunk_type::from_string(type_code, type);
    if (!result) return result;

    chunk c;
    result = chunk::create(type, std::vector<std::uint8_t>(message.begin(), message.end()), c);
    if (!result) return result;

    file.append(std::move(c));
    return chunk_result::success();
}

chunk_result decode_message(const png_file& file,
                            std::string_view type_code,
                            std::string& out,
                            bool& found) {
    found = false;

    const chunk* c = file.find_by_type(type_code);
    if (c == nullptr) {
        return chunk_result::success();
    }

    found = true;
    return c->data_as_text(out);
}

chunk_result remove_message(png_file& file, std::string_view type_code) {
    chunk removed;
    return file.remove_by_type(type_code, removed);
}

std::vector<std::string> list_chunks(const png_file& file) {
    std::vector<std::string> lines;
    lines.reserve(file.chunk_count());
    for (const auto& c : file.chunks()) {
        lines.push_back(c.describe());
    }
    return lines;
}

} // namespace pngmsg
