#include <pngmsg/png_file.hpp>

#include <algorithm>
#include <string>

namespace pngmsg {

namespace {

constexpr std::size_t PNG_SIGNATURE_SIZE = PNG_SIGNATURE.size();
constexpr std::string_view END_CHUNK_TYPE = "IEND";

inline bool type_matches(const chunk& c, std::string_view code) noexcept {
    const auto& bytes = c.type().bytes();
    if (code.size() != bytes.size()) {
        return false;
    }
    return std::equal(bytes.begin(), bytes.end(), code.begin(),
                      [](std::uint8_t b, char ch) { return b == static_cast<std::uint8_t>(ch); });
}

} // namespace

bool png_file::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }

    return std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), data.begin());
}

chunk_result png_file::parse(std::span<const std::uint8_t> data,
                             png_file& out,
                             const parse_options& options) {
    if (!sniff(data)) {
        return chunk_result::failure(chunk_error::bad_signature, "Not a valid PNG file");
    }

    std::vector<chunk> chunks;
    std::size_t offset = PNG_SIGNATURE_SIZE;

    while (offset < data.size()) {
        if (options.max_chunks > 0 && chunks.size() >= options.max_chunks) {
            return chunk_result::failure(chunk_error::length_exceeded,
                "PNG file has more than " + std::to_string(options.max_chunks) + " chunks");
        }

        chunk c;
        auto result = chunk::parse(data.subspan(offset), c, options);
        if (!result) {
            result.message += " (chunk " + std::to_string(chunks.size()) +
                              " at offset " + std::to_string(offset) + ")";
            return result;
        }

        offset += c.encoded_size();
        chunks.push_back(std::move(c));
    }

    out.chunks_ = std::move(chunks);
    return chunk_result::success();
}

std::vector<std::uint8_t> png_file::encode() const {
    std::size_t total = PNG_SIGNATURE_SIZE;
    for (const auto& c : chunks_) {
        total += c.encoded_size();
    }

    std::vector<std::uint8_t> out;
    out.reserve(total);
    out.insert(out.end(), PNG_SIGNATURE.begin(), PNG_SIGNATURE.end());
    for (const auto& c : chunks_) {
        c.encode_to(out);
    }

    return out;
}

void png_file::append(chunk c) {
    chunks_.push_back(std::move(c));
}

void png_file::insert_before_end(chunk c) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [](const chunk& existing) { return type_matches(existing, END_CHUNK_TYPE); });
    chunks_.insert(it, std::move(c));
}

const chunk* png_file::find_by_type(std::string_view code) const noexcept {
    for (const auto& c : chunks_) {
        if (type_matches(c, code)) {
            return &c;
        }
    }
    return nullptr;
}

std::vector<const chunk*> png_file::find_all_by_type(std::string_view code) const {
    std::vector<const chunk*> matches;
    for (const auto& c : chunks_) {
        if (type_matches(c, code)) {
            matches.push_back(&c);
        }
    }
    return matches;
}

chunk_result png_file::remove_by_type(std::string_view code, chunk& removed) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [code](const chunk& c) { return type_matches(c, code); });
    if (it == chunks_.end()) {
        return chunk_result::failure(chunk_error::not_found,
            "No chunk of type " + std::string(code));
    }

    removed = std::move(*it);
    chunks_.erase(it);
    return chunk_result::success();
}

} // namespace pngmsg
