#include <doctest/doctest.h>
#include <pngmsg/pngmsg.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view SAMPLE_MESSAGE = "This is where your secret message will be!";
constexpr std::uint32_t SAMPLE_CRC = 2882656334u;

void append_be32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

std::vector<std::uint8_t> frame(std::uint32_t length, std::string_view type,
                                std::string_view payload, std::uint32_t crc) {
    std::vector<std::uint8_t> out;
    append_be32(out, length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), payload.begin(), payload.end());
    append_be32(out, crc);
    return out;
}

pngmsg::chunk make_chunk(const char* type_text, std::string_view payload) {
    pngmsg::chunk_type type;
    REQUIRE(pngmsg::chunk_type::from_string(type_text, type).ok);
    return pngmsg::chunk(type, std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

} // namespace

TEST_CASE("Chunk: construction") {
    const auto c = make_chunk("RuSt", SAMPLE_MESSAGE);

    CHECK(c.length() == 42);
    CHECK(c.crc() == SAMPLE_CRC);
    CHECK(c.type().to_string() == "RuSt");
    CHECK(c.encoded_size() == 54);

    SUBCASE("Default chunk has a matching CRC") {
        const pngmsg::chunk empty;
        CHECK(empty.length() == 0);
        CHECK(empty.crc() == 0x2144DF1Cu);

        pngmsg::chunk parsed;
        REQUIRE(pngmsg::chunk::parse(empty.encode(), parsed).ok);
        CHECK(parsed.crc() == empty.crc());
    }

    SUBCASE("Empty payload") {
        const auto end = make_chunk("IEND", "");
        CHECK(end.length() == 0);
        CHECK(end.crc() == 0xAE426082u);
    }
}

TEST_CASE("Chunk: checked construction") {
    pngmsg::chunk_type type;
    REQUIRE(pngmsg::chunk_type::from_string("ruSt", type).ok);

    SUBCASE("Within the limit") {
        pngmsg::chunk c;
        REQUIRE(pngmsg::chunk::create(type, {'h', 'e', 'l', 'l', 'o'}, c).ok);
        CHECK(c.length() == 5);
        CHECK(c.crc() == 0xAE508D6Fu);
    }

    SUBCASE("Payload longer than the limit") {
        pngmsg::parse_options options;
        options.max_chunk_length = 4;

        pngmsg::chunk c = make_chunk("IEND", "");
        auto result = pngmsg::chunk::create(type, {'h', 'e', 'l', 'l', 'o'}, c, options);
        CHECK(result.error == pngmsg::chunk_error::length_exceeded);
        CHECK(c.type().to_string() == "IEND");

        // Anything create() accepts parses back under the same limit
        REQUIRE(pngmsg::chunk::create(type, {'h', 'e', 'l', 'l'}, c, options).ok);
        pngmsg::chunk parsed;
        CHECK(pngmsg::chunk::parse(c.encode(), parsed, options).ok);
    }
}

TEST_CASE("Chunk: parse") {
    SUBCASE("Valid chunk") {
        const auto bytes = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC);

        pngmsg::chunk c;
        auto result = pngmsg::chunk::parse(bytes, c);
        REQUIRE(result.ok);
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.crc() == SAMPLE_CRC);

        std::string text;
        REQUIRE(c.data_as_text(text).ok);
        CHECK(text == SAMPLE_MESSAGE);
    }

    SUBCASE("Trailing bytes are ignored") {
        auto bytes = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC);
        bytes.push_back(0xFF);
        bytes.push_back(0xEE);

        pngmsg::chunk c;
        REQUIRE(pngmsg::chunk::parse(bytes, c).ok);
        CHECK(c.encoded_size() == bytes.size() - 2);
    }

    SUBCASE("CRC mismatch") {
        const auto bytes = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC - 1);

        pngmsg::chunk c;
        auto result = pngmsg::chunk::parse(bytes, c);
        CHECK_FALSE(result.ok);
        CHECK(result.error == pngmsg::chunk_error::crc_mismatch);
        CHECK(result.expected_crc == SAMPLE_CRC - 1);
        CHECK(result.actual_crc == SAMPLE_CRC);
    }

    SUBCASE("CRC check can be disabled") {
        const auto bytes = frame(42, "RuSt", SAMPLE_MESSAGE, 0x12345678u);

        pngmsg::parse_options options;
        options.verify_crc = false;

        pngmsg::chunk c;
        REQUIRE(pngmsg::chunk::parse(bytes, c, options).ok);
        CHECK(c.crc() == 0x12345678u);
        CHECK(c.encode() == bytes);
    }

    SUBCASE("Large payload") {
        std::vector<std::uint8_t> payload(1u << 20);
        for (std::size_t i = 0; i < payload.size(); ++i) {
            payload[i] = static_cast<std::uint8_t>(i * 31u);
        }
        pngmsg::chunk_type type;
        REQUIRE(pngmsg::chunk_type::from_string("IDAT", type).ok);
        const pngmsg::chunk original(type, payload);
        const auto bytes = original.encode();

        pngmsg::chunk c;
        REQUIRE(pngmsg::chunk::parse(bytes, c).ok);
        CHECK(c.crc() == original.crc());
        CHECK(c.length() == payload.size());
        CHECK(c.encode() == bytes);

        auto damaged = bytes;
        damaged[damaged.size() / 2] ^= 0x80;
        CHECK(pngmsg::chunk::parse(damaged, c).error == pngmsg::chunk_error::crc_mismatch);
    }

    SUBCASE("Shorter than framing") {
        const std::vector<std::uint8_t> bytes = {0, 0, 0, 0, 'I', 'E', 'N', 'D', 0xAE, 0x42, 0x60};

        pngmsg::chunk c;
        CHECK(pngmsg::chunk::parse(bytes, c).error == pngmsg::chunk_error::truncated_data);
    }

    SUBCASE("Declared length overruns buffer") {
        auto bytes = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC);
        bytes.resize(bytes.size() - 1);

        pngmsg::chunk c;
        CHECK(pngmsg::chunk::parse(bytes, c).error == pngmsg::chunk_error::truncated_data);
    }

    SUBCASE("Huge declared length is not trusted") {
        const auto bytes = frame(0x7FFFFFF0u, "RuSt", "abc", 0);

        pngmsg::chunk c;
        CHECK(pngmsg::chunk::parse(bytes, c).error == pngmsg::chunk_error::truncated_data);
    }

    SUBCASE("Length above limit") {
        const auto bytes = frame(0x80000000u, "RuSt", "", 0);

        pngmsg::chunk c;
        CHECK(pngmsg::chunk::parse(bytes, c).error == pngmsg::chunk_error::length_exceeded);

        pngmsg::parse_options options;
        options.max_chunk_length = 16;
        const auto message = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC);
        CHECK(pngmsg::chunk::parse(message, c, options).error == pngmsg::chunk_error::length_exceeded);
    }

    SUBCASE("Malformed type bytes are accepted structurally") {
        const pngmsg::chunk relabeled(pngmsg::chunk_type(pngmsg::chunk_type::bytes_type{'R', '1', 'S', 't'}),
                                      std::vector<std::uint8_t>{'x'});

        pngmsg::chunk c;
        REQUIRE(pngmsg::chunk::parse(relabeled.encode(), c).ok);
        CHECK(c.type().to_string() == "R1St");
        CHECK_FALSE(c.type().is_valid());
    }
}

TEST_CASE("Chunk: encode") {
    const auto c = make_chunk("RuSt", SAMPLE_MESSAGE);
    const auto expected = frame(42, "RuSt", SAMPLE_MESSAGE, SAMPLE_CRC);

    CHECK(c.encode() == expected);

    pngmsg::chunk parsed;
    REQUIRE(pngmsg::chunk::parse(c.encode(), parsed).ok);
    CHECK(parsed.length() == c.length());
    CHECK(parsed.type() == c.type());
    CHECK(parsed.crc() == c.crc());
    CHECK(std::vector<std::uint8_t>(parsed.data().begin(), parsed.data().end()) ==
          std::vector<std::uint8_t>(c.data().begin(), c.data().end()));
}

TEST_CASE("Chunk: any flipped bit fails the CRC check") {
    const auto c = make_chunk("ruSt", "hello");
    const auto bytes = c.encode();

    // Type code and payload region
    for (std::size_t i = pngmsg::chunk::LENGTH_SIZE; i < bytes.size() - pngmsg::chunk::CRC_SIZE; ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            auto damaged = bytes;
            damaged[i] ^= static_cast<std::uint8_t>(1u << bit);

            pngmsg::chunk out;
            auto result = pngmsg::chunk::parse(damaged, out);
            INFO("byte ", i, " bit ", bit);
            CHECK(result.error == pngmsg::chunk_error::crc_mismatch);
        }
    }
}

TEST_CASE("Chunk: payload as text") {
    SUBCASE("ASCII and multi-byte UTF-8") {
        std::string text;
        REQUIRE(make_chunk("ruSt", "hello").data_as_text(text).ok);
        CHECK(text == "hello");

        REQUIRE(make_chunk("ruSt", "gr\xC3\xBC\xC3\x9F \xE2\x82\xAC \xF0\x9F\x98\x80").data_as_text(text).ok);
        CHECK(text == "gr\xC3\xBC\xC3\x9F \xE2\x82\xAC \xF0\x9F\x98\x80");
    }

    SUBCASE("Invalid UTF-8") {
        const char* samples[] = {
            "\xFF",             // invalid lead byte
            "\xC3",             // truncated sequence
            "\xC0\xAF",         // overlong
            "\xED\xA0\x80",     // surrogate
            "\xF4\x90\x80\x80", // above U+10FFFF
            "ab\x80" "cd",      // stray continuation
        };

        for (const char* sample : samples) {
            std::string text;
            auto result = make_chunk("ruSt", sample).data_as_text(text);
            INFO("sample: ", sample);
            CHECK(result.error == pngmsg::chunk_error::invalid_utf8);
        }
    }
}

TEST_CASE("Chunk: describe") {
    CHECK(make_chunk("IEND", "").describe() == "IEND length=0 crc=0xAE426082");
    CHECK(make_chunk("ruSt", "hello").describe() == "ruSt length=5 crc=0xAE508D6F");
}
