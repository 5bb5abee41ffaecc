#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <slotingest/components/io/content_decoder.h>
#include <slotingest/core/common/errors.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../testing_utilities.h"

using namespace slotingest;
using namespace slotingest::components::io;
using namespace slotingest_test;

namespace {

std::vector<std::string> collect(lines::DecodedLineRange range) {
    std::vector<std::string> out;
    while (range.has_next()) {
        out.push_back(range.next().content);
    }
    return out;
}

RawData as_raw(const CompressedData& compressed) {
    return RawData(compressed.data);
}

}  // namespace

TEST_CASE("ContentDecoder - gzip is transparent") {
    ContentDecoder decoder;
    std::string text = make_lines("20161201", 5);

    auto plain = collect(decoder.decode(RawData(text)));
    auto inflated =
        collect(decoder.decode(as_raw(TestEnvironment::gzip_bytes(text))));

    REQUIRE(plain.size() == 5);
    CHECK(plain.front() == "LINE 001 - 20161201");
    CHECK(plain.back() == "LINE 005 - 20161201");
    CHECK(inflated == plain);

    SUBCASE("Large content spans several read buffers") {
        std::string big = make_lines("20161202", 20000);
        auto big_plain = collect(decoder.decode(RawData(big)));
        auto big_inflated =
            collect(decoder.decode(as_raw(TestEnvironment::gzip_bytes(big))));
        CHECK(big_plain.size() == 20000);
        CHECK(big_inflated == big_plain);
    }

    SUBCASE("Concatenated gzip members") {
        auto first = TestEnvironment::gzip_bytes("a\nb\n");
        auto second = TestEnvironment::gzip_bytes("c\n");
        std::vector<unsigned char> both = first.data;
        both.insert(both.end(), second.data.begin(), second.data.end());
        CHECK(collect(decoder.decode(RawData(both))) ==
              std::vector<std::string>{"a", "b", "c"});
    }
}

TEST_CASE("ContentDecoder - line splitting") {
    ContentDecoder decoder;

    SUBCASE("Final line without terminator") {
        CHECK(collect(decoder.decode(RawData(std::string("one\ntwo")))) ==
              std::vector<std::string>{"one", "two"});
    }

    SUBCASE("CRLF and lone CR") {
        CHECK(collect(decoder.decode(RawData(std::string("a\r\nb\rc\n")))) ==
              std::vector<std::string>{"a", "b", "c"});
    }

    SUBCASE("Empty lines are kept") {
        CHECK(collect(decoder.decode(RawData(std::string("\n\nx\n")))) ==
              std::vector<std::string>{"", "", "x"});
    }

    SUBCASE("Empty content yields nothing") {
        auto range = decoder.decode(RawData());
        CHECK_FALSE(range.has_next());
        CHECK_FALSE(range.is_open());
        CHECK_THROWS_AS(range.next(), std::out_of_range);
    }

    SUBCASE("Counters") {
        auto range = decoder.decode(RawData(std::string("ab\r\ncd\ne")));
        while (range.has_next()) {
            range.next();
        }
        CHECK(range.lines_read() == 3);
        CHECK(range.bytes_consumed() == 8);
        CHECK_FALSE(range.is_open());
    }

    SUBCASE("Line numbers") {
        auto range = decoder.decode(RawData(std::string("x\ny\n")));
        CHECK(range.next().line_number == 1);
        CHECK(range.next().line_number == 2);
    }

    SUBCASE("Close releases the source early") {
        auto range = decoder.decode(RawData(std::string("x\ny\n")));
        REQUIRE(range.has_next());
        range.close();
        CHECK_FALSE(range.has_next());
        CHECK_FALSE(range.is_open());
    }
}

TEST_CASE("ContentDecoder - probing short or odd content") {
    ContentDecoder decoder;

    SUBCASE("Single byte is read as plain text") {
        CHECK(collect(decoder.decode(RawData(std::string("z")))) ==
              std::vector<std::string>{"z"});
    }

    SUBCASE("Only the first magic byte") {
        std::vector<unsigned char> bytes{0x1f, 'a', '\n'};
        CHECK_FALSE(ContentDecoder::is_gzip(RawData(bytes)));
        CHECK(collect(decoder.decode(RawData(bytes))).size() == 1);
    }

    SUBCASE("Magic detection") {
        CHECK(ContentDecoder::is_gzip(
            as_raw(TestEnvironment::gzip_bytes("hello"))));
        CHECK_FALSE(ContentDecoder::is_gzip(RawData(std::string("hello"))));
        CHECK_FALSE(ContentDecoder::is_gzip(RawData()));
    }
}

TEST_CASE("ContentDecoder - malformed gzip") {
    ContentDecoder decoder;
    auto compressed = TestEnvironment::gzip_bytes(make_lines("x", 100));

    SUBCASE("Corrupt body") {
        std::vector<unsigned char> bytes = compressed.data;
        for (std::size_t i = 10; i < bytes.size(); ++i) {
            bytes[i] = 0xff;
        }
        CHECK_THROWS_AS(collect(decoder.decode(RawData(bytes))),
                        DecodeFailure);
    }

    SUBCASE("Truncated stream") {
        std::vector<unsigned char> bytes(
            compressed.data.begin(),
            compressed.data.begin() +
                static_cast<std::ptrdiff_t>(compressed.data.size() / 2));
        CHECK_THROWS_AS(collect(decoder.decode(RawData(bytes))),
                        DecodeFailure);
    }

    SUBCASE("Header only") {
        std::vector<unsigned char> bytes{0x1f, 0x8b};
        CHECK_THROWS_AS(collect(decoder.decode(RawData(bytes))),
                        DecodeFailure);
    }
}

TEST_CASE("ContentDecoder - charsets") {
    const std::string latin1_bytes = "caf\xe9";

    SUBCASE("UTF-8 preserves bytes") {
        ContentDecoder decoder("UTF-8");
        CHECK(collect(decoder.decode(RawData(std::string("caf\xc3\xa9")))) ==
              std::vector<std::string>{"caf\xc3\xa9"});
    }

    SUBCASE("ISO-8859-1 is transcoded to UTF-8") {
        ContentDecoder decoder("ISO-8859-1");
        CHECK(decoder.charset() == text::Charset::LATIN1);
        CHECK(collect(decoder.decode(RawData(latin1_bytes))) ==
              std::vector<std::string>{"caf\xc3\xa9"});
    }

    SUBCASE("US-ASCII replaces high bytes") {
        ContentDecoder decoder("us-ascii");
        CHECK(collect(decoder.decode(RawData(latin1_bytes))) ==
              std::vector<std::string>{"caf?"});
    }

    SUBCASE("Unknown charset") {
        CHECK_THROWS_AS(ContentDecoder("EBCDIC"), std::invalid_argument);
        CHECK_FALSE(text::is_supported_charset("EBCDIC"));
        CHECK(text::is_supported_charset("latin1"));
        CHECK(std::string(text::charset_name(text::parse_charset("utf8"))) ==
              "UTF-8");
    }
}
