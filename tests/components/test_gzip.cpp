#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <slotingest/components/compression/gzip/gzip.h>
#include <slotingest/components/io/byte_source.h>

#include <memory>
#include <string>
#include <vector>

#include "../testing_utilities.h"

using namespace slotingest::components;
using namespace slotingest::components::compression::gzip;
using namespace slotingest_test;

namespace {

std::string read_all(io::ByteSource& source, std::size_t chunk) {
    std::string out;
    std::vector<unsigned char> buffer(chunk);
    while (true) {
        std::size_t n = source.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        out.append(buffer.begin(),
                   buffer.begin() + static_cast<std::ptrdiff_t>(n));
    }
    return out;
}

}  // namespace

TEST_CASE("Gzip - streaming compressor output carries the magic number") {
    ManualStreamingCompressor compressor;
    std::vector<io::CompressedData> parts;
    for (int i = 0; i < 3; ++i) {
        for (auto& part : compressor.compress_chunk(
                 io::RawData(make_lines("chunk", 50)))) {
            parts.push_back(std::move(part));
        }
    }
    for (auto& part : compressor.finalize()) {
        parts.push_back(std::move(part));
    }

    std::vector<unsigned char> stream;
    for (const auto& part : parts) {
        stream.insert(stream.end(), part.data.begin(), part.data.end());
    }

    REQUIRE(stream.size() >= GZIP_MAGIC_LENGTH);
    CHECK(stream[0] == GZIP_MAGIC_0);
    CHECK(stream[1] == GZIP_MAGIC_1);
    CHECK(compressor.total_bytes_in() == 3 * make_lines("chunk", 50).size());

    StreamingDecompressor decompressor;
    std::string restored;
    for (const auto& out :
         decompressor.decompress_chunk(io::CompressedData(stream))) {
        restored.append(out.data.begin(), out.data.end());
    }
    CHECK(decompressor.is_stream_end());
    CHECK(restored.size() == compressor.total_bytes_in());
}

TEST_CASE("Gzip - byte source reads through small buffers") {
    std::string text = make_lines("20161201", 500);
    auto compressed = TestEnvironment::gzip_bytes(text);
    auto raw = std::make_shared<const io::RawData>(compressed.data);

    SUBCASE("One byte at a time") {
        GzipByteSource source(std::make_unique<io::MemoryByteSource>(raw));
        CHECK(read_all(source, 1) == text);
    }

    SUBCASE("Large reads") {
        GzipByteSource source(std::make_unique<io::MemoryByteSource>(raw));
        CHECK(read_all(source, 1 << 20) == text);
    }

    SUBCASE("Trailing bytes after the member are ignored") {
        std::vector<unsigned char> bytes = compressed.data;
        bytes.push_back(0x00);
        bytes.push_back(0x00);
        GzipByteSource source(std::make_unique<io::MemoryByteSource>(
            std::make_shared<const io::RawData>(bytes)));
        CHECK(read_all(source, 4096) == text);
    }
}
