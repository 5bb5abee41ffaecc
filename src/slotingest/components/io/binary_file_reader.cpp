#include <slotingest/components/io/binary_file_reader.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace slotingest::components::io {

RawData BinaryFileReader::process(const fs::path& input) {
    if (!fs::is_regular_file(input)) {
        throw std::runtime_error("Not a regular file: " + input.string());
    }

    std::ifstream file(input, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + input.string());
    }

    file.seekg(0, std::ios::end);
    std::streamoff end = file.tellg();
    if (end < 0) {
        throw std::runtime_error("Cannot determine size of " +
                                 input.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<unsigned char> data(static_cast<std::size_t>(end));
    if (!data.empty()) {
        file.read(reinterpret_cast<char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }

    if (!file) {
        throw std::runtime_error("Error reading file: " + input.string());
    }

    return RawData{std::move(data)};
}

}  // namespace slotingest::components::io
