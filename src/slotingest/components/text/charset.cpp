#include <slotingest/components/text/charset.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace slotingest::components::text {

namespace {

std::string normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_') {
            continue;
        }
        out.push_back(static_cast<char>(
            std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace

Charset parse_charset(const std::string& name) {
    std::string n = normalize(name);
    if (n == "UTF8") {
        return Charset::UTF8;
    }
    if (n == "ISO88591" || n == "LATIN1" || n == "L1" || n == "CP819") {
        return Charset::LATIN1;
    }
    if (n == "USASCII" || n == "ASCII") {
        return Charset::ASCII;
    }
    throw std::invalid_argument("Unsupported charset: " + name);
}

const char* charset_name(Charset charset) {
    switch (charset) {
        case Charset::UTF8:
            return "UTF-8";
        case Charset::LATIN1:
            return "ISO-8859-1";
        case Charset::ASCII:
            return "US-ASCII";
    }
    return "UTF-8";
}

bool is_supported_charset(const std::string& name) {
    try {
        parse_charset(name);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

std::string decode_bytes(const char* data, std::size_t length,
                         Charset charset) {
    switch (charset) {
        case Charset::UTF8:
            return std::string(data, length);

        case Charset::LATIN1: {
            std::string out;
            out.reserve(length);
            for (std::size_t i = 0; i < length; ++i) {
                auto c = static_cast<unsigned char>(data[i]);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return out;
        }

        case Charset::ASCII: {
            std::string out(data, length);
            std::replace_if(
                out.begin(), out.end(),
                [](char c) { return static_cast<unsigned char>(c) > 0x7F; },
                '?');
            return out;
        }
    }
    return std::string(data, length);
}

}  // namespace slotingest::components::text
