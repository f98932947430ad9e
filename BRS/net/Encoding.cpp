#include "Encoding.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace encoding {

namespace {
const char kBase64Alphabet[] =
"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool isUnreserved(unsigned char c) {
    if (std::isalnum(c))
        return true;

    switch (c) {
    case '-': case '_': case '.': case '!': case '~':
    case '*': case '\'': case '(': case ')':
        return true;
    default:
        return false;
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
}

std::string percentEncode(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size() * 3);

    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out.push_back(ch);
        }
        else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hexValue(text[i + 1]);
            const int lo = hexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string base64Encode(const std::vector<char>& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 3 <= data.size()) {
        const std::uint32_t n = (static_cast<std::uint8_t>(data[i]) << 16)
            | (static_cast<std::uint8_t>(data[i + 1]) << 8)
            | static_cast<std::uint8_t>(data[i + 2]);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
        i += 3;
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint8_t>(data[i]) << 16;
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out += "==";
    }
    else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint8_t>(data[i]) << 16)
            | (static_cast<std::uint8_t>(data[i + 1]) << 8);
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<char> base64Decode(const std::string& text) {
    std::vector<char> out;
    out.reserve(text.size() / 4 * 3);

    std::uint32_t buffer = 0;
    int bits = 0;
    std::size_t padding = 0;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;

        if (c == '=') {
            ++padding;
            continue;
        }

        if (padding > 0)
            throw std::invalid_argument("base64: data after padding");

        const int v = base64Value(c);
        if (v < 0)
            throw std::invalid_argument(std::string("base64: invalid character '") + c + "'");

        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    if (padding > 2)
        throw std::invalid_argument("base64: too much padding");

    return out;
}

std::string makeBoundary() {
    static std::atomic<std::uint32_t> counter{ 0 };
    static thread_local std::mt19937_64 rng{ std::random_device{}() };

    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream os;
    os << "----PDFBoundary" << ns
        << std::hex << std::setw(16) << std::setfill('0') << rng()
        << std::setw(8) << counter.fetch_add(1);
    return os.str();
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
        });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}
