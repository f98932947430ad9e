#pragma once
#include <string>
#include <vector>

namespace encoding {

// Same character set as ECMAScript encodeURIComponent
std::string percentEncode(const std::string& text);
// Malformed escapes are kept literally
std::string percentDecode(const std::string& text);

std::string base64Encode(const std::vector<char>& data);
// Whitespace is ignored. Throws std::invalid_argument on bad input.
std::vector<char> base64Decode(const std::string& text);

// Unique per call: time-based prefix plus random suffix
std::string makeBoundary();

std::string toLower(std::string text);
std::string trim(const std::string& text);

}
