#include <streamgate/util/string.h>
#include <algorithm>
#include <cctype>

namespace streamgate::util {

namespace {
    inline int hex_to_int(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string url_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            result += ' ';
        } else if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_to_int(str[i + 1]);
            int lo = hex_to_int(str[i + 2]);
            if (hi != -1 && lo != -1) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
            } else {
                result += '%';
            }
        } else {
            result += str[i];
        }
    }
    return result;
}

std::string hex_encode(std::string_view input) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.resize(input.size() * 2);
    char* ptr = result.data();
    for (unsigned char c : input) {
        *ptr++ = hex_chars[c >> 4];
        *ptr++ = hex_chars[c & 0x0f];
    }
    return result;
}

std::string trim(std::string_view input) {
    size_t first = 0;
    size_t last = input.size();

    while (first < last && std::isspace(static_cast<unsigned char>(input[first]))) {
        ++first;
    }
    while (last > first && std::isspace(static_cast<unsigned char>(input[last - 1]))) {
        --last;
    }

    return std::string(input.substr(first, last - first));
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char c1, char c2) {
               return std::tolower(static_cast<unsigned char>(c1)) ==
                      std::tolower(static_cast<unsigned char>(c2));
           });
}

std::vector<std::string> split(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t end = input.find(delimiter, start);
        if (end == std::string_view::npos) {
            parts.emplace_back(input.substr(start));
            break;
        }
        parts.emplace_back(input.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

std::vector<std::string_view> path_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start < path.size()) {
        if (path[start] == '/') {
            start++;
            continue;
        }
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        segments.push_back(path.substr(start, end - start));
        start = end;
    }
    return segments;
}

} // namespace streamgate::util
