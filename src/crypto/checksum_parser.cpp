#include "crypto/checksum_parser.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ChecksumParser {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) ++begin;
    size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

bool is_hex(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "<hex> <filename>" or "<hex> *<filename>"
std::optional<Entry> parse_standard(const std::string& line) {
    size_t split = 0;
    while (split < line.size() && !is_space(line[split])) ++split;
    if (split == line.size()) return std::nullopt;

    std::string hash = line.substr(0, split);
    if (!is_hex(hash)) return std::nullopt;

    std::string name = trim(line.substr(split));
    if (!name.empty() && name.front() == '*') {
        name.erase(0, 1);
    }
    if (name.empty()) return std::nullopt;

    return Entry{name, to_lower(hash), ""};
}

// "<ALGO> (<filename>) = <hex>"
std::optional<Entry> parse_bsd(const std::string& line) {
    size_t open = line.find('(');
    size_t close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    std::string algorithm = trim(line.substr(0, open));
    if (algorithm.empty() ||
        std::any_of(algorithm.begin(), algorithm.end(), [](char c) { return is_space(c); })) {
        return std::nullopt;
    }

    std::string rest = trim(line.substr(close + 1));
    if (rest.empty() || rest.front() != '=') return std::nullopt;
    std::string hash = trim(rest.substr(1));
    if (!is_hex(hash)) return std::nullopt;

    std::string name = trim(line.substr(open + 1, close - open - 1));
    if (name.empty()) return std::nullopt;

    return Entry{name, to_lower(hash), algorithm};
}

} // namespace

std::optional<Entry> parse_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line.front() == '#') return std::nullopt;

    if (auto entry = parse_standard(line)) return entry;
    return parse_bsd(line);
}

std::string find_checksum(const std::string& text, const std::string& filename) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto entry = parse_line(line);
        if (entry && entry->filename == filename) {
            return entry->hash;
        }
    }
    throw ChecksumNotFoundError(filename);
}

} // namespace ChecksumParser
