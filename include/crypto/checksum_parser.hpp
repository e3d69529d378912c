#ifndef ISOFETCH_CHECKSUM_PARSER_HPP
#define ISOFETCH_CHECKSUM_PARSER_HPP

#include <optional>
#include <string>

/**
 * Reader for checksum listings such as SHA256SUMS.
 *
 * Two line grammars are recognized and may be mixed freely in one file:
 *
 *   standard   <hex> <filename>          (GNU coreutils, text mode)
 *              <hex> *<filename>         (binary mode, '*' is not part of the name)
 *   bsd        <ALGO> (<filename>) = <hex>
 *
 * Blank lines and lines starting with '#' are skipped.
 */
namespace ChecksumParser {

struct Entry {
    std::string filename;
    std::string hash;       // lowercased
    std::string algorithm;  // as written in a bsd line, empty for standard lines
};

// Parses a single line. Returns std::nullopt for blank, comment or unrecognized lines.
std::optional<Entry> parse_line(const std::string& line);

/**
 * @brief Finds the hash listed for `filename`.
 *
 * Filenames are compared exactly, with no path normalization. The first
 * matching line wins.
 * @return The lowercased hex digest.
 * @throws ChecksumNotFoundError if no line names the file.
 */
std::string find_checksum(const std::string& text, const std::string& filename);

} // namespace ChecksumParser

#endif // ISOFETCH_CHECKSUM_PARSER_HPP
