#include "song_catalog/import_parser.hpp"

#include <sstream>
#include <string_view>

#include "song_catalog/text_utils.hpp"

namespace song_catalog {
namespace {

constexpr std::string_view kNumberSeparator = " - ";

} // namespace

std::vector<Song> parse_import_text(const std::string& raw) {
    std::vector<Song> songs;

    std::istringstream input(raw);
    std::string line;
    while (std::getline(input, line)) {
        const std::string cleaned = trim(line);
        if (cleaned.empty()) {
            continue;
        }

        const std::size_t separator = cleaned.find(kNumberSeparator);
        if (separator == std::string::npos) {
            songs.push_back(Song{cleaned, {}});
            continue;
        }

        songs.push_back(Song{
            trim(std::string_view(cleaned).substr(0, separator)),
            trim(std::string_view(cleaned).substr(separator + kNumberSeparator.size())),
        });
    }

    return songs;
}

} // namespace song_catalog
