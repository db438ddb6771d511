#pragma once

#include <string>
#include <vector>

#include "song_catalog/types.hpp"

namespace song_catalog {

// Parses pasted text, one song per line, optionally written as "Title - Number".
std::vector<Song> parse_import_text(const std::string& raw);

} // namespace song_catalog
