#pragma once

#include <string>
#include <string_view>

namespace song_catalog {

// Strips leading and trailing Unicode whitespace from UTF-8 text.
[[nodiscard]] std::string trim(std::string_view value);

// Case-insensitive substring test over UTF-8 text. An empty needle always matches.
[[nodiscard]] bool contains_ignore_case(std::string_view haystack, std::string_view needle);

} // namespace song_catalog
