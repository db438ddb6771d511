#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "song_catalog/types.hpp"

namespace song_catalog {

struct LoadResult {
    std::vector<Song> songs{};
    std::optional<std::string> error{};
};

class SongStore final {
public:
    explicit SongStore(std::filesystem::path catalog_file);

    [[nodiscard]] const std::filesystem::path& path() const { return catalog_file_; }

    [[nodiscard]] LoadResult load() const;
    [[nodiscard]] std::optional<std::string> save(const std::vector<Song>& songs) const;

private:
    std::filesystem::path catalog_file_;
};

} // namespace song_catalog
