#pragma once

#include <filesystem>

#include "song_catalog/types.hpp"

namespace song_catalog {

class SettingsStore final {
public:
    explicit SettingsStore(std::filesystem::path settings_file);

    [[nodiscard]] AppSettings load() const;
    void save(const AppSettings& settings) const;

private:
    std::filesystem::path settings_file_;
};

} // namespace song_catalog
