#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace song_catalog {

struct Song {
    std::string title{};
    std::string number{};
};

inline bool operator==(const Song& lhs, const Song& rhs) {
    return lhs.title == rhs.title && lhs.number == rhs.number;
}

using EntryId = std::uint64_t;

struct CatalogEntry {
    EntryId id{0};
    Song song{};
};

enum class ChangeStatus {
    Applied = 0,
    EmptyTitle = 1,
    UnknownEntry = 2,
};

// Outcome of a catalog mutation. A change can apply in memory and still fail to
// reach disk, in which case save_error carries the reason.
struct ChangeResult {
    ChangeStatus status{ChangeStatus::Applied};
    std::optional<std::string> save_error{};
    EntryId id{0};

    [[nodiscard]] bool applied() const { return status == ChangeStatus::Applied; }
    [[nodiscard]] bool persisted() const { return applied() && !save_error.has_value(); }
};

struct ImportResult {
    std::size_t imported{0};
    std::optional<std::string> save_error{};
};

struct AppSettings {
    std::string catalog_file{"songs.json"};
    int window_width{600};
    int window_height{400};
};

} // namespace song_catalog
