#include "song_catalog/song_catalog.hpp"

#include <algorithm>
#include <utility>

#include <QDebug>

#include "song_catalog/import_parser.hpp"
#include "song_catalog/text_utils.hpp"

namespace song_catalog {

SongCatalog::SongCatalog(const SongStore& store) : store_(store) {}

std::optional<std::string> SongCatalog::reload() {
    LoadResult loaded = store_.load();
    entries_.clear();
    entries_.reserve(loaded.songs.size());
    for (Song& song : loaded.songs) {
        append(std::move(song));
    }
    return loaded.error;
}

std::vector<Song> SongCatalog::songs() const {
    std::vector<Song> songs;
    songs.reserve(entries_.size());
    for (const CatalogEntry& entry : entries_) {
        songs.push_back(entry.song);
    }
    return songs;
}

std::vector<CatalogEntry> SongCatalog::search(const std::string_view query) const {
    const std::string needle = trim(query);
    if (needle.empty()) {
        return entries_;
    }

    std::vector<CatalogEntry> matches;
    for (const CatalogEntry& entry : entries_) {
        if (contains_ignore_case(entry.song.title, needle) || contains_ignore_case(entry.song.number, needle)) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::optional<CatalogEntry> SongCatalog::find(const EntryId id) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(), [id](const CatalogEntry& entry) {
        return entry.id == id;
    });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

ChangeResult SongCatalog::add(const std::string_view title, const std::string_view number) {
    ChangeResult result{};

    Song song{trim(title), trim(number)};
    if (song.title.empty()) {
        result.status = ChangeStatus::EmptyTitle;
        return result;
    }

    result.id = append(std::move(song));
    result.save_error = save();
    return result;
}

ChangeResult SongCatalog::edit(const EntryId id, const std::string_view title, const std::string_view number) {
    ChangeResult result{};
    result.id = id;

    const auto it = locate(id);
    if (it == entries_.end()) {
        result.status = ChangeStatus::UnknownEntry;
        return result;
    }

    Song song{trim(title), trim(number)};
    if (song.title.empty()) {
        result.status = ChangeStatus::EmptyTitle;
        return result;
    }

    it->song = std::move(song);
    result.save_error = save();
    return result;
}

ChangeResult SongCatalog::remove(const EntryId id) {
    ChangeResult result{};
    result.id = id;

    const auto it = locate(id);
    if (it == entries_.end()) {
        result.status = ChangeStatus::UnknownEntry;
        return result;
    }

    entries_.erase(it);
    result.save_error = save();
    return result;
}

ImportResult SongCatalog::import_text(const std::string& text) {
    ImportResult result{};

    std::vector<Song> parsed = parse_import_text(text);
    if (parsed.empty()) {
        return result;
    }

    for (Song& song : parsed) {
        append(std::move(song));
    }
    result.imported = parsed.size();
    result.save_error = save();
    qDebug() << "[SongCatalog] Imported" << result.imported << "songs";
    return result;
}

std::optional<std::string> SongCatalog::save() const {
    return store_.save(songs());
}

EntryId SongCatalog::append(Song song) {
    const EntryId id = next_id_++;
    entries_.push_back(CatalogEntry{id, std::move(song)});
    return id;
}

std::vector<CatalogEntry>::iterator SongCatalog::locate(const EntryId id) {
    return std::find_if(entries_.begin(), entries_.end(), [id](const CatalogEntry& entry) {
        return entry.id == id;
    });
}

} // namespace song_catalog
