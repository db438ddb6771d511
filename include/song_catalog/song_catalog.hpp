#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "song_catalog/song_store.hpp"
#include "song_catalog/types.hpp"

namespace song_catalog {

class SongCatalog final {
public:
    explicit SongCatalog(const SongStore& store);
    explicit SongCatalog(SongStore&&) = delete;

    // Replaces the in-memory list with the backing file contents. Returns the load
    // error, if any; the catalog is empty in that case.
    std::optional<std::string> reload();

    [[nodiscard]] const std::vector<CatalogEntry>& entries() const { return entries_; }
    [[nodiscard]] std::vector<Song> songs() const;
    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    [[nodiscard]] std::vector<CatalogEntry> search(std::string_view query) const;
    [[nodiscard]] std::optional<CatalogEntry> find(EntryId id) const;

    ChangeResult add(std::string_view title, std::string_view number);
    ChangeResult edit(EntryId id, std::string_view title, std::string_view number);
    ChangeResult remove(EntryId id);
    ImportResult import_text(const std::string& text);
    [[nodiscard]] std::optional<std::string> save() const;

private:
    const SongStore& store_;
    std::vector<CatalogEntry> entries_;
    EntryId next_id_{1};

    EntryId append(Song song);
    [[nodiscard]] std::vector<CatalogEntry>::iterator locate(EntryId id);
};

} // namespace song_catalog
