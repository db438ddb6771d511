#include <string>
#include <type_traits>
#include <vector>

#include "song_catalog/import_parser.hpp"
#include "song_catalog/settings_store.hpp"
#include "song_catalog/song_catalog.hpp"
#include "song_catalog/song_store.hpp"
#include "song_catalog/text_utils.hpp"
#include "test_support.hpp"

namespace {

using song_catalog::CatalogEntry;
using song_catalog::ChangeResult;
using song_catalog::ChangeStatus;
using song_catalog::ImportResult;
using song_catalog::Song;
using song_catalog::SongCatalog;
using song_catalog::SongStore;
using song_catalog::test::TempDir;
using song_catalog::test::expect;
using song_catalog::test::read_file;
using song_catalog::test::write_file;

static_assert(
    !std::is_constructible_v<SongCatalog, SongStore&&>,
    "a catalog must not bind to a temporary store"
);
static_assert(std::is_constructible_v<SongCatalog, const SongStore&>, "a catalog binds to a live store");

void import_parser_splits_on_first_separator() {
    const std::vector<Song> parsed = song_catalog::parse_import_text(
        "  Holy Holy Holy - 100 \r\n\n   \nJust As I Am\nAbide - With Me - 832\nWell-Known - \n"
    );
    expect(parsed.size() == 4, "blank lines should be skipped");
    expect(parsed[0] == Song{"Holy Holy Holy", "100"}, "title and number should be trimmed");
    expect(parsed[1] == Song{"Just As I Am", ""}, "line without separator should be a bare title");
    expect(parsed[2] == Song{"Abide", "With Me - 832"}, "only the first separator should split");
    expect(parsed[3] == Song{"Well-Known -", ""}, "dangling dash without trailing text should stay in the title");
}

void search_matches_title_or_number() {
    const TempDir dir("song_catalog_search");
    const auto path = dir.path() / "songs.json";
    write_file(path, R"([{"title":"Amazing Grace","number":"12"},{"title":"How Great"},{"title":"Église Chant","number":"A-7"}])");

    const SongStore store(path);
    SongCatalog catalog(store);
    expect(!catalog.reload().has_value(), "catalog should load");
    expect(catalog.size() == 3, "catalog should hold three songs");

    const std::vector<CatalogEntry> by_number = catalog.search("12");
    expect(by_number.size() == 1, "number query should match one song");
    expect(by_number[0].song.title == "Amazing Grace", "number query should match the numbered song");

    expect(catalog.search("  gR ").size() == 2, "title query should be trimmed and case-insensitive");
    expect(catalog.search("a-7").size() == 1, "number match should be case-insensitive");
    expect(catalog.search("ÉGLISE").size() == 1, "non-ASCII titles should match case-insensitively");
    expect(catalog.search("").size() == 3, "empty query should return every song");
    expect(catalog.search("psalm").empty(), "unmatched query should return nothing");
}

void add_rejects_blank_title() {
    const TempDir dir("song_catalog_blank");
    const auto path = dir.path() / "songs.json";
    const SongStore store(path);
    SongCatalog catalog(store);
    expect(!catalog.reload().has_value(), "fresh catalog should load");
    expect(catalog.add("Amazing Grace", "12").persisted(), "first add should persist");

    const std::string before = read_file(path);
    const ChangeResult result = catalog.add("   \t", "5");
    expect(result.status == ChangeStatus::EmptyTitle, "blank title should be rejected");
    expect(catalog.size() == 1, "rejected add should not grow the catalog");
    expect(read_file(path) == before, "rejected add should not touch the file");
}

void add_trims_and_persists() {
    const TempDir dir("song_catalog_add");
    const auto path = dir.path() / "songs.json";
    const SongStore store(path);
    SongCatalog catalog(store);
    expect(!catalog.reload().has_value(), "fresh catalog should load");

    const ChangeResult result = catalog.add("  Rock of Ages ", " 45 ");
    expect(result.persisted(), "add should persist");
    expect(catalog.find(result.id).has_value(), "new entry should be addressable by id");

    const auto reloaded = store.load();
    expect(reloaded.songs.size() == 1, "file should hold the added song");
    expect(reloaded.songs[0] == Song{"Rock of Ages", "45"}, "added fields should be trimmed");
}

void edit_and_remove_use_entry_identity() {
    const TempDir dir("song_catalog_identity");
    const auto path = dir.path() / "songs.json";
    write_file(path, R"([{"title":"Doxology","number":"1"},{"title":"Doxology","number":"1"},{"title":"Tail","number":""}])");

    const SongStore store(path);
    SongCatalog catalog(store);
    expect(!catalog.reload().has_value(), "duplicates should load");

    const auto second = catalog.entries()[1].id;
    expect(catalog.edit(second, "Doxology (Old 100th)", "1").persisted(), "edit should persist");
    std::vector<Song> songs = store.load().songs;
    expect(songs[0] == Song{"Doxology", "1"}, "edit must not touch the first duplicate");
    expect(songs[1] == Song{"Doxology (Old 100th)", "1"}, "edit should replace the selected duplicate in place");

    expect(catalog.edit(second, " ", "2").status == ChangeStatus::EmptyTitle, "edit should reject blank titles");
    expect(catalog.find(second)->song.title == "Doxology (Old 100th)", "rejected edit should keep the record");

    const auto first = catalog.entries()[0].id;
    expect(catalog.remove(first).persisted(), "remove should persist");
    songs = store.load().songs;
    expect(songs.size() == 2, "remove should drop one record");
    expect(songs[0].title == "Doxology (Old 100th)", "remove should drop the selected record only");

    const std::string before = read_file(path);
    expect(catalog.remove(first).status == ChangeStatus::UnknownEntry, "removed id should no longer resolve");
    expect(catalog.edit(first, "Ghost", "").status == ChangeStatus::UnknownEntry, "stale id should not be editable");
    expect(read_file(path) == before, "unresolved selection should not write the file");
}

void import_appends_parsed_lines() {
    const TempDir dir("song_catalog_import");
    const auto path = dir.path() / "songs.json";
    const SongStore store(path);
    SongCatalog catalog(store);
    expect(!catalog.reload().has_value(), "fresh catalog should load");
    expect(catalog.add("Existing", "").persisted(), "seed add should persist");

    const ImportResult result = catalog.import_text("Holy Holy Holy - 100\nJust As I Am");
    expect(result.imported == 2, "two lines should be imported");
    expect(!result.save_error.has_value(), "import should persist");

    const std::vector<Song> songs = store.load().songs;
    expect(songs.size() == 3, "import should append to the existing catalog");
    expect(songs[1] == Song{"Holy Holy Holy", "100"}, "numbered line should split");
    expect(songs[2] == Song{"Just As I Am", ""}, "bare line should have no number");

    expect(catalog.import_text("\n  \n").imported == 0, "blank import should add nothing");
}

void failed_save_keeps_memory_state() {
    const TempDir dir("song_catalog_unwritable");
    write_file(dir.path() / "blocker", "not a directory");
    const SongStore store(dir.path() / "blocker" / "songs.json");
    SongCatalog catalog(store);

    const ChangeResult result = catalog.add("Amazing Grace", "12");
    expect(result.applied(), "add should apply in memory");
    expect(result.save_error.has_value(), "add should report the failed write");
    expect(!result.persisted(), "failed write should not count as persisted");
    expect(catalog.size() == 1, "in-memory catalog should keep the record");
}

void settings_round_trip_and_clamp() {
    const TempDir dir("song_catalog_settings");
    const auto path = dir.path() / "song_catalog.cfg";
    const song_catalog::SettingsStore settings_store(path);

    const song_catalog::AppSettings defaults = settings_store.load();
    expect(defaults.catalog_file == "songs.json", "missing settings should use songs.json");
    expect(defaults.window_width == 600 && defaults.window_height == 400, "missing settings should use default size");

    song_catalog::AppSettings settings{};
    settings.catalog_file = "hymns/church.json";
    settings.window_width = 800;
    settings.window_height = 100;
    settings_store.save(settings);

    const song_catalog::AppSettings loaded = settings_store.load();
    expect(loaded.catalog_file == "hymns/church.json", "catalog file should round-trip");
    expect(loaded.window_width == 800, "window width should round-trip");
    expect(loaded.window_height == 300, "window height should be clamped to the minimum");

    write_file(path, "catalog_file=\nwindow_width=wide\n# comment\nunknown=1\nwindow_height = 500\n");
    const song_catalog::AppSettings lenient = settings_store.load();
    expect(lenient.catalog_file == "songs.json", "empty catalog_file should keep the default");
    expect(lenient.window_width == 600, "malformed width should keep the default");
    expect(lenient.window_height == 500, "spaced assignments should be accepted");
}

void trim_handles_whitespace_only() {
    expect(song_catalog::trim(" \t\r\n ").empty(), "whitespace-only text should trim to empty");
    expect(song_catalog::trim("  a b  ") == "a b", "inner whitespace should survive");
    expect(song_catalog::trim("\xC2\xA0" "Doxology" "\xC2\xA0") == "Doxology", "non-breaking spaces should be trimmed");
    expect(song_catalog::contains_ignore_case("anything", ""), "empty needle should always match");
}

} // namespace

int main() {
    import_parser_splits_on_first_separator();
    search_matches_title_or_number();
    add_rejects_blank_title();
    add_trims_and_persists();
    edit_and_remove_use_entry_identity();
    import_appends_parsed_lines();
    failed_save_keeps_memory_state();
    settings_round_trip_and_clamp();
    trim_handles_whitespace_only();
    return 0;
}
