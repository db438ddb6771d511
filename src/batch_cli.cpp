#include "song_catalog/batch_cli.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "song_catalog/text_utils.hpp"

namespace song_catalog {
namespace {

std::string command_name(const std::string& raw) {
    std::string_view name(raw);
    if (name.substr(0, 2) == "--") {
        name.remove_prefix(2);
    }
    return std::string(name);
}

bool is_integer_literal(const std::string& text) {
    const std::size_t digits_start = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    return digits_start < text.size() &&
           std::all_of(text.begin() + static_cast<std::ptrdiff_t>(digits_start), text.end(), [](const unsigned char c) {
               return std::isdigit(c) != 0;
           });
}

// Integers too wide for long long are reported as -1, which no catalog index matches.
std::optional<long long> parse_index(const std::string& raw) {
    const std::string cleaned = trim(raw);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(cleaned, &consumed);
        if (consumed != cleaned.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::out_of_range&) {
        if (is_integer_literal(cleaned)) {
            return -1;
        }
        return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int report_save(const std::optional<std::string>& save_error, std::ostream& err) {
    if (save_error.has_value()) {
        err << *save_error << '\n';
        return 1;
    }
    return 0;
}

int list_songs(const SongCatalog& catalog, std::ostream& out) {
    const std::vector<CatalogEntry>& entries = catalog.entries();
    for (std::size_t index = 0; index < entries.size(); ++index) {
        const Song& song = entries[index].song;
        out << index << ": " << song.title;
        if (!song.number.empty()) {
            out << " - " << song.number;
        }
        out << '\n';
    }
    return 0;
}

int add_song(const std::vector<std::string>& args, SongCatalog& catalog, std::ostream& out, std::ostream& err) {
    const std::string number = args.size() >= 3 ? args[2] : std::string{};
    const ChangeResult result = catalog.add(args[1], number);
    if (result.status == ChangeStatus::EmptyTitle) {
        out << "Title cannot be empty\n";
        return 0;
    }

    if (result.save_error.has_value()) {
        return report_save(result.save_error, err);
    }
    out << "Added: " << trim(args[1]) << '\n';
    return 0;
}

int remove_song(const std::string& raw_index, SongCatalog& catalog, std::ostream& out, std::ostream& err) {
    const std::optional<long long> index = parse_index(raw_index);
    if (!index.has_value()) {
        out << "Invalid index\n";
        return 0;
    }

    if (*index < 0 || static_cast<unsigned long long>(*index) >= catalog.size()) {
        out << "Index out of range\n";
        return 0;
    }

    const CatalogEntry entry = catalog.entries()[static_cast<std::size_t>(*index)];
    const ChangeResult result = catalog.remove(entry.id);
    if (result.save_error.has_value()) {
        return report_save(result.save_error, err);
    }
    out << "Removed: " << entry.song.title << '\n';
    return 0;
}

} // namespace

void print_batch_usage(std::ostream& out) {
    out <<
R"(Song Catalog - CLI
Usage:
  --list                   list songs
  --add 'Title' [Number]   add a song
  --remove N               remove by index (use --list to see indexes)
)";
}

int run_batch(const std::vector<std::string>& args, SongCatalog& catalog, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        print_batch_usage(out);
        return 0;
    }

    const std::string command = command_name(args.front());
    if (command == "list") {
        return list_songs(catalog, out);
    }
    if (command == "add" && args.size() >= 2) {
        return add_song(args, catalog, out, err);
    }
    if (command == "remove" && args.size() == 2) {
        return remove_song(args[1], catalog, out, err);
    }

    out << "Unknown CLI command\n";
    return 0;
}

} // namespace song_catalog
