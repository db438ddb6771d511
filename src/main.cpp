#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <QApplication>

#include "song_catalog/batch_cli.hpp"
#include "song_catalog/main_window.hpp"
#include "song_catalog/settings_store.hpp"
#include "song_catalog/song_catalog.hpp"
#include "song_catalog/song_store.hpp"

#ifndef SONG_CATALOG_VERSION
#define SONG_CATALOG_VERSION "0.0.0"
#endif

namespace {

constexpr std::string_view kSettingsFile = "song_catalog.cfg";

struct LaunchOptions {
    std::optional<std::string> catalog_file{};
    bool cli{false};
    bool version{false};
    std::vector<std::string> batch_args{};
};

LaunchOptions parse_launch_options(const int argc, char* argv[]) {
    LaunchOptions options{};

    int index = 1;
    while (index < argc) {
        const std::string_view arg(argv[index]);
        if (arg == "--file" && index + 1 < argc) {
            options.catalog_file = argv[index + 1];
            index += 2;
            continue;
        }
        if (arg == "--version") {
            options.version = true;
            ++index;
            continue;
        }
        if (arg == "--cli") {
            options.cli = true;
            ++index;
            break;
        }
        ++index;
    }

    if (options.cli) {
        for (; index < argc; ++index) {
            options.batch_args.emplace_back(argv[index]);
        }
    }
    return options;
}

int run_cli(const song_catalog::SongStore& store, const std::vector<std::string>& args) {
    song_catalog::SongCatalog catalog(store);
    const std::optional<std::string> load_error = catalog.reload();
    if (load_error.has_value()) {
        std::cerr << *load_error << '\n';
    }
    return song_catalog::run_batch(args, catalog, std::cout, std::cerr);
}

} // namespace

int main(int argc, char *argv[])
{
    const LaunchOptions options = parse_launch_options(argc, argv);
    if (options.version)
    {
        std::cout << "song_catalog " << SONG_CATALOG_VERSION << '\n';
        return 0;
    }

    const song_catalog::SettingsStore settings_store{std::filesystem::path(kSettingsFile)};
    const song_catalog::AppSettings settings = settings_store.load();
    const std::filesystem::path catalog_file = options.catalog_file.value_or(settings.catalog_file);

    if (options.cli)
    {
        const song_catalog::SongStore store(catalog_file);
        return run_cli(store, options.batch_args);
    }

    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("Song Catalog"));
    QApplication::setApplicationDisplayName(QStringLiteral("Song Catalog"));
    QApplication::setOrganizationName(QStringLiteral("Song Catalog"));
    QApplication::setApplicationVersion(QStringLiteral(SONG_CATALOG_VERSION));

    song_catalog::MainWindow window(settings_store, settings, catalog_file);
    window.show();
    return app.exec();
}
