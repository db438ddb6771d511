#include "song_catalog/settings_store.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <string>
#include <utility>

#include <QDebug>
#include <QString>

#include "song_catalog/text_utils.hpp"

namespace song_catalog {
namespace {

constexpr int kMinWindowWidth = 520;
constexpr int kMinWindowHeight = 300;
constexpr int kMaxWindowExtent = 4096;

bool parse_extent(const std::string& value, const int minimum, int& target) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        target = std::clamp(parsed, minimum, kMaxWindowExtent);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

SettingsStore::SettingsStore(std::filesystem::path settings_file) : settings_file_(std::move(settings_file)) {}

AppSettings SettingsStore::load() const {
    AppSettings settings{};
    std::ifstream in(settings_file_);
    if (!in) {
        return settings;
    }

    std::string line;
    while (std::getline(in, line)) {
        const std::size_t delimiter = line.find('=');
        if (delimiter == std::string::npos) {
            continue;
        }

        const std::string key = trim(std::string_view(line).substr(0, delimiter));
        const std::string value = trim(std::string_view(line).substr(delimiter + 1));

        if (key == "catalog_file") {
            if (!value.empty()) {
                settings.catalog_file = value;
            }
        } else if (key == "window_width") {
            if (!parse_extent(value, kMinWindowWidth, settings.window_width)) {
                qWarning() << "[Settings] Ignoring window_width" << QString::fromStdString(value);
            }
        } else if (key == "window_height") {
            if (!parse_extent(value, kMinWindowHeight, settings.window_height)) {
                qWarning() << "[Settings] Ignoring window_height" << QString::fromStdString(value);
            }
        }
    }
    return settings;
}

void SettingsStore::save(const AppSettings& settings) const {
    std::error_code error;
    if (settings_file_.has_parent_path()) {
        std::filesystem::create_directories(settings_file_.parent_path(), error);
    }

    std::ofstream out(settings_file_, std::ios::trunc);
    if (!out) {
        qWarning() << "[Settings] Unable to write" << QString::fromStdString(settings_file_.string());
        return;
    }

    out << "catalog_file=" << settings.catalog_file << '\n';
    out << "window_width=" << std::clamp(settings.window_width, kMinWindowWidth, kMaxWindowExtent) << '\n';
    out << "window_height=" << std::clamp(settings.window_height, kMinWindowHeight, kMaxWindowExtent) << '\n';
}

} // namespace song_catalog
