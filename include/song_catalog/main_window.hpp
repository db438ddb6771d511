#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <QMainWindow>

#include "song_catalog/settings_store.hpp"
#include "song_catalog/song_catalog.hpp"
#include "song_catalog/song_store.hpp"
#include "song_catalog/types.hpp"

class QCloseEvent;
class QLabel;
class QLineEdit;
class QListWidget;
class QPushButton;

namespace song_catalog {

class MainWindow final : public QMainWindow {
    Q_OBJECT

public:
    MainWindow(
        SettingsStore settings_store,
        AppSettings settings,
        std::filesystem::path catalog_file,
        QWidget* parent = nullptr
    );
    ~MainWindow() override = default;

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void refresh_song_list();
    void handle_add();
    void handle_edit();
    void handle_delete();
    void handle_save();
    void handle_import();

private:
    SettingsStore settings_store_;
    AppSettings settings_;
    SongStore song_store_;
    SongCatalog catalog_;

    QLineEdit* search_edit_{nullptr};
    QPushButton* add_button_{nullptr};
    QPushButton* edit_button_{nullptr};
    QPushButton* delete_button_{nullptr};
    QListWidget* song_list_{nullptr};
    QLabel* total_label_{nullptr};
    QPushButton* save_button_{nullptr};
    QPushButton* import_button_{nullptr};

    void build_ui();
    void report_change(const QString& action, const ChangeResult& result);
    void report_save_error(const QString& action, const std::optional<std::string>& save_error);
    [[nodiscard]] std::optional<Song> prompt_song(const QString& title, const Song& initial);
    [[nodiscard]] std::optional<EntryId> selected_entry_id() const;
};

} // namespace song_catalog
