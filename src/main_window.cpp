#include "song_catalog/main_window.hpp"

#include <string>
#include <utility>
#include <vector>

#include <QAbstractItemView>
#include <QCloseEvent>
#include <QDialog>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QListWidgetItem>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>
#include <QVariant>
#include <QWidget>

namespace song_catalog {
namespace {

constexpr int kEntryIdRole = Qt::UserRole + 1;
constexpr int kMinWindowWidth = 520;
constexpr int kMinWindowHeight = 300;

QString display_text(const Song& song) {
    const QString title = QString::fromStdString(song.title);
    if (song.number.empty()) {
        return title;
    }
    return QString::fromUtf8("%1 — %2").arg(title, QString::fromStdString(song.number));
}

} // namespace

MainWindow::MainWindow(
    SettingsStore settings_store,
    AppSettings settings,
    std::filesystem::path catalog_file,
    QWidget* parent
)
    : QMainWindow(parent),
      settings_store_(std::move(settings_store)),
      settings_(std::move(settings)),
      song_store_(std::move(catalog_file)),
      catalog_(song_store_) {
    build_ui();

    const std::optional<std::string> load_error = catalog_.reload();
    if (load_error.has_value()) {
        QMessageBox::critical(this, "Error", QString::fromStdString(*load_error));
    }

    refresh_song_list();
}

void MainWindow::build_ui() {
    setWindowTitle("Song Catalog");
    resize(settings_.window_width, settings_.window_height);
    setMinimumSize(kMinWindowWidth, kMinWindowHeight);

    auto* central = new QWidget(this);
    auto* root_layout = new QVBoxLayout(central);
    root_layout->setContentsMargins(8, 8, 8, 8);
    root_layout->setSpacing(8);

    auto* top_row = new QHBoxLayout();
    top_row->setSpacing(6);

    auto* search_label = new QLabel("Search:", central);
    search_edit_ = new QLineEdit(central);
    search_edit_->setPlaceholderText("Title or number...");
    search_edit_->setClearButtonEnabled(true);

    add_button_ = new QPushButton("Add", central);
    edit_button_ = new QPushButton("Edit", central);
    delete_button_ = new QPushButton("Delete", central);

    top_row->addWidget(search_label);
    top_row->addWidget(search_edit_, 1);
    top_row->addWidget(add_button_);
    top_row->addWidget(edit_button_);
    top_row->addWidget(delete_button_);
    root_layout->addLayout(top_row);

    song_list_ = new QListWidget(central);
    song_list_->setSelectionMode(QAbstractItemView::SingleSelection);
    song_list_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    song_list_->setAlternatingRowColors(true);
    root_layout->addWidget(song_list_, 1);

    auto* bottom_row = new QHBoxLayout();
    bottom_row->setSpacing(6);

    auto* total_caption = new QLabel("Total:", central);
    total_label_ = new QLabel("0", central);
    import_button_ = new QPushButton("Import from text...", central);
    save_button_ = new QPushButton("Save", central);

    bottom_row->addWidget(total_caption);
    bottom_row->addWidget(total_label_);
    bottom_row->addStretch(1);
    bottom_row->addWidget(import_button_);
    bottom_row->addWidget(save_button_);
    root_layout->addLayout(bottom_row);

    setCentralWidget(central);

    connect(search_edit_, &QLineEdit::textChanged, this, &MainWindow::refresh_song_list);
    connect(add_button_, &QPushButton::clicked, this, &MainWindow::handle_add);
    connect(edit_button_, &QPushButton::clicked, this, &MainWindow::handle_edit);
    connect(delete_button_, &QPushButton::clicked, this, &MainWindow::handle_delete);
    connect(song_list_, &QListWidget::itemDoubleClicked, this, &MainWindow::handle_edit);
    connect(import_button_, &QPushButton::clicked, this, &MainWindow::handle_import);
    connect(save_button_, &QPushButton::clicked, this, &MainWindow::handle_save);
}

void MainWindow::refresh_song_list() {
    const std::optional<EntryId> previous = selected_entry_id();
    const std::vector<CatalogEntry> visible = catalog_.search(search_edit_->text().toStdString());

    song_list_->clear();
    for (const CatalogEntry& entry : visible) {
        auto* item = new QListWidgetItem(display_text(entry.song), song_list_);
        item->setData(kEntryIdRole, QVariant::fromValue<qulonglong>(entry.id));
        if (previous.has_value() && *previous == entry.id) {
            song_list_->setCurrentItem(item);
        }
    }

    total_label_->setText(QString::number(static_cast<qulonglong>(visible.size())));
}

std::optional<EntryId> MainWindow::selected_entry_id() const {
    const QListWidgetItem* item = song_list_->currentItem();
    if (item == nullptr || !item->isSelected()) {
        return std::nullopt;
    }
    return static_cast<EntryId>(item->data(kEntryIdRole).toULongLong());
}

std::optional<Song> MainWindow::prompt_song(const QString& title, const Song& initial) {
    QDialog dialog(this);
    dialog.setWindowTitle(title);

    auto* root = new QVBoxLayout(&dialog);
    auto* form = new QFormLayout();
    auto* title_edit = new QLineEdit(QString::fromStdString(initial.title), &dialog);
    auto* number_edit = new QLineEdit(QString::fromStdString(initial.number), &dialog);
    title_edit->setMinimumWidth(320);
    number_edit->setMaximumWidth(160);

    form->addRow("Title:", title_edit);
    form->addRow("Number (optional):", number_edit);
    root->addLayout(form);

    auto* button_box = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dialog);
    button_box->button(QDialogButtonBox::Ok)->setText("Submit");
    root->addWidget(button_box);
    connect(button_box, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(button_box, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    title_edit->setFocus();
    if (dialog.exec() != QDialog::Accepted) {
        return std::nullopt;
    }

    Song song{
        title_edit->text().trimmed().toStdString(),
        number_edit->text().trimmed().toStdString(),
    };
    if (song.title.empty()) {
        QMessageBox::warning(this, "Validation", "Title cannot be empty");
        return std::nullopt;
    }
    return song;
}

void MainWindow::handle_add() {
    const std::optional<Song> song = prompt_song("Add Song", Song{});
    if (!song.has_value()) {
        return;
    }

    report_change("Add", catalog_.add(song->title, song->number));
}

void MainWindow::handle_edit() {
    const std::optional<EntryId> id = selected_entry_id();
    const std::optional<CatalogEntry> entry = id.has_value() ? catalog_.find(*id) : std::nullopt;
    if (!entry.has_value()) {
        QMessageBox::information(this, "Edit", "Select a song to edit (double-click or select + Edit)");
        return;
    }

    const std::optional<Song> song = prompt_song("Edit Song", entry->song);
    if (!song.has_value()) {
        return;
    }

    report_change("Edit", catalog_.edit(entry->id, song->title, song->number));
}

void MainWindow::handle_delete() {
    const std::optional<EntryId> id = selected_entry_id();
    const std::optional<CatalogEntry> entry = id.has_value() ? catalog_.find(*id) : std::nullopt;
    if (!entry.has_value()) {
        QMessageBox::information(this, "Delete", "Select a song to delete");
        return;
    }

    const auto choice = QMessageBox::question(
        this,
        "Delete",
        QString("Delete '%1'?").arg(QString::fromStdString(entry->song.title)),
        QMessageBox::Yes | QMessageBox::No
    );
    if (choice != QMessageBox::Yes) {
        return;
    }

    report_change("Delete", catalog_.remove(entry->id));
}

void MainWindow::handle_save() {
    const std::optional<std::string> save_error = catalog_.save();
    if (save_error.has_value()) {
        QMessageBox::critical(this, "Error", QString::fromStdString(*save_error));
        return;
    }

    QMessageBox::information(
        this,
        "Save",
        QString("Saved %1 songs to %2")
            .arg(static_cast<qulonglong>(catalog_.size()))
            .arg(QString::fromStdString(song_store_.path().string()))
    );
}

void MainWindow::handle_import() {
    QDialog dialog(this);
    dialog.setWindowTitle("Import");
    dialog.resize(520, 360);

    auto* root = new QVBoxLayout(&dialog);
    auto* hint = new QLabel("Paste songs, one per line. Optionally use 'Title - Number' format.", &dialog);
    hint->setWordWrap(true);
    auto* text_edit = new QPlainTextEdit(&dialog);
    root->addWidget(hint);
    root->addWidget(text_edit, 1);

    auto* button_box = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, &dialog);
    root->addWidget(button_box);
    connect(button_box, &QDialogButtonBox::accepted, &dialog, &QDialog::accept);
    connect(button_box, &QDialogButtonBox::rejected, &dialog, &QDialog::reject);

    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    const QString text = text_edit->toPlainText();
    if (text.trimmed().isEmpty()) {
        return;
    }

    const ImportResult result = catalog_.import_text(text.toStdString());
    refresh_song_list();
    if (result.save_error.has_value()) {
        report_save_error("Import", result.save_error);
    }
    QMessageBox::information(
        this,
        "Import",
        QString("Imported %1 songs").arg(static_cast<qulonglong>(result.imported))
    );
}

void MainWindow::report_change(const QString& action, const ChangeResult& result) {
    switch (result.status) {
    case ChangeStatus::Applied:
        break;
    case ChangeStatus::EmptyTitle:
        QMessageBox::warning(this, "Validation", "Title cannot be empty");
        return;
    case ChangeStatus::UnknownEntry:
        QMessageBox::information(this, action, "The selected song no longer exists.");
        refresh_song_list();
        return;
    }

    refresh_song_list();
    report_save_error(action, result.save_error);
}

void MainWindow::report_save_error(const QString& action, const std::optional<std::string>& save_error) {
    if (!save_error.has_value()) {
        return;
    }
    QMessageBox::critical(
        this,
        "Error",
        QString("%1 was applied but not written to disk:\n%2").arg(action, QString::fromStdString(*save_error))
    );
}

void MainWindow::closeEvent(QCloseEvent* event) {
    settings_.window_width = width();
    settings_.window_height = height();
    settings_store_.save(settings_);
    QMainWindow::closeEvent(event);
}

} // namespace song_catalog
