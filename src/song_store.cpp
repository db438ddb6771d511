#include "song_catalog/song_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include <QByteArray>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLocale>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariant>

namespace song_catalog {
namespace {

QString describe(const std::filesystem::path& path) {
    return QString::fromStdString(path.string());
}

std::string errno_message() {
    return errno != 0 ? std::strerror(errno) : "unknown error";
}

// Missing, null and "empty" values fall through to the legacy field name.
bool is_blank(const QJsonValue& value) {
    switch (value.type()) {
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        return true;
    case QJsonValue::Bool:
        return !value.toBool();
    case QJsonValue::Double:
        return value.toDouble() == 0.0;
    case QJsonValue::String:
        return value.toString().isEmpty();
    case QJsonValue::Array:
        return value.toArray().isEmpty();
    case QJsonValue::Object:
        return value.toObject().isEmpty();
    }
    return true;
}

QString python_float(const double number) {
    // Shortest round-trip digits, laid out the way Python prints a float.
    const QString scientific = QString::number(number, 'e', QLocale::FloatingPointShortest);
    const qsizetype exponent_at = scientific.indexOf(QLatin1Char('e'));
    QString mantissa = scientific.left(exponent_at);
    QString exponent_text = scientific.mid(exponent_at + 1);
    if (exponent_text.startsWith(QLatin1Char('+'))) {
        exponent_text.remove(0, 1);
    }
    const int exponent = exponent_text.toInt();

    const bool negative = mantissa.startsWith(QLatin1Char('-'));
    if (negative) {
        mantissa.remove(0, 1);
    }
    QString digits = mantissa;
    digits.remove(QLatin1Char('.'));
    while (digits.size() > 1 && digits.endsWith(QLatin1Char('0'))) {
        digits.chop(1);
    }

    QString text;
    if (exponent >= 16 || exponent < -4) {
        text = digits.left(1);
        if (digits.size() > 1) {
            text += QLatin1Char('.') + digits.mid(1);
        }
        text += exponent < 0 ? QStringLiteral("e-") : QStringLiteral("e+");
        text += QString::number(std::abs(exponent)).rightJustified(2, QLatin1Char('0'));
    } else if (exponent >= 0) {
        const qsizetype whole = exponent + 1;
        if (digits.size() <= whole) {
            text = digits + QString(whole - digits.size(), QLatin1Char('0')) + QStringLiteral(".0");
        } else {
            text = digits.left(whole) + QLatin1Char('.') + digits.mid(whole);
        }
    } else {
        text = QStringLiteral("0.") + QString(-exponent - 1, QLatin1Char('0')) + digits;
    }
    return negative ? QLatin1Char('-') + text : text;
}

QString python_string(const QString& text) {
    const bool double_quoted = text.contains(QLatin1Char('\'')) && !text.contains(QLatin1Char('"'));
    const QChar quote = double_quoted ? QLatin1Char('"') : QLatin1Char('\'');

    QString out(quote);
    for (const QChar ch : text) {
        if (ch == QLatin1Char('\\') || ch == quote) {
            out += QLatin1Char('\\');
            out += ch;
        } else if (ch == QLatin1Char('\n')) {
            out += QStringLiteral("\\n");
        } else if (ch == QLatin1Char('\r')) {
            out += QStringLiteral("\\r");
        } else if (ch == QLatin1Char('\t')) {
            out += QStringLiteral("\\t");
        } else if (ch.unicode() < 0x20 || ch.unicode() == 0x7F) {
            out += QStringLiteral("\\x%1").arg(ch.unicode(), 2, 16, QLatin1Char('0'));
        } else {
            out += ch;
        }
    }
    out += quote;
    return out;
}

// Text form of a JSON value as the catalog has always written it: Python literal
// syntax (True, None, [1, 2], {'a': 1}, 1.0).
QString python_repr(const QJsonValue& value) {
    switch (value.type()) {
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        return QStringLiteral("None");
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("True") : QStringLiteral("False");
    case QJsonValue::Double:
        if (value.toVariant().typeId() == QMetaType::LongLong) {
            return QString::number(value.toVariant().toLongLong());
        }
        return python_float(value.toDouble());
    case QJsonValue::String:
        return python_string(value.toString());
    case QJsonValue::Array: {
        QStringList items;
        for (const QJsonValue& item : value.toArray()) {
            items.push_back(python_repr(item));
        }
        return QLatin1Char('[') + items.join(QStringLiteral(", ")) + QLatin1Char(']');
    }
    case QJsonValue::Object: {
        const QJsonObject object = value.toObject();
        QStringList items;
        for (auto it = object.begin(); it != object.end(); ++it) {
            items.push_back(python_string(it.key()) + QStringLiteral(": ") + python_repr(it.value()));
        }
        return QLatin1Char('{') + items.join(QStringLiteral(", ")) + QLatin1Char('}');
    }
    }
    return QStringLiteral("None");
}

std::string value_to_string(const QJsonValue& value) {
    if (value.isString()) {
        return value.toString().toStdString();
    }
    return python_repr(value).toStdString();
}

std::string read_field(const QJsonObject& object, const QString& key, const QString& legacy_key) {
    QJsonValue value = object.value(key);
    if (is_blank(value)) {
        value = object.value(legacy_key);
    }
    if (is_blank(value)) {
        return {};
    }
    return value_to_string(value);
}

std::vector<Song> normalize_songs(const QJsonArray& items) {
    std::vector<Song> songs;
    songs.reserve(static_cast<std::size_t>(items.size()));

    for (const QJsonValue& item : items) {
        if (item.isObject()) {
            const QJsonObject object = item.toObject();
            songs.push_back(Song{
                read_field(object, QStringLiteral("title"), QStringLiteral("name")),
                read_field(object, QStringLiteral("number"), QStringLiteral("num")),
            });
        } else if (item.isString()) {
            songs.push_back(Song{item.toString().toStdString(), {}});
        }
    }

    return songs;
}

QByteArray serialize_songs(const std::vector<Song>& songs) {
    if (songs.empty()) {
        return QByteArrayLiteral("[]\n");
    }

    QJsonArray items;
    for (const Song& song : songs) {
        QJsonObject object;
        object.insert(QStringLiteral("title"), QString::fromStdString(song.title));
        object.insert(QStringLiteral("number"), QString::fromStdString(song.number));
        items.append(object);
    }
    return QJsonDocument(items).toJson(QJsonDocument::Indented);
}

} // namespace

SongStore::SongStore(std::filesystem::path catalog_file) : catalog_file_(std::move(catalog_file)) {}

LoadResult SongStore::load() const {
    LoadResult result{};

    std::error_code error;
    const bool exists = std::filesystem::exists(catalog_file_, error);
    if (error) {
        result.error = "Failed to load " + catalog_file_.string() + ": " + error.message();
        qWarning() << "[SongStore]" << QString::fromStdString(*result.error);
        return result;
    }

    if (!exists) {
        qDebug() << "[SongStore] Creating empty catalog at" << describe(catalog_file_);
        result.error = save(result.songs);
        return result;
    }

    std::ifstream in(catalog_file_, std::ios::binary);
    if (!in) {
        result.error = "Failed to load " + catalog_file_.string() + ": " + errno_message();
        qWarning() << "[SongStore]" << QString::fromStdString(*result.error);
        return result;
    }

    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.error = "Failed to load " + catalog_file_.string() + ": read error";
        qWarning() << "[SongStore]" << QString::fromStdString(*result.error);
        return result;
    }

    QJsonParseError parse_error{};
    const QJsonDocument document = QJsonDocument::fromJson(
        QByteArray(content.data(), static_cast<qsizetype>(content.size())),
        &parse_error
    );
    if (parse_error.error != QJsonParseError::NoError) {
        result.error = "Failed to load " + catalog_file_.string() + ": " + parse_error.errorString().toStdString() +
                       " at offset " + std::to_string(parse_error.offset);
        qWarning() << "[SongStore]" << QString::fromStdString(*result.error);
        return result;
    }

    if (!document.isArray()) {
        qDebug() << "[SongStore]" << describe(catalog_file_) << "does not hold a list, starting empty";
        return result;
    }

    result.songs = normalize_songs(document.array());
    qDebug() << "[SongStore] Loaded" << result.songs.size() << "songs from" << describe(catalog_file_);
    return result;
}

std::optional<std::string> SongStore::save(const std::vector<Song>& songs) const {
    std::error_code error;
    if (catalog_file_.has_parent_path()) {
        std::filesystem::create_directories(catalog_file_.parent_path(), error);
    }

    std::ofstream out(catalog_file_, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::string message = "Failed to save " + catalog_file_.string() + ": " + errno_message();
        qWarning() << "[SongStore]" << QString::fromStdString(message);
        return message;
    }

    const QByteArray payload = serialize_songs(songs);
    out.write(payload.constData(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out) {
        std::string message = "Failed to save " + catalog_file_.string() + ": write error";
        qWarning() << "[SongStore]" << QString::fromStdString(message);
        return message;
    }

    qDebug() << "[SongStore] Saved" << songs.size() << "songs to" << describe(catalog_file_);
    return std::nullopt;
}

} // namespace song_catalog
