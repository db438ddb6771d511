#include "song_catalog/text_utils.hpp"

#include <QString>

namespace song_catalog {

std::string trim(const std::string_view value) {
    return QString::fromUtf8(value.data(), static_cast<qsizetype>(value.size())).trimmed().toStdString();
}

bool contains_ignore_case(const std::string_view haystack, const std::string_view needle) {
    if (needle.empty()) {
        return true;
    }

    const QString text = QString::fromUtf8(haystack.data(), static_cast<qsizetype>(haystack.size()));
    const QString pattern = QString::fromUtf8(needle.data(), static_cast<qsizetype>(needle.size()));
    return text.contains(pattern, Qt::CaseInsensitive);
}

} // namespace song_catalog
