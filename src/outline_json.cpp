#include "outline_json.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QString>

QJsonObject outlineToJson(const pdfoutline::Outline &outline) {
    QJsonArray entries;
    for (const auto &entry: outline.entries) {
        QJsonObject item;
        item.insert("level", QString::fromLatin1(pdfoutline::LevelName(entry.level)));
        item.insert("text", QString::fromStdString(entry.text));
        item.insert("page", entry.page);
        entries.append(item);
    }

    QJsonObject root;
    root.insert("title", QString::fromStdString(outline.title));
    root.insert("outline", entries);
    if (outline.error)
        root.insert("error", QString::fromStdString(*outline.error));
    return root;
}

QByteArray outlineToJsonBytes(const pdfoutline::Outline &outline) {
    return QJsonDocument(outlineToJson(outline)).toJson(QJsonDocument::Indented);
}
