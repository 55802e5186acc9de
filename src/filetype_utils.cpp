#include "filetype_utils.h"

#include <QDir>
#include <QFileInfo>

bool isPdfExt(const QString &extLower)
{
    return extLower == QLatin1String("pdf");
}

QStringList collectPdfFiles(const QString &input)
{
    const QFileInfo fi(input);
    if (!fi.exists())
        return {};

    if (fi.isFile())
        return isPdfExt(fi.suffix().toLower()) ? QStringList{fi.filePath()} : QStringList{};

    const QDir dir(input);
    QStringList files;
    for (const QFileInfo &entry: dir.entryInfoList(QDir::Files | QDir::Readable, QDir::Name)) {
        if (isPdfExt(entry.suffix().toLower()))
            files << entry.filePath();
    }
    return files;
}

QString makeOutputPath(const QString &outDir, const QString &baseName)
{
    return QDir(outDir).filePath(baseName + QStringLiteral(".json"));
}
