#pragma once

#include <QString>
#include <QStringList>

bool isPdfExt(const QString &extLower);

// A single PDF file, or every PDF directly inside a directory (sorted by name).
// Empty when the input does not exist or holds no PDF.
QStringList collectPdfFiles(const QString &input);

// <outDir>/<baseName>.json
QString makeOutputPath(const QString &outDir, const QString &baseName);
