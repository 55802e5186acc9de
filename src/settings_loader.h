#pragma once

#include <QByteArray>
#include <QString>

#include "Settings.hpp"

// Reads the heuristic configuration (JSON). Throws pdfoutline::ConfigError.
pdfoutline::Settings loadSettings(const QString &path);

// Same as loadSettings(), from an in-memory JSON document.
pdfoutline::Settings parseSettings(const QByteArray &json, const QString &origin = QStringLiteral("<memory>"));
