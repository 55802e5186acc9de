#pragma once

#include <QByteArray>
#include <QJsonObject>

#include "LayoutTypes.hpp"

// {"title": ..., "outline": [{"level", "text", "page"}, ...], "error"?: ...}
QJsonObject outlineToJson(const pdfoutline::Outline &outline);

QByteArray outlineToJsonBytes(const pdfoutline::Outline &outline);
