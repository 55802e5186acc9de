// BatchWorker.cpp
#include "batchworker.h"

#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include "OutlineExtractor.h"
#include "filetype_utils.h"
#include "outline_json.h"

BatchWorker::BatchWorker(const QStringList &files,
                         const QString &outDir,
                         const pdfoutline::Settings &settings,
                         const pdfoutline::LayoutSource &source,
                         const bool printToStdout,
                         QObject *parent)
    : QObject(parent),
      m_files(files),
      m_outDir(outDir),
      m_settings(settings),
      m_source(source),
      m_printToStdout(printToStdout),
      m_cancelRequested(false) {
}

void BatchWorker::requestCancel() {
    m_cancelRequested.storeRelaxed(true);
}

void BatchWorker::process() {
    const qsizetype total = m_files.size();
    if (total == 0) {
        emit finished(false);
        return;
    }

    if (const QDir dir(m_outDir); !dir.exists() && !dir.mkpath(".")) {
        emit error(QString("Cannot create output directory: %1").arg(m_outDir));
        m_failed = static_cast<int>(total);
        emit finished(false);
        return;
    }

    for (qsizetype i = 0; i < total; ++i) {
        const qsizetype idx = i + 1;

        if (m_cancelRequested.loadRelaxed()) {
            emit log(QStringLiteral("Batch cancelled."));
            emit finished(true);
            return;
        }

        const QString path = m_files.at(i);
        if (QFileInfo fi(path); !fi.exists()) {
            ++m_failed;
            emit log(QString("%1: %2 -> ❌ File not found.")
                .arg(idx)
                .arg(path));
            emit progress(static_cast<int>(idx), static_cast<int>(total));
            continue;
        }

        try {
            processOneFile(static_cast<int>(idx), path);
        } catch (const std::exception &e) {
            ++m_failed;
            emit error(QString("%1: %2 -> Error: %3")
                .arg(idx)
                .arg(path, QString::fromUtf8(e.what())));
        }

        emit progress(static_cast<int>(idx), static_cast<int>(total));
    }

    emit finished(false);
}

void BatchWorker::processOneFile(const int idx, const QString &path) {
    const QFileInfo fi(path);
    const QString outPath = makeOutputPath(m_outDir, fi.completeBaseName());

    // Each document gets its own extractor; nothing carries over between files.
    const pdfoutline::OutlineExtractor extractor(m_settings);
    const pdfoutline::Outline outline = extractor.Run(path.toStdString(), m_source);
    const QByteArray json = outlineToJsonBytes(outline);

    QFile outFile(outPath);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        ++m_failed;
        emit log(QString("%1: %2 -> ❌ Error opening for write: %3")
            .arg(idx)
            .arg(outPath, outFile.errorString()));
        return;
    }
    if (outFile.write(json) != json.size()) {
        ++m_failed;
        emit log(QString("%1: %2 -> ❌ Error writing: %3")
            .arg(idx)
            .arg(outPath, outFile.errorString()));
        return;
    }
    outFile.close();

    if (m_printToStdout) {
        QTextStream out(stdout);
        out << json;
        out.flush();
    }

    if (outline.error) {
        ++m_failed;
        emit log(QString("%1: %2 -> ❌ %3")
            .arg(idx)
            .arg(outPath, QString::fromStdString(*outline.error)));
        return;
    }

    emit log(QString("%1: %2 -> ✅ Done. (%3 headings)")
        .arg(idx)
        .arg(outPath)
        .arg(outline.entries.size()));
}
