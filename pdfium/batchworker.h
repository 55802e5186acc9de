#pragma once

#include <QObject>
#include <QStringList>
#include <QDir>
#include <QAtomicInteger>

#include "LayoutSource.hpp"
#include "Settings.hpp"

class BatchWorker : public QObject
{
    Q_OBJECT

public:
    BatchWorker(const QStringList &files,
                const QString &outDir,
                const pdfoutline::Settings &settings,
                const pdfoutline::LayoutSource &source,
                bool printToStdout,
                QObject *parent = nullptr);

    [[nodiscard]] int failedCount() const { return m_failed; }

public slots:
    void process();
    void requestCancel();

signals:
    void log(const QString &line);
    void progress(int current, int total); // (idx, total)
    void finished(bool cancelled);
    void error(const QString &msg);

private:
    void processOneFile(int idx, const QString &path);

    QStringList m_files;
    QString m_outDir;
    const pdfoutline::Settings &m_settings;
    const pdfoutline::LayoutSource &m_source;
    bool m_printToStdout;
    int m_failed = 0;

    QAtomicInteger<bool> m_cancelRequested;
};
