#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QThread>

#include <csignal>

#include "PdfiumHelper.hpp"
#include "batchworker.h"
#include "filetype_utils.h"
#include "settings_loader.h"

namespace {
    enum ExitCode {
        ExitOk = 0,
        ExitNoInput = 1,
        ExitConfigError = 2
    };

    // Ctrl+C asks the running batch to stop after the current document.
    BatchWorker *g_activeWorker = nullptr;

    void onInterrupt(int) {
        if (g_activeWorker)
            g_activeWorker->requestCancel();
    }
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("pdfoutline");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Infers a title and H1-H4 outline from PDF documents.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("input", "PDF file or directory of PDFs (default: data).", "[input]");

    const QCommandLineOption outputOption(QStringList() << "o" << "output",
                                          "Output directory for <name>.json files.", "dir", "output");
    const QCommandLineOption configOption(QStringList() << "c" << "config",
                                          "Heuristic configuration file.", "path", "config/settings.json");
    const QCommandLineOption printOption("print", "Also print each outline to stdout.");
    parser.addOption(outputOption);
    parser.addOption(configOption);
    parser.addOption(printOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    const QString input = positional.isEmpty() ? QStringLiteral("data") : positional.first();

    pdfoutline::Settings settings;
    try {
        settings = loadSettings(parser.value(configOption));
    } catch (const pdfoutline::ConfigError &e) {
        qCritical().noquote() << "Configuration error:" << e.what();
        return ExitConfigError;
    }

    const QStringList files = collectPdfFiles(input);
    if (files.isEmpty()) {
        qCritical().noquote() << "No PDF files found at" << input;
        return ExitNoInput;
    }
    qInfo().noquote() << "Processing" << files.size() << "PDF file(s) from" << input;

    const pdfoutline::pdfium::PdfiumLayoutSource source{};

    QThread batchThread;
    BatchWorker worker(files, parser.value(outputOption), settings, source, parser.isSet(printOption));
    worker.moveToThread(&batchThread);

    // Thread start -> worker.process()
    QObject::connect(&batchThread, &QThread::started,
                     &worker, &BatchWorker::process);

    QObject::connect(&worker, &BatchWorker::log, &app,
                     [](const QString &line) { qInfo().noquote() << line; });
    QObject::connect(&worker, &BatchWorker::error, &app,
                     [](const QString &msg) { qWarning().noquote() << msg; });

    QObject::connect(&worker, &BatchWorker::finished,
                     &batchThread, &QThread::quit);
    QObject::connect(&worker, &BatchWorker::finished, &app,
                     [&app, &worker, total = files.size()](const bool cancelled) {
                         qInfo().noquote() << (cancelled ? "Batch cancelled:" : "Batch finished:")
                                 << total - worker.failedCount() << "of" << total << "succeeded.";
                         app.quit();
                     });

    g_activeWorker = &worker;
    std::signal(SIGINT, onInterrupt);

    batchThread.start();
    const int rc = QCoreApplication::exec();

    batchThread.quit();
    batchThread.wait();

    std::signal(SIGINT, SIG_DFL);
    g_activeWorker = nullptr;

    return rc == 0 ? ExitOk : rc;
}
