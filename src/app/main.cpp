/*
 * main.cpp — reportpdf command-line entry point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>

#include "pagegeometry.h"
#include "reportgenerator.h"

namespace {

void printError(const QString &message)
{
    QTextStream err(stderr);
    err << "reportpdf: " << message << Qt::endl;
}

bool readInput(const QString &path, QString *text)
{
    QFile file;
    bool opened;
    if (path == QLatin1String("-"))
        opened = file.open(stdin, QIODevice::ReadOnly);
    else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        printError(QStringLiteral("cannot read %1: %2").arg(path, file.errorString()));
        return false;
    }
    *text = QString::fromUtf8(file.readAll());
    return true;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("reportpdf"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Typeset a Markdown land-use report as a paginated PDF"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QStringLiteral("Markdown report, or - for stdin"));

    const QCommandLineOption fontsDirOption(
        QStringLiteral("fonts-dir"),
        QStringLiteral("Directory holding the Noto Sans and Noto Sans Devanagari TTFs"),
        QStringLiteral("dir"));
    const QCommandLineOption latinRegularOption(
        QStringLiteral("latin-regular"), QStringLiteral("Latin regular font file"),
        QStringLiteral("file"));
    const QCommandLineOption latinBoldOption(
        QStringLiteral("latin-bold"), QStringLiteral("Latin bold font file"),
        QStringLiteral("file"));
    const QCommandLineOption devaRegularOption(
        QStringLiteral("devanagari-regular"), QStringLiteral("Devanagari regular font file"),
        QStringLiteral("file"));
    const QCommandLineOption devaBoldOption(
        QStringLiteral("devanagari-bold"), QStringLiteral("Devanagari bold font file"),
        QStringLiteral("file"));
    const QCommandLineOption styleOption(
        QStringLiteral("style"), QStringLiteral("Page geometry JSON file"),
        QStringLiteral("file"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QStringLiteral("Output PDF (default: the language's suggested name)"),
        QStringLiteral("file"));
    const QCommandLineOption titleOption(
        QStringLiteral("title"), QStringLiteral("Report title"), QStringLiteral("text"));
    const QCommandLineOption authorOption(
        QStringLiteral("author"), QStringLiteral("Name the report is prepared for"),
        QStringLiteral("name"));
    const QCommandLineOption locationOption(
        QStringLiteral("location"), QStringLiteral("Plot location"), QStringLiteral("text"));
    const QCommandLineOption languageOption(
        QStringLiteral("language"), QStringLiteral("Report language tag (en, hi)"),
        QStringLiteral("tag"), QStringLiteral("en"));

    parser.addOptions({fontsDirOption, latinRegularOption, latinBoldOption,
                       devaRegularOption, devaBoldOption, styleOption, outputOption,
                       titleOption, authorOption, locationOption, languageOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }

    Fonts::FontSources sources;
    if (parser.isSet(fontsDirOption))
        sources = Fonts::FontSources::fromDirectory(parser.value(fontsDirOption));
    if (parser.isSet(latinRegularOption))
        sources.latinRegular = parser.value(latinRegularOption);
    if (parser.isSet(latinBoldOption))
        sources.latinBold = parser.value(latinBoldOption);
    if (parser.isSet(devaRegularOption))
        sources.devanagariRegular = parser.value(devaRegularOption);
    if (parser.isSet(devaBoldOption))
        sources.devanagariBold = parser.value(devaBoldOption);

    Report::ConfigurationError fontError;
    if (!Report::initializeFonts(sources, &fontError)) {
        printError(QStringLiteral("font configuration error (%1, %2): %3")
                       .arg(fontError.fontRole, fontError.path, fontError.message));
        return 1;
    }

    PageGeometry geometry;
    if (parser.isSet(styleOption)) {
        QString styleError;
        if (!PageGeometry::loadFile(parser.value(styleOption), &geometry, &styleError)) {
            printError(styleError);
            return 1;
        }
    }

    QString markdown;
    if (!readInput(args.first(), &markdown))
        return 1;

    Report::ReportOptions options;
    options.title = parser.value(titleOption);
    options.authorName = parser.value(authorOption);
    options.location = parser.value(locationOption);
    options.languageTag = parser.value(languageOption);

    const Report::RenderResult result = Report::renderReport(markdown, options, geometry);
    for (const Report::DegradedRenderWarning &warning : result.warnings) {
        printError(QStringLiteral("warning: page %1: line overflows by %2pt: %3")
                       .arg(warning.pageIndex + 1)
                       .arg(warning.width - warning.available, 0, 'f', 1)
                       .arg(warning.text));
    }
    if (result.pdf.isEmpty()) {
        printError(QStringLiteral("rendering produced no output"));
        return 1;
    }

    const QString outputPath = parser.isSet(outputOption)
        ? parser.value(outputOption)
        : Report::suggestedFileName(options);
    QFile out(outputPath);
    if (!out.open(QIODevice::WriteOnly)
        || out.write(result.pdf) != result.pdf.size()) {
        printError(QStringLiteral("cannot write %1: %2").arg(outputPath, out.errorString()));
        return 1;
    }
    out.close();

    QTextStream(stdout) << QFileInfo(outputPath).absoluteFilePath() << ": "
                        << result.pageCount << " page(s)" << Qt::endl;
    return 0;
}
