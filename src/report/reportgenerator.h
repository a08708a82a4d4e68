/*
 * reportgenerator.h — Markdown report → PDF bytes
 *
 * The boundary of the core: parse, segment, lay out and render one report.
 * Fonts are loaded once per process with initializeFonts() and shared
 * read-only between concurrent calls; everything else is per call.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_REPORTGENERATOR_H
#define REPORTPDF_REPORTGENERATOR_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <memory>

#include "contentmodel.h"
#include "fontregistry.h"
#include "layoutengine.h"
#include "pagegeometry.h"

namespace Report {

using ConfigurationError = Fonts::ConfigurationError;
using DegradedRenderWarning = Layout::DegradedRenderWarning;

struct ReportOptions {
    QString title;      // empty = the language's default report title
    QString authorName;
    QString location;
    QString languageTag = QStringLiteral("en"); // "en" or "hi"
};

struct RenderResult {
    QByteArray pdf; // empty only when fonts are not initialised
    int pageCount = 0;
    QList<DegradedRenderWarning> warnings;
};

enum class Language {
    English,
    Hindi,
};

// "hi", "hi-IN", "hindi" → Hindi; anything else → English
Language languageFor(const QString &languageTag);

// Cosmetic label text per report language
struct Labels {
    QString reportTitle;
    QString preparedFor; // "%1" = author name
    QString location;    // "%1" = location
    QString footer;      // {page} / {pages} / {title} fields
    QString disclaimer;
    QString fileName;
};

Labels labelsFor(Language language);

// Loads the process-wide font registry. Call once at startup; a failure is
// fatal for the service.
bool initializeFonts(const Fonts::FontSources &sources, ConfigurationError *error = nullptr);
std::shared_ptr<const Fonts::FontRegistry> fontRegistry();

// Front matter + parsed body + default disclaimer, script-annotated
Content::Document buildDocument(const QString &markdown, const ReportOptions &options);

RenderResult renderReport(const QString &markdown, const ReportOptions &options,
                          const PageGeometry &geometry = PageGeometry());

// The boundary operation: always a document for initialised fonts
QByteArray renderReportToPdf(const QString &markdown, const ReportOptions &options);

QString suggestedFileName(const ReportOptions &options);

} // namespace Report

#endif // REPORTPDF_REPORTGENERATOR_H
