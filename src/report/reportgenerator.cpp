/*
 * reportgenerator.cpp — Markdown report → PDF bytes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportgenerator.h"
#include "contentbuilder.h"
#include "pdfgenerator.h"
#include "scriptsegmenter.h"
#include "textshaper.h"

#include <QDebug>

#include <atomic>
#include <type_traits>

namespace Report {

namespace {

// Written once by initializeFonts(); read concurrently afterwards
std::shared_ptr<const Fonts::FontRegistry> s_registry;

Content::Inlines boldText(const QString &text)
{
    Content::InlineRun run;
    run.text = text;
    run.bold = true;
    return {run};
}

QString blockText(const Content::BlockNode &block)
{
    return std::visit([](const auto &b) -> QString {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Content::Heading>
                      || std::is_same_v<T, Content::Paragraph>) {
            return Content::plainText(b.inlines);
        } else if constexpr (std::is_same_v<T, Content::ListBlock>) {
            QString text;
            for (const auto &item : b.items)
                text += Content::plainText(item) + QLatin1Char('\n');
            return text;
        } else if constexpr (std::is_same_v<T, Content::Table>) {
            QString text;
            for (const auto &cell : b.header)
                text += Content::plainText(cell) + QLatin1Char('\n');
            for (const auto &row : b.rows)
                for (const auto &cell : row)
                    text += Content::plainText(cell) + QLatin1Char('\n');
            return text;
        } else {
            return QString();
        }
    }, block);
}

bool mentionsDisclaimer(const Content::Document &doc)
{
    for (const auto &block : doc.blocks) {
        const QString text = blockText(block);
        if (text.contains(QLatin1String("Disclaimer"))
            || text.contains(QStringLiteral("अस्वीकरण")))
            return true;
    }
    return false;
}

QString reportTitle(const ReportOptions &options, const Labels &labels)
{
    return options.title.trimmed().isEmpty() ? labels.reportTitle : options.title.trimmed();
}

} // anonymous namespace

Language languageFor(const QString &languageTag)
{
    const QString tag = languageTag.trimmed().toLower();
    if (tag == QLatin1String("hi") || tag.startsWith(QLatin1String("hi-"))
        || tag.startsWith(QLatin1String("hi_")) || tag == QLatin1String("hindi"))
        return Language::Hindi;
    return Language::English;
}

Labels labelsFor(Language language)
{
    Labels labels;
    if (language == Language::Hindi) {
        labels.reportTitle = QStringLiteral("पेशेवर भूमि उपयोग रिपोर्ट");
        labels.preparedFor = QStringLiteral("तैयार की गई: %1");
        labels.location = QStringLiteral("स्थान: %1");
        labels.footer = QStringLiteral("पृष्ठ {page} / {pages}");
        labels.disclaimer = QStringLiteral(
            "अस्वीकरण: यह रिपोर्ट केवल सूचनात्मक उद्देश्यों के लिए है। किसी भी निवेश "
            "निर्णय लेने से पहले कृपया स्थानीय जोनिंग अधिकारियों, वित्तीय सलाहकारों और "
            "कानूनी पेशेवरों से परामर्श करें।");
        labels.fileName = QStringLiteral("भूमि_रिपोर्ट.pdf");
    } else {
        labels.reportTitle = QStringLiteral("Professional Land Use Report");
        labels.preparedFor = QStringLiteral("Prepared for: %1");
        labels.location = QStringLiteral("Location: %1");
        labels.footer = QStringLiteral("Page {page} of {pages}");
        labels.disclaimer = QStringLiteral(
            "Disclaimer: This report is for informational purposes only. Please consult "
            "with local zoning authorities, financial advisors, and legal professionals "
            "before making any investment decisions.");
        labels.fileName = QStringLiteral("AI_Land_Report.pdf");
    }
    return labels;
}

// --- Fonts ---

bool initializeFonts(const Fonts::FontSources &sources, ConfigurationError *error)
{
    std::shared_ptr<const Fonts::FontRegistry> registry =
        Fonts::FontRegistry::load(sources, error);
    if (!registry)
        return false;
    std::atomic_store(&s_registry, registry);
    return true;
}

std::shared_ptr<const Fonts::FontRegistry> fontRegistry()
{
    return std::atomic_load(&s_registry);
}

// --- Document assembly ---

Content::Document buildDocument(const QString &markdown, const ReportOptions &options)
{
    const Labels labels = labelsFor(languageFor(options.languageTag));

    ContentBuilder builder;
    Content::Document body = builder.build(markdown);

    Content::Document doc;

    // Front matter
    Content::Heading title;
    title.level = 1;
    title.inlines = boldText(reportTitle(options, labels));
    doc.blocks.append(title);

    if (!options.authorName.trimmed().isEmpty()) {
        Content::Paragraph prepared;
        prepared.inlines = boldText(labels.preparedFor.arg(options.authorName.trimmed()));
        prepared.headingStyle = 3;
        doc.blocks.append(prepared);
    }
    if (!options.location.trimmed().isEmpty()) {
        Content::Paragraph location;
        location.inlines = boldText(labels.location.arg(options.location.trimmed()));
        location.headingStyle = 3;
        doc.blocks.append(location);
    }
    doc.blocks.append(Content::Rule{});

    doc.blocks.append(body.blocks);

    if (!mentionsDisclaimer(body)) {
        Content::Paragraph disclaimer;
        Content::InlineRun run;
        run.text = labels.disclaimer;
        disclaimer.inlines = {run};
        disclaimer.disclaimer = true;
        doc.blocks.append(disclaimer);
    }

    ScriptSegmenter::annotate(doc);
    return doc;
}

// --- Rendering ---

RenderResult renderReport(const QString &markdown, const ReportOptions &options,
                          const PageGeometry &geometry)
{
    RenderResult result;

    std::shared_ptr<const Fonts::FontRegistry> registry = fontRegistry();
    if (!registry) {
        qWarning() << "ReportGenerator: fonts are not initialised; call initializeFonts() first";
        return result;
    }

    const Labels labels = labelsFor(languageFor(options.languageTag));
    const QString title = reportTitle(options, labels);

    Content::Document doc = buildDocument(markdown, options);

    PageGeometry pageGeometry = geometry;
    if (pageGeometry.footerTemplate.isEmpty())
        pageGeometry.footerTemplate = labels.footer;

    TextShaper shaper(registry);
    Layout::Engine engine(shaper);
    engine.setDocumentTitle(title);
    Layout::LayoutResult layout = engine.layout(doc, pageGeometry);

    PdfDocumentInfo info;
    info.title = title;
    info.author = options.authorName.trimmed();
    info.subject = options.location.trimmed();

    PdfGenerator generator(registry);
    result.pdf = generator.generate(layout, info);
    result.pageCount = layout.pages.size();
    result.warnings = layout.warnings;

    qDebug() << "ReportGenerator:" << result.pageCount << "pages,"
             << result.pdf.size() << "bytes," << result.warnings.size() << "warnings";
    return result;
}

QByteArray renderReportToPdf(const QString &markdown, const ReportOptions &options)
{
    return renderReport(markdown, options).pdf;
}

QString suggestedFileName(const ReportOptions &options)
{
    return labelsFor(languageFor(options.languageTag)).fileName;
}

} // namespace Report
