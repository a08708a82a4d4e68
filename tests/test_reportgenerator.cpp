/*
 * test_reportgenerator.cpp — End-to-end tests for Markdown report → PDF
 *
 * Rendering tests need Noto Sans and Noto Sans Devanagari; they resolve the
 * fonts through fontconfig and skip when either family is missing.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QDebug>

#include <thread>
#include <vector>

#ifdef REPORTPDF_HAVE_POPPLER
#include <poppler-qt6.h>
#endif

#include "reportgenerator.h"

using namespace Report;

namespace {

const char kRoundTripMarkdown[] =
    "# भूमि रिपोर्ट\n\nYour plot is **excellent** for _retail_.\n\n"
    "| Use | Cost |\n|---|---|\n| Shop | 5L |\n";

bool fontsAvailable()
{
    static const bool available = [] {
        ConfigurationError error;
        if (initializeFonts(Fonts::FontSources(), &error))
            return true;
        qWarning() << "test_reportgenerator: fonts unavailable:" << error.fontRole
                   << error.message;
        return false;
    }();
    return available;
}

ReportOptions englishOptions()
{
    ReportOptions options;
    options.authorName = QStringLiteral("Asha Verma");
    options.location = QStringLiteral("Pune, Maharashtra");
    options.languageTag = QStringLiteral("en");
    return options;
}

template <typename T>
const T *blockAt(const Content::Document &doc, int index)
{
    return std::get_if<T>(&doc.blocks.at(index));
}

} // anonymous namespace

// ============================================================================
// Languages and labels
// ============================================================================

TEST(ReportGenerator, LanguageTags) {
    EXPECT_EQ(languageFor(QStringLiteral("hi")), Language::Hindi);
    EXPECT_EQ(languageFor(QStringLiteral("hi-IN")), Language::Hindi);
    EXPECT_EQ(languageFor(QStringLiteral("Hindi")), Language::Hindi);
    EXPECT_EQ(languageFor(QStringLiteral("en")), Language::English);
    EXPECT_EQ(languageFor(QStringLiteral("fr")), Language::English);
    EXPECT_EQ(languageFor(QString()), Language::English);
}

TEST(ReportGenerator, SuggestedFileNames) {
    ReportOptions options;
    EXPECT_EQ(suggestedFileName(options), QStringLiteral("AI_Land_Report.pdf"));
    options.languageTag = QStringLiteral("hi");
    EXPECT_EQ(suggestedFileName(options), QStringLiteral("भूमि_रिपोर्ट.pdf"));
}

// ============================================================================
// Document assembly
// ============================================================================

TEST(ReportGenerator, FrontMatterPrecedesBody) {
    Content::Document doc = buildDocument(QStringLiteral("Body text."), englishOptions());
    ASSERT_GE(doc.blocks.size(), 5);

    const auto *title = blockAt<Content::Heading>(doc, 0);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->level, 1);
    EXPECT_EQ(Content::plainText(title->inlines), QStringLiteral("Professional Land Use Report"));

    const auto *prepared = blockAt<Content::Paragraph>(doc, 1);
    ASSERT_NE(prepared, nullptr);
    EXPECT_EQ(Content::plainText(prepared->inlines), QStringLiteral("Prepared for: Asha Verma"));
    const auto *location = blockAt<Content::Paragraph>(doc, 2);
    ASSERT_NE(location, nullptr);
    EXPECT_EQ(Content::plainText(location->inlines),
              QStringLiteral("Location: Pune, Maharashtra"));
    EXPECT_EQ(prepared->headingStyle, 3);
    EXPECT_EQ(location->headingStyle, 3);
    EXPECT_FALSE(prepared->disclaimer);
    EXPECT_NE(blockAt<Content::Rule>(doc, 3), nullptr);

    const auto *body = blockAt<Content::Paragraph>(doc, 4);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(Content::plainText(body->inlines), QStringLiteral("Body text."));
    EXPECT_FALSE(body->inlines.first().scriptRuns.isEmpty());
}

TEST(ReportGenerator, CustomTitleAndEmptyFieldsAreOmitted) {
    ReportOptions options;
    options.title = QStringLiteral("Plot 42");
    Content::Document doc = buildDocument(QString(), options);
    const auto *title = blockAt<Content::Heading>(doc, 0);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(Content::plainText(title->inlines), QStringLiteral("Plot 42"));
    EXPECT_NE(blockAt<Content::Rule>(doc, 1), nullptr);
}

TEST(ReportGenerator, DefaultDisclaimerIsAppended) {
    Content::Document doc = buildDocument(QStringLiteral("Body."), englishOptions());
    const auto *last = std::get_if<Content::Paragraph>(&doc.blocks.last());
    ASSERT_NE(last, nullptr);
    EXPECT_TRUE(last->disclaimer);
    EXPECT_TRUE(Content::plainText(last->inlines).startsWith(QStringLiteral("Disclaimer:")));
}

TEST(ReportGenerator, ExistingDisclaimerIsNotDuplicated) {
    Content::Document doc = buildDocument(
        QStringLiteral("Body.\n\n**Disclaimer:** consult a surveyor."), englishOptions());
    int disclaimers = 0;
    for (const auto &block : doc.blocks) {
        const auto *p = std::get_if<Content::Paragraph>(&block);
        if (p && p->disclaimer)
            ++disclaimers;
    }
    EXPECT_EQ(disclaimers, 1);
}

TEST(ReportGenerator, HindiLabels) {
    ReportOptions options = englishOptions();
    options.languageTag = QStringLiteral("hi");
    Content::Document doc = buildDocument(QStringLiteral("विवरण"), options);

    const auto *title = blockAt<Content::Heading>(doc, 0);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(Content::plainText(title->inlines), QStringLiteral("पेशेवर भूमि उपयोग रिपोर्ट"));
    EXPECT_EQ(title->inlines.first().scriptRuns.first().script, Content::Script::Devanagari);

    const auto *last = std::get_if<Content::Paragraph>(&doc.blocks.last());
    ASSERT_NE(last, nullptr);
    EXPECT_TRUE(last->disclaimer);
    EXPECT_TRUE(Content::plainText(last->inlines).startsWith(QStringLiteral("अस्वीकरण:")));
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ReportGenerator, RoundTripProducesPdf) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    const RenderResult result =
        renderReport(QString::fromUtf8(kRoundTripMarkdown), englishOptions());
    ASSERT_FALSE(result.pdf.isEmpty());
    EXPECT_TRUE(result.pdf.startsWith("%PDF-"));
    EXPECT_TRUE(result.pdf.endsWith("%%EOF\n"));
    EXPECT_EQ(result.pageCount, 1);
    EXPECT_TRUE(result.warnings.isEmpty());
    EXPECT_TRUE(result.pdf.contains("/CIDFontType2"));
    EXPECT_TRUE(result.pdf.contains("/Identity-H"));
    EXPECT_TRUE(result.pdf.contains("/ToUnicode"));
    EXPECT_TRUE(result.pdf.contains("NotoSansDevanagari"));

#ifdef REPORTPDF_HAVE_POPPLER
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(result.pdf);
    ASSERT_NE(doc, nullptr);
    ASSERT_EQ(doc->numPages(), 1);
    std::unique_ptr<Poppler::Page> page = doc->page(0);
    ASSERT_NE(page, nullptr);
    const QString text = page->text(QRectF());
    EXPECT_TRUE(text.contains(QStringLiteral("excellent")));
    EXPECT_TRUE(text.contains(QStringLiteral("Shop")));
    EXPECT_TRUE(text.contains(QStringLiteral("5L")));
    EXPECT_TRUE(text.contains(QStringLiteral("Page 1 of 1")));
#endif
}

TEST(ReportGenerator, OutputIsDeterministic) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    const QString markdown = QString::fromUtf8(kRoundTripMarkdown);
    EXPECT_EQ(renderReportToPdf(markdown, englishOptions()),
              renderReportToPdf(markdown, englishOptions()));
}

TEST(ReportGenerator, EmptyMarkdownStillRenders) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    const RenderResult result = renderReport(QString(), ReportOptions());
    EXPECT_TRUE(result.pdf.startsWith("%PDF-"));
    EXPECT_EQ(result.pageCount, 1);
}

TEST(ReportGenerator, LongReportPaginates) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    QString markdown = QStringLiteral("## Costs\n\n| Item | Cost |\n|---|---|\n");
    for (int i = 0; i < 120; ++i)
        markdown += QStringLiteral("| Item %1 | %1L |\n").arg(i);
    const RenderResult result = renderReport(markdown, englishOptions());
    EXPECT_GT(result.pageCount, 1);
    EXPECT_TRUE(result.warnings.isEmpty());

#ifdef REPORTPDF_HAVE_POPPLER
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(result.pdf);
    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(doc->numPages(), result.pageCount);
    for (int i = 1; i < doc->numPages(); ++i) {
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        ASSERT_NE(page, nullptr);
        EXPECT_TRUE(page->text(QRectF()).contains(QStringLiteral("Item"))) << "page " << i;
    }
#endif
}

TEST(ReportGenerator, UnbreakableWordIsReported) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    const QString markdown = QStringLiteral("Parcel ") + QString(400, QLatin1Char('X'));
    const RenderResult result = renderReport(markdown, englishOptions());
    EXPECT_FALSE(result.pdf.isEmpty());
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings.first().pageIndex, 0);
}

TEST(ReportGenerator, ConcurrentRendersAreIndependent) {
    if (!fontsAvailable())
        GTEST_SKIP() << "Noto Sans / Noto Sans Devanagari not installed";

    const QString english = QString::fromUtf8(kRoundTripMarkdown);
    const QString hindi = QStringLiteral("## सारांश\n\nदुकान के लिए **उत्कृष्ट** स्थान।\n");
    ReportOptions hindiOptions = englishOptions();
    hindiOptions.languageTag = QStringLiteral("hi");

    const QByteArray expectedEnglish = renderReportToPdf(english, englishOptions());
    const QByteArray expectedHindi = renderReportToPdf(hindi, hindiOptions);

    constexpr int kThreads = 8;
    std::vector<QByteArray> outputs(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            outputs[i] = (i % 2 == 0) ? renderReportToPdf(english, englishOptions())
                                      : renderReportToPdf(hindi, hindiOptions);
        });
    }
    for (std::thread &t : threads)
        t.join();

    for (int i = 0; i < kThreads; ++i)
        EXPECT_EQ(outputs[i], (i % 2 == 0) ? expectedEnglish : expectedHindi) << "thread " << i;
}

TEST(ReportGenerator, MissingFontFileIsConfigurationError) {
    Fonts::FontSources sources;
    sources.latinRegular = QStringLiteral("/nonexistent/NotoSans-Regular.ttf");
    ConfigurationError error;
    EXPECT_EQ(Fonts::FontRegistry::load(sources, &error), nullptr);
    EXPECT_EQ(error.fontRole, QStringLiteral("latin-regular"));
    EXPECT_EQ(error.path, sources.latinRegular);
    EXPECT_FALSE(error.message.isEmpty());
}
