/*
 * test_layoutengine.cpp — Unit tests for pagination and block layout
 *
 * Uses a fixed-advance measurer (every UTF-16 unit is half an em wide) so
 * results do not depend on installed fonts.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QStringList>

#include "layoutengine.h"
#include "scriptsegmenter.h"

using namespace Layout;

namespace {

class FixedAdvanceMeasurer : public TextMeasurer {
public:
    ShapedText shape(const QString &text, Content::Script, Fonts::Role,
                     qreal sizePoints) const override
    {
        ShapedText shaped;
        for (int i = 0; i < text.size(); ++i) {
            GlyphInfo g;
            g.glyphId = text.at(i).unicode();
            g.xAdvance = sizePoints * 0.5;
            g.cluster = i;
            shaped.glyphs.append(g);
            shaped.width += g.xAdvance;
        }
        return shaped;
    }
    qreal ascent(Fonts::Role, qreal sizePoints) const override { return sizePoints * 0.8; }
    qreal descent(Fonts::Role, qreal sizePoints) const override { return sizePoints * 0.2; }
};

Content::Inlines plain(const QString &text)
{
    Content::InlineRun run;
    run.text = text;
    return {run};
}

Content::Paragraph paragraph(const QString &text)
{
    Content::Paragraph p;
    p.inlines = plain(text);
    return p;
}

QString words(int count)
{
    QStringList list;
    for (int i = 0; i < count; ++i)
        list << QStringLiteral("word%1").arg(i);
    return list.join(QLatin1Char(' '));
}

QList<TextContent> textsOn(const Page &page)
{
    QList<TextContent> texts;
    for (const LayoutBox &box : page.boxes) {
        if (const auto *t = std::get_if<TextContent>(&box.content))
            texts.append(*t);
    }
    return texts;
}

const LayoutBox *findText(const LayoutResult &result, const QString &text, int *pageIndex = nullptr)
{
    for (const Page &page : result.pages) {
        for (const LayoutBox &box : page.boxes) {
            const auto *t = std::get_if<TextContent>(&box.content);
            if (t && t->text == text) {
                if (pageIndex)
                    *pageIndex = page.index;
                return &box;
            }
        }
    }
    return nullptr;
}

} // anonymous namespace

class LayoutEngineTest : public ::testing::Test {
protected:
    FixedAdvanceMeasurer measurer;
    PageGeometry geometry;
    qreal left = 0;
    qreal top = 0;
    qreal right = 0;
    qreal bottom = 0;

    void SetUp() override {
        geometry.footerEnabled = false;
        const QMarginsF m = geometry.marginsPoints();
        const QSizeF page = geometry.pageSizePoints();
        left = m.left();
        top = m.top();
        right = page.width() - m.right();
        bottom = page.height() - m.bottom();
    }

    LayoutResult run(const Content::Document &doc) {
        Engine engine(measurer);
        return engine.layout(doc, geometry);
    }
};

// ============================================================================
// Pages and text flow
// ============================================================================

TEST_F(LayoutEngineTest, EmptyDocumentHasOnePage) {
    LayoutResult result = run(Content::Document{});
    ASSERT_EQ(result.pages.size(), 1);
    EXPECT_TRUE(result.pages[0].boxes.isEmpty());
    EXPECT_NEAR(result.pageSize.width(), 595.0, 1.0);
    EXPECT_NEAR(result.pageSize.height(), 842.0, 1.0);
}

TEST_F(LayoutEngineTest, ParagraphWrapsWithinContentWidth) {
    Content::Document doc;
    doc.blocks.append(paragraph(words(200)));
    LayoutResult result = run(doc);

    QList<TextContent> texts = textsOn(result.pages[0]);
    EXPECT_GT(texts.size(), 1);
    for (const LayoutBox &box : result.pages[0].boxes) {
        EXPECT_GE(box.rect.left(), left - 0.01);
        EXPECT_LE(box.rect.right(), right + 0.01);
    }
    EXPECT_TRUE(result.warnings.isEmpty());
}

TEST_F(LayoutEngineTest, WrappedLinesDropTrailingSpace) {
    Content::Document doc;
    doc.blocks.append(paragraph(words(200)));
    LayoutResult result = run(doc);
    for (const TextContent &t : textsOn(result.pages[0])) {
        EXPECT_FALSE(t.text.endsWith(QLatin1Char(' '))) << qPrintable(t.text);
        EXPECT_EQ(t.glyphs.size(), t.text.size());
    }
}

TEST_F(LayoutEngineTest, LongDocumentPaginates) {
    Content::Document doc;
    for (int i = 0; i < 120; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Paragraph %1").arg(i)));
    LayoutResult result = run(doc);

    ASSERT_GT(result.pages.size(), 1);
    for (const Page &page : result.pages) {
        EXPECT_FALSE(page.boxes.isEmpty());
        for (const LayoutBox &box : page.boxes) {
            EXPECT_EQ(box.pageIndex, page.index);
            EXPECT_GE(box.rect.top(), top - 0.01);
            EXPECT_LE(box.rect.bottom(), bottom + 0.01);
        }
    }

    // Source order is reading order across pages
    int previousPage = -1;
    for (int i = 0; i < 120; ++i) {
        int pageIndex = -1;
        ASSERT_NE(findText(result, QStringLiteral("Paragraph %1").arg(i), &pageIndex), nullptr);
        EXPECT_GE(pageIndex, previousPage);
        previousPage = pageIndex;
    }
}

TEST_F(LayoutEngineTest, NoSpaceBeforeFirstBlockOnPage) {
    Content::Document doc;
    Content::Heading heading;
    heading.level = 1;
    heading.inlines = plain(QStringLiteral("Title"));
    doc.blocks.append(heading);
    LayoutResult result = run(doc);
    const LayoutBox *box = findText(result, QStringLiteral("Title"));
    ASSERT_NE(box, nullptr);
    EXPECT_NEAR(box->rect.top(), top, 0.01);
}

// ============================================================================
// Headings
// ============================================================================

TEST_F(LayoutEngineTest, HeadingIsBoldWithRuleBelow) {
    Content::Document doc;
    Content::Heading heading;
    heading.level = 2;
    heading.inlines = plain(QStringLiteral("Zoning"));
    doc.blocks.append(heading);
    LayoutResult result = run(doc);

    const LayoutBox *box = findText(result, QStringLiteral("Zoning"));
    ASSERT_NE(box, nullptr);
    const auto &text = std::get<TextContent>(box->content);
    EXPECT_TRUE(text.bold);
    EXPECT_EQ(text.role, Fonts::Role::LatinBold);
    EXPECT_DOUBLE_EQ(text.fontSize, geometry.headings[1].fontSize);
    EXPECT_EQ(text.color, geometry.headings[1].color);

    bool foundRule = false;
    for (const LayoutBox &b : result.pages[0].boxes) {
        if (const auto *line = std::get_if<LineContent>(&b.content)) {
            foundRule = true;
            EXPECT_GT(line->from.y(), box->rect.bottom());
            EXPECT_NEAR(line->from.x(), left, 0.01);
            EXPECT_NEAR(line->to.x(), right, 0.01);
        }
    }
    EXPECT_TRUE(foundRule);
}

TEST_F(LayoutEngineTest, HeadingStyledParagraphHasNoRule) {
    Content::Document doc;
    Content::Paragraph para = paragraph(QStringLiteral("Prepared for: Asha"));
    para.headingStyle = 3;
    doc.blocks.append(para);
    LayoutResult result = run(doc);

    const LayoutBox *box = findText(result, QStringLiteral("Prepared for: Asha"));
    ASSERT_NE(box, nullptr);
    const auto &text = std::get<TextContent>(box->content);
    EXPECT_TRUE(text.bold);
    EXPECT_DOUBLE_EQ(text.fontSize, geometry.headings[2].fontSize);
    EXPECT_EQ(text.color, geometry.headings[2].color);
    EXPECT_DOUBLE_EQ(box->rect.height(), geometry.headings[2].leading);

    for (const LayoutBox &b : result.pages[0].boxes)
        EXPECT_FALSE(std::holds_alternative<LineContent>(b.content));
}

TEST_F(LayoutEngineTest, HeadingNotStrandedAtPageBottom) {
    // 35 one-line paragraphs (14pt leading + 6pt after) leave room for the
    // heading line but not for the heading, its rule and a body line.
    Content::Document doc;
    for (int i = 0; i < 35; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Line %1").arg(i)));
    Content::Heading heading;
    heading.level = 2;
    heading.inlines = plain(QStringLiteral("Next section"));
    doc.blocks.append(heading);
    doc.blocks.append(paragraph(QStringLiteral("Section body")));
    LayoutResult result = run(doc);

    int headingPage = -1;
    int bodyPage = -1;
    int lastLinePage = -1;
    ASSERT_NE(findText(result, QStringLiteral("Line 34"), &lastLinePage), nullptr);
    ASSERT_NE(findText(result, QStringLiteral("Next section"), &headingPage), nullptr);
    ASSERT_NE(findText(result, QStringLiteral("Section body"), &bodyPage), nullptr);
    EXPECT_EQ(lastLinePage, 0);
    EXPECT_EQ(headingPage, 1);
    EXPECT_EQ(bodyPage, 1);
}

TEST_F(LayoutEngineTest, Level3HeadingNearBottomStartsNextPage) {
    // Fill the first page until less than a body line remains after the
    // heading line itself.
    Content::Document doc;
    for (int i = 0; i < 36; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Line %1").arg(i)));
    Content::Heading heading;
    heading.level = 3;
    heading.inlines = plain(QStringLiteral("Title"));
    doc.blocks.append(heading);
    LayoutResult result = run(doc);

    int headingPage = -1;
    const LayoutBox *box = findText(result, QStringLiteral("Title"), &headingPage);
    ASSERT_NE(box, nullptr);
    EXPECT_EQ(headingPage, result.pages.size() - 1);
    EXPECT_GT(headingPage, 0);
    EXPECT_NEAR(box->rect.top(), top, 0.01);
}

// ============================================================================
// Lists
// ============================================================================

TEST_F(LayoutEngineTest, ListMarkersAreSeparateBoxes) {
    Content::Document doc;
    Content::ListBlock list;
    list.items = {plain(QStringLiteral("Shop")), plain(QStringLiteral("Cafe"))};
    doc.blocks.append(list);
    LayoutResult result = run(doc);

    QList<TextContent> texts = textsOn(result.pages[0]);
    ASSERT_EQ(texts.size(), 4);
    EXPECT_EQ(texts[0].text, QStringLiteral("•"));
    EXPECT_EQ(texts[1].text, QStringLiteral("Shop"));

    const LayoutBox *marker = nullptr;
    const LayoutBox *content = findText(result, QStringLiteral("Shop"));
    for (const LayoutBox &b : result.pages[0].boxes) {
        const auto *t = std::get_if<TextContent>(&b.content);
        if (t && t->text == QStringLiteral("•")) {
            marker = &b;
            break;
        }
    }
    ASSERT_NE(marker, nullptr);
    ASSERT_NE(content, nullptr);
    EXPECT_NEAR(content->rect.left(), left + geometry.listIndent, 0.01);
    EXPECT_LT(marker->rect.right(), content->rect.left());
    EXPECT_DOUBLE_EQ(std::get<TextContent>(marker->content).baseline,
                     std::get<TextContent>(content->content).baseline);
}

TEST_F(LayoutEngineTest, OrderedListNumbersItems) {
    Content::Document doc;
    Content::ListBlock list;
    list.ordered = true;
    list.items = {plain(QStringLiteral("a")), plain(QStringLiteral("b")),
                  plain(QStringLiteral("c"))};
    doc.blocks.append(list);
    LayoutResult result = run(doc);
    EXPECT_NE(findText(result, QStringLiteral("1.")), nullptr);
    EXPECT_NE(findText(result, QStringLiteral("3.")), nullptr);
}

TEST_F(LayoutEngineTest, ContinuationLinesAlignWithItemText) {
    Content::Document doc;
    Content::ListBlock list;
    list.items = {plain(words(60))};
    doc.blocks.append(list);
    LayoutResult result = run(doc);

    QList<TextContent> texts = textsOn(result.pages[0]);
    ASSERT_GT(texts.size(), 2);
    for (const LayoutBox &b : result.pages[0].boxes) {
        const auto *t = std::get_if<TextContent>(&b.content);
        if (t && t->text != QStringLiteral("•"))
            EXPECT_NEAR(b.rect.left(), left + geometry.listIndent, 0.01);
    }
}

// ============================================================================
// Tables
// ============================================================================

namespace {

Content::Table makeTable(int rowCount)
{
    Content::Table table;
    table.header = {plain(QStringLiteral("Use")), plain(QStringLiteral("Cost"))};
    for (int i = 0; i < rowCount; ++i)
        table.rows.append(QList<Content::Inlines>{plain(QStringLiteral("Row %1").arg(i)),
                                                  plain(QStringLiteral("%1L").arg(i))});
    return table;
}

} // anonymous namespace

TEST_F(LayoutEngineTest, TableHeaderIsBoldOnShadedBackground) {
    Content::Document doc;
    doc.blocks.append(makeTable(3));
    LayoutResult result = run(doc);

    const LayoutBox *header = findText(result, QStringLiteral("Use"));
    ASSERT_NE(header, nullptr);
    EXPECT_TRUE(std::get<TextContent>(header->content).bold);

    const Page &page = result.pages[0];
    ASSERT_FALSE(page.boxes.isEmpty());
    const auto *fill = std::get_if<FillContent>(&page.boxes.first().content);
    ASSERT_NE(fill, nullptr);
    EXPECT_EQ(fill->color, geometry.tableHeaderBackground);
    EXPECT_TRUE(page.boxes.first().rect.contains(header->rect.center()));
}

TEST_F(LayoutEngineTest, AlternateRowsAreShaded) {
    Content::Document doc;
    doc.blocks.append(makeTable(4));
    LayoutResult result = run(doc);

    int alternateFills = 0;
    for (const LayoutBox &b : result.pages[0].boxes) {
        const auto *fill = std::get_if<FillContent>(&b.content);
        if (fill && fill->color == geometry.tableAlternateBackground)
            ++alternateFills;
    }
    EXPECT_EQ(alternateFills, 2);
}

TEST_F(LayoutEngineTest, EqualColumnsSplitContentWidth) {
    Content::Document doc;
    doc.blocks.append(makeTable(1));
    LayoutResult result = run(doc);
    const LayoutBox *cost = findText(result, QStringLiteral("Cost"));
    ASSERT_NE(cost, nullptr);
    EXPECT_NEAR(cost->rect.left(), left + (right - left) / 2 + geometry.cellPadding, 0.01);
}

TEST_F(LayoutEngineTest, KeyValueColumnsSplit35To65) {
    geometry.columnPolicy = PageGeometry::ColumnPolicy::KeyValue;
    Content::Document doc;
    doc.blocks.append(makeTable(1));
    LayoutResult result = run(doc);
    const LayoutBox *cost = findText(result, QStringLiteral("Cost"));
    ASSERT_NE(cost, nullptr);
    EXPECT_NEAR(cost->rect.left(), left + (right - left) * 0.35 + geometry.cellPadding, 0.01);
}

TEST_F(LayoutEngineTest, TableHeaderRepeatsOnEveryPage) {
    Content::Document doc;
    doc.blocks.append(makeTable(80));
    LayoutResult result = run(doc);

    ASSERT_GT(result.pages.size(), 1);
    for (const Page &page : result.pages) {
        QList<TextContent> texts = textsOn(page);
        ASSERT_GE(texts.size(), 2);
        EXPECT_EQ(texts[0].text, QStringLiteral("Use"));
        EXPECT_TRUE(texts[0].bold);
        EXPECT_EQ(texts[1].text, QStringLiteral("Cost"));
        for (const LayoutBox &box : page.boxes)
            EXPECT_LE(box.rect.bottom(), bottom + 0.01);
    }

    // Every body row appears exactly once
    for (int i = 0; i < 80; ++i)
        EXPECT_NE(findText(result, QStringLiteral("Row %1").arg(i)), nullptr);
}

TEST_F(LayoutEngineTest, WideCellTextWrapsInsideColumn) {
    Content::Document doc;
    Content::Table table;
    table.header = {plain(QStringLiteral("Use")), plain(QStringLiteral("Notes"))};
    table.rows.append(QList<Content::Inlines>{plain(QStringLiteral("Shop")), plain(words(40))});
    doc.blocks.append(table);
    LayoutResult result = run(doc);

    const qreal columnRight = right - geometry.cellPadding;
    int noteLines = 0;
    for (const LayoutBox &b : result.pages[0].boxes) {
        const auto *t = std::get_if<TextContent>(&b.content);
        if (t && t->text.startsWith(QStringLiteral("word"))) {
            ++noteLines;
            EXPECT_LE(b.rect.right(), columnRight + 0.01);
        }
    }
    EXPECT_GT(noteLines, 1);
}

TEST_F(LayoutEngineTest, HeadingStaysWithFollowingTable) {
    // 33 one-line paragraphs leave room for the heading, its rule and a body
    // line, but not for the table header and first row below them.
    Content::Document doc;
    for (int i = 0; i < 33; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Line %1").arg(i)));
    Content::Heading heading;
    heading.level = 2;
    heading.inlines = plain(QStringLiteral("Costs"));
    doc.blocks.append(heading);
    doc.blocks.append(makeTable(3));
    LayoutResult result = run(doc);

    int lastLinePage = -1;
    int headingPage = -1;
    int headerPage = -1;
    ASSERT_NE(findText(result, QStringLiteral("Line 32"), &lastLinePage), nullptr);
    const LayoutBox *box = findText(result, QStringLiteral("Costs"), &headingPage);
    ASSERT_NE(box, nullptr);
    ASSERT_NE(findText(result, QStringLiteral("Use"), &headerPage), nullptr);
    EXPECT_EQ(lastLinePage, 0);
    EXPECT_EQ(headingPage, 1);
    EXPECT_EQ(headerPage, 1);
    EXPECT_NEAR(box->rect.top(), top, 0.01);

    // Nothing after the last paragraph is left on the first page
    const LayoutBox &last = result.pages[0].boxes.last();
    const auto *t = std::get_if<TextContent>(&last.content);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->text, QStringLiteral("Line 32"));
}

TEST_F(LayoutEngineTest, HeadingStaysWithFollowingDisclaimer) {
    Content::Document doc;
    for (int i = 0; i < 33; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Line %1").arg(i)));
    Content::Heading heading;
    heading.level = 2;
    heading.inlines = plain(QStringLiteral("Notes"));
    doc.blocks.append(heading);
    Content::Paragraph note = paragraph(QStringLiteral("Disclaimer: informational only."));
    note.disclaimer = true;
    doc.blocks.append(note);
    LayoutResult result = run(doc);

    int headingPage = -1;
    int notePage = -1;
    ASSERT_NE(findText(result, QStringLiteral("Notes"), &headingPage), nullptr);
    ASSERT_NE(findText(result, QStringLiteral("Disclaimer: informational only."), &notePage),
              nullptr);
    EXPECT_EQ(headingPage, notePage);
}

// ============================================================================
// Disclaimer, rules and footers
// ============================================================================

TEST_F(LayoutEngineTest, DisclaimerIsItalicInsideFrame) {
    Content::Document doc;
    Content::Paragraph p = paragraph(QStringLiteral("Disclaimer: informational only."));
    p.disclaimer = true;
    doc.blocks.append(p);
    LayoutResult result = run(doc);

    const LayoutBox *box = findText(result, QStringLiteral("Disclaimer: informational only."));
    ASSERT_NE(box, nullptr);
    const auto &text = std::get<TextContent>(box->content);
    EXPECT_TRUE(text.italic);
    EXPECT_EQ(text.color, geometry.disclaimer.color);
    EXPECT_NEAR(box->rect.left(), left + geometry.disclaimerPadding, 0.01);

    int frameLines = 0;
    for (const LayoutBox &b : result.pages[0].boxes) {
        if (std::holds_alternative<LineContent>(b.content))
            ++frameLines;
    }
    EXPECT_EQ(frameLines, 4);
}

TEST_F(LayoutEngineTest, RuleSpansContentWidth) {
    Content::Document doc;
    doc.blocks.append(paragraph(QStringLiteral("above")));
    doc.blocks.append(Content::Rule{});
    LayoutResult result = run(doc);
    const auto *line = std::get_if<LineContent>(&result.pages[0].boxes.last().content);
    ASSERT_NE(line, nullptr);
    EXPECT_NEAR(line->to.x() - line->from.x(), right - left, 0.01);
    EXPECT_EQ(line->color, geometry.ruleColor);
}

TEST_F(LayoutEngineTest, FooterShowsPageOfPages) {
    geometry.footerEnabled = true;
    geometry.footerTemplate = QStringLiteral("Page {page} of {pages}");
    Content::Document doc;
    for (int i = 0; i < 60; ++i)
        doc.blocks.append(paragraph(QStringLiteral("Paragraph %1").arg(i)));
    LayoutResult result = run(doc);

    ASSERT_EQ(result.pages.size(), 2);
    int pageIndex = -1;
    const LayoutBox *first = findText(result, QStringLiteral("Page 1 of 2"), &pageIndex);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(pageIndex, 0);
    EXPECT_GT(first->rect.top(), bottom);
    EXPECT_NEAR(first->rect.center().x(), (left + right) / 2, 0.01);
    ASSERT_NE(findText(result, QStringLiteral("Page 2 of 2"), &pageIndex), nullptr);
    EXPECT_EQ(pageIndex, 1);
}

// ============================================================================
// Scripts and degraded rendering
// ============================================================================

TEST_F(LayoutEngineTest, DevanagariUsesDevanagariRoles) {
    Content::Document doc;
    Content::InlineRun plainRun;
    plainRun.text = QStringLiteral("Plot भूमि ");
    Content::InlineRun boldRun;
    boldRun.text = QStringLiteral("उत्कृष्ट");
    boldRun.bold = true;
    Content::Paragraph p;
    p.inlines = {plainRun, boldRun};
    doc.blocks.append(p);
    ScriptSegmenter::annotate(doc);
    LayoutResult result = run(doc);

    QList<TextContent> texts = textsOn(result.pages[0]);
    ASSERT_EQ(texts.size(), 3);
    EXPECT_EQ(texts[0].role, Fonts::Role::LatinRegular);
    EXPECT_EQ(texts[1].role, Fonts::Role::DevanagariRegular);
    EXPECT_EQ(texts[1].script, Content::Script::Devanagari);
    EXPECT_EQ(texts[2].role, Fonts::Role::DevanagariBold);
    EXPECT_EQ(texts[2].text, QStringLiteral("उत्कृष्ट"));
}

TEST_F(LayoutEngineTest, OverwideWordIsDrawnAndReported) {
    Content::Document doc;
    const QString longWord(300, QLatin1Char('x'));
    doc.blocks.append(paragraph(QStringLiteral("short ") + longWord + QStringLiteral(" tail")));
    LayoutResult result = run(doc);

    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings[0].text, longWord);
    EXPECT_EQ(result.warnings[0].pageIndex, 0);
    EXPECT_GT(result.warnings[0].width, result.warnings[0].available);
    EXPECT_NE(findText(result, longWord), nullptr);
    EXPECT_NE(findText(result, QStringLiteral("tail")), nullptr);
}
