/*
 * layoutengine.cpp — Content → positioned page boxes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layoutengine.h"
#include "linebreaker.h"
#include "pagefurniture.h"
#include "scriptsegmenter.h"

#include <QDebug>
#include <QMarginsF>

#include <limits>

namespace Layout {

namespace {

constexpr qreal kMinMarkerGap = 2.0;

const QString kBullet = QStringLiteral("•");

QList<Content::ScriptRun> scriptRunsOf(const Content::InlineRun &run)
{
    return run.scriptRuns.isEmpty() ? ScriptSegmenter::segment(run) : run.scriptRuns;
}

int trailingWhitespaceStart(const QString &text)
{
    int end = text.size();
    while (end > 0 && text.at(end - 1).isSpace())
        --end;
    return end;
}

} // anonymous namespace

Engine::Engine(const TextMeasurer &measurer)
    : m_measurer(measurer)
{
}

QString Engine::TextLine::text() const
{
    QString result;
    for (const auto &fragment : fragments)
        result += fragment.text.text;
    return result;
}

Engine::TextStyle Engine::styleFrom(const BlockStyle &block, bool bold, bool italic)
{
    TextStyle style;
    style.fontSize = block.fontSize;
    style.leading = block.leading;
    style.color = block.color;
    style.forceBold = bold;
    style.forceItalic = italic;
    return style;
}

// --- Main entry point ---

LayoutResult Engine::layout(const Content::Document &doc, const PageGeometry &geometry)
{
    m_geometry = geometry;
    m_result = LayoutResult{};
    m_result.pageSize = geometry.pageSizePoints();

    QMarginsF margins = geometry.marginsPoints();
    QSizeF contentSize = geometry.contentSizePoints();
    m_left = margins.left();
    m_top = margins.top();
    m_width = contentSize.width();
    m_bottom = m_top + contentSize.height();

    m_pageIndex = -1;
    newPage();

    for (int i = 0; i < doc.blocks.size(); ++i) {
        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Content::Heading>) {
                layoutHeading(b, keepHeight(doc.blocks, i + 1));
            } else if constexpr (std::is_same_v<T, Content::Paragraph>) {
                if (b.disclaimer)
                    layoutDisclaimer(b);
                else
                    layoutParagraph(b);
            } else if constexpr (std::is_same_v<T, Content::ListBlock>) {
                layoutList(b);
            } else if constexpr (std::is_same_v<T, Content::Table>) {
                layoutTable(b);
            } else if constexpr (std::is_same_v<T, Content::Rule>) {
                layoutRule();
            }
        }, doc.blocks[i]);
    }

    layoutFooters();

    return std::move(m_result);
}

// --- Line breaking ---

QList<Engine::TextLine> Engine::breakInlines(const Content::Inlines &inlines,
                                             const TextStyle &style,
                                             qreal availWidth) const
{
    // A piece is the part of one script run between two break opportunities
    struct Piece {
        int scriptRun = 0;
        QString text;
        int trailingStart = 0; // index of trailing whitespace in text
        TextContent content;   // shaped glyphs of the whole piece
        qreal trailingWidth = 0;
    };

    struct SourceRun {
        Content::ScriptRun run;
        int start = 0;
    };

    QString fullText;
    QList<SourceRun> sources;
    for (const auto &inlineRun : inlines) {
        for (const auto &sr : scriptRunsOf(inlineRun)) {
            if (sr.text.isEmpty())
                continue;
            sources.append({sr, int(fullText.size())});
            fullText += sr.text;
        }
    }
    if (trailingWhitespaceStart(fullText) == 0)
        return {};

    const QList<int> breaks = LineBreaking::breakOpportunities(fullText);

    QList<Piece> pieces;
    QList<LineBreaking::Item> items;
    int breakIdx = 0;
    for (int si = 0; si < sources.size(); ++si) {
        const SourceRun &src = sources[si];
        const int runEnd = src.start + src.run.text.size();
        const bool bold = src.run.bold || style.forceBold;
        const bool italic = src.run.italic || style.forceItalic;
        const Fonts::Role role = Fonts::roleFor(src.run.script, bold);

        int pos = src.start;
        while (pos < runEnd) {
            while (breakIdx < breaks.size() && breaks[breakIdx] <= pos)
                ++breakIdx;
            const bool cutInside = breakIdx < breaks.size() && breaks[breakIdx] < runEnd;
            const int end = cutInside ? breaks[breakIdx] : runEnd;

            Piece piece;
            piece.scriptRun = si;
            piece.text = fullText.mid(pos, end - pos);
            piece.trailingStart = trailingWhitespaceStart(piece.text);

            ShapedText shaped = m_measurer.shape(piece.text, src.run.script, role, style.fontSize);
            for (const auto &g : shaped.glyphs) {
                if (g.cluster >= piece.trailingStart)
                    piece.trailingWidth += g.xAdvance;
            }

            TextContent &tc = piece.content;
            tc.text = piece.text;
            tc.script = src.run.script;
            tc.bold = bold;
            tc.italic = italic;
            tc.role = role;
            tc.fontSize = style.fontSize;
            tc.color = style.color;
            tc.glyphs = shaped.glyphs;

            LineBreaking::Item item;
            item.width = shaped.width - piece.trailingWidth;
            item.trailingSpace = piece.trailingWidth;
            item.breakAfter = end == fullText.size() || breaks.contains(end);
            items.append(item);
            pieces.append(piece);

            pos = end;
        }
    }

    QList<TextLine> lines;
    for (const LineBreaking::Line &br : LineBreaking::breakGreedy(items, availWidth)) {
        TextLine line;
        line.overflow = br.overflow;
        qreal x = 0;
        int currentRun = -1;

        for (int i = br.first; i <= br.last; ++i) {
            const Piece &piece = pieces[i];
            const bool lastOnLine = i == br.last;
            const int keep = lastOnLine ? piece.trailingStart : piece.text.size();
            if (keep == 0 && lastOnLine)
                continue;

            if (piece.scriptRun != currentRun || line.fragments.isEmpty()) {
                Fragment fragment;
                fragment.x = x;
                fragment.text = piece.content;
                fragment.text.text.clear();
                fragment.text.glyphs.clear();
                line.fragments.append(fragment);
                currentRun = piece.scriptRun;
            }

            Fragment &fragment = line.fragments.last();
            const int offset = fragment.text.text.size();
            fragment.text.text += piece.text.left(keep);
            for (GlyphInfo g : piece.content.glyphs) {
                if (g.cluster >= keep)
                    continue;
                g.cluster += offset;
                fragment.text.glyphs.append(g);
                fragment.width += g.xAdvance;
                x += g.xAdvance;
            }
        }

        // Pieces of pure whitespace can leave an empty fragment behind
        for (int f = line.fragments.size() - 1; f >= 0; --f) {
            if (line.fragments[f].text.text.isEmpty())
                line.fragments.removeAt(f);
        }
        line.width = x;
        lines.append(line);
    }
    return lines;
}

Engine::TextLine Engine::singleLine(const QString &text, const TextStyle &style) const
{
    Content::InlineRun run;
    run.text = text;
    QList<TextLine> lines = breakInlines({run}, style, std::numeric_limits<qreal>::max());
    return lines.value(0);
}

// --- Block layout ---

qreal Engine::headingHeight(const Content::Heading &heading, int lineCount) const
{
    return lineCount * m_geometry.headingStyle(heading.level).leading
        + m_geometry.headingRuleGap + m_geometry.headingRuleWidth
        + m_geometry.headingStyle(heading.level).spaceAfter;
}

qreal Engine::keepHeight(const QList<Content::BlockNode> &blocks, int index) const
{
    if (index >= blocks.size())
        return m_geometry.body.leading;

    qreal height = 0;
    bool skip = false;
    std::visit([&](const auto &b) {
        using T = std::decay_t<decltype(b)>;
        if constexpr (std::is_same_v<T, Content::Heading>) {
            TextStyle style = styleFrom(m_geometry.headingStyle(b.level), true);
            const int lineCount = breakInlines(b.inlines, style, m_width).size();
            if (lineCount == 0)
                skip = true;
            else
                height = m_geometry.headingStyle(b.level).spaceBefore
                    + headingHeight(b, lineCount) + keepHeight(blocks, index + 1);
        } else if constexpr (std::is_same_v<T, Content::Paragraph>) {
            const BlockStyle &block = paragraphStyle(b);
            const qreal pad = b.disclaimer ? m_geometry.disclaimerPadding : 0;
            TextStyle style = styleFrom(block, !b.disclaimer && b.headingStyle > 0, b.disclaimer);
            if (breakInlines(b.inlines, style, m_width - 2 * pad).isEmpty())
                skip = true;
            else
                height = block.spaceBefore + 2 * pad + block.leading;
        } else if constexpr (std::is_same_v<T, Content::ListBlock>) {
            if (b.items.isEmpty())
                skip = true;
            else
                height = m_geometry.listItem.spaceBefore + m_geometry.listItem.leading;
        } else if constexpr (std::is_same_v<T, Content::Table>) {
            const int columnCount = b.columnCount();
            if (columnCount == 0) {
                skip = true;
                return;
            }
            const QList<qreal> widths = columnWidths(columnCount);
            height = layoutRow(b.header, columnCount, widths,
                               styleFrom(m_geometry.tableHeader, true),
                               m_geometry.headerBottomPadding).height;
            if (!b.rows.isEmpty())
                height += layoutRow(b.rows.first(), columnCount, widths,
                                    styleFrom(m_geometry.tableCell),
                                    m_geometry.cellPadding).height;
        } else if constexpr (std::is_same_v<T, Content::Rule>) {
            height = m_geometry.ruleSpace + m_geometry.ruleWidth;
        }
    }, blocks[index]);

    return skip ? keepHeight(blocks, index + 1) : height;
}

void Engine::layoutHeading(const Content::Heading &heading, qreal keepWithNext)
{
    TextStyle style = styleFrom(m_geometry.headingStyle(heading.level), true);
    QList<TextLine> lines = breakInlines(heading.inlines, style, m_width);
    if (lines.isEmpty())
        return;

    addSpace(m_geometry.headingStyle(heading.level).spaceBefore);

    // Keep the heading and its rule with the start of the next block
    const qreal needed = headingHeight(heading, lines.size()) + keepWithNext;
    if (m_cursorY + needed > m_bottom && !pageIsEmpty())
        newPage();

    for (const TextLine &line : lines) {
        emitLine(line, m_left, m_cursorY, style, m_width);
        m_cursorY += style.leading;
    }

    const qreal ruleY = m_cursorY + m_geometry.headingRuleGap;
    addLine(QPointF(m_left, ruleY), QPointF(m_left + m_width, ruleY),
            m_geometry.headingRuleWidth, m_geometry.headingRuleColor);
    m_cursorY = ruleY + m_geometry.headingRuleWidth
        + m_geometry.headingStyle(heading.level).spaceAfter;
}

const BlockStyle &Engine::paragraphStyle(const Content::Paragraph &para) const
{
    if (para.disclaimer)
        return m_geometry.disclaimer;
    return para.headingStyle > 0 ? m_geometry.headingStyle(para.headingStyle) : m_geometry.body;
}

void Engine::layoutParagraph(const Content::Paragraph &para)
{
    const BlockStyle &block = paragraphStyle(para);
    TextStyle style = styleFrom(block, para.headingStyle > 0);
    QList<TextLine> lines = breakInlines(para.inlines, style, m_width);
    if (lines.isEmpty())
        return;

    addSpace(block.spaceBefore);
    for (const TextLine &line : lines) {
        ensureSpace(style.leading);
        emitLine(line, m_left, m_cursorY, style, m_width);
        m_cursorY += style.leading;
    }
    m_cursorY += block.spaceAfter;
}

void Engine::layoutDisclaimer(const Content::Paragraph &para)
{
    const BlockStyle &block = m_geometry.disclaimer;
    TextStyle style = styleFrom(block, false, true);
    const qreal pad = m_geometry.disclaimerPadding;
    const qreal innerWidth = m_width - 2 * pad;

    QList<TextLine> lines = breakInlines(para.inlines, style, innerWidth);
    if (lines.isEmpty())
        return;

    addSpace(block.spaceBefore);
    ensureSpace(2 * pad + style.leading);

    qreal boxTop = m_cursorY;
    m_cursorY += pad;
    for (int i = 0; i < lines.size(); ++i) {
        if (i > 0 && m_cursorY + style.leading + pad > m_bottom) {
            // Close this page's part of the box and continue on the next
            addFrame(QRectF(m_left, boxTop, m_width, m_cursorY + pad - boxTop),
                     m_geometry.disclaimerBorderWidth, m_geometry.disclaimerBorderColor);
            newPage();
            boxTop = m_cursorY;
            m_cursorY += pad;
        }
        emitLine(lines[i], m_left + pad, m_cursorY, style, innerWidth);
        m_cursorY += style.leading;
    }
    m_cursorY += pad;
    addFrame(QRectF(m_left, boxTop, m_width, m_cursorY - boxTop),
             m_geometry.disclaimerBorderWidth, m_geometry.disclaimerBorderColor);
    m_cursorY += block.spaceAfter;
}

void Engine::layoutList(const Content::ListBlock &list)
{
    const BlockStyle &block = m_geometry.listItem;
    TextStyle style = styleFrom(block);
    const qreal contentX = m_left + m_geometry.listIndent;
    const qreal contentWidth = m_width - m_geometry.listIndent;

    for (int i = 0; i < list.items.size(); ++i) {
        QList<TextLine> lines = breakInlines(list.items[i], style, contentWidth);
        if (lines.isEmpty())
            lines.append(TextLine{});

        const QString markerText = list.ordered
            ? QString::number(i + 1) + QLatin1Char('.') : kBullet;
        TextLine marker = singleLine(markerText, style);
        qreal markerX = m_left + m_geometry.listMarkerIndent;
        if (markerX + marker.width > contentX - kMinMarkerGap)
            markerX = contentX - kMinMarkerGap - marker.width;

        addSpace(block.spaceBefore);
        for (int li = 0; li < lines.size(); ++li) {
            ensureSpace(style.leading);
            if (li == 0)
                emitLine(marker, markerX, m_cursorY, style, std::numeric_limits<qreal>::max());
            emitLine(lines[li], contentX, m_cursorY, style, contentWidth);
            m_cursorY += style.leading;
        }
        m_cursorY += block.spaceAfter;
    }
}

void Engine::layoutRule()
{
    addSpace(m_geometry.ruleSpace);
    ensureSpace(m_geometry.ruleWidth);
    addLine(QPointF(m_left, m_cursorY), QPointF(m_left + m_width, m_cursorY),
            m_geometry.ruleWidth, m_geometry.ruleColor);
    m_cursorY += m_geometry.ruleWidth + m_geometry.ruleSpace;
}

// --- Tables ---

QList<qreal> Engine::columnWidths(int columnCount) const
{
    QList<qreal> widths;
    if (columnCount == 2 && m_geometry.columnPolicy == PageGeometry::ColumnPolicy::KeyValue) {
        widths << m_width * 0.35 << m_width * 0.65;
        return widths;
    }
    for (int c = 0; c < columnCount; ++c)
        widths.append(m_width / columnCount);
    return widths;
}

Engine::TableRow Engine::layoutRow(const QList<Content::Inlines> &cells, int columnCount,
                                   const QList<qreal> &widths, const TextStyle &style,
                                   qreal bottomPadding) const
{
    const qreal pad = m_geometry.cellPadding;
    TableRow row;
    int maxLines = 1;
    for (int c = 0; c < columnCount; ++c) {
        // Missing trailing cells lay out as empty
        QList<TextLine> lines = breakInlines(cells.value(c), style, widths[c] - 2 * pad);
        maxLines = qMax(maxLines, int(lines.size()));
        row.cells.append(lines);
    }
    row.height = pad + maxLines * style.leading + bottomPadding;
    return row;
}

void Engine::placeRow(const TableRow &row, const QList<qreal> &widths,
                      const TextStyle &style, const QColor &background)
{
    const qreal pad = m_geometry.cellPadding;
    const qreal top = m_cursorY;

    qreal tableWidth = 0;
    for (qreal w : widths)
        tableWidth += w;
    if (background.isValid())
        addFill(QRectF(m_left, top, tableWidth, row.height), background);

    qreal x = m_left;
    for (int c = 0; c < row.cells.size(); ++c) {
        qreal y = top + pad;
        for (const TextLine &line : row.cells[c]) {
            emitLine(line, x + pad, y, style, widths[c] - 2 * pad);
            y += style.leading;
        }
        x += widths[c];
    }
    m_cursorY = top + row.height;
}

void Engine::closeTableFragment(qreal top, const QList<qreal> &rowTops,
                                const QList<qreal> &widths)
{
    qreal tableWidth = 0;
    for (qreal w : widths)
        tableWidth += w;
    const qreal bottom = m_cursorY;

    // Inner grid
    for (qreal y : rowTops) {
        if (y > top && y < bottom)
            addLine(QPointF(m_left, y), QPointF(m_left + tableWidth, y),
                    m_geometry.tableGridWidth, m_geometry.tableGridColor);
    }
    qreal x = m_left;
    for (int c = 0; c + 1 < widths.size(); ++c) {
        x += widths[c];
        addLine(QPointF(x, top), QPointF(x, bottom),
                m_geometry.tableGridWidth, m_geometry.tableGridColor);
    }

    addFrame(QRectF(m_left, top, tableWidth, bottom - top),
             m_geometry.tableBorderWidth, m_geometry.tableBorderColor);
}

void Engine::layoutTable(const Content::Table &table)
{
    const int columnCount = table.columnCount();
    if (columnCount == 0)
        return;

    const QList<qreal> widths = columnWidths(columnCount);
    TextStyle headerStyle = styleFrom(m_geometry.tableHeader, true);
    TextStyle cellStyle = styleFrom(m_geometry.tableCell);

    const TableRow header = layoutRow(table.header, columnCount, widths, headerStyle,
                                      m_geometry.headerBottomPadding);
    QList<TableRow> rows;
    for (const auto &cells : table.rows)
        rows.append(layoutRow(cells, columnCount, widths, cellStyle, m_geometry.cellPadding));

    // Header and first row start together
    const qreal firstHeight = header.height + (rows.isEmpty() ? 0 : rows.first().height);
    if (m_cursorY + firstHeight > m_bottom && !pageIsEmpty())
        newPage();

    qreal fragmentTop = m_cursorY;
    QList<qreal> rowTops;
    placeRow(header, widths, headerStyle, m_geometry.tableHeaderBackground);
    int rowsOnPage = 0;

    for (int i = 0; i < rows.size(); ++i) {
        if (m_cursorY + rows[i].height > m_bottom && rowsOnPage > 0) {
            closeTableFragment(fragmentTop, rowTops, widths);
            newPage();
            fragmentTop = m_cursorY;
            rowTops.clear();
            placeRow(header, widths, headerStyle, m_geometry.tableHeaderBackground);
            rowsOnPage = 0;
        }
        rowTops.append(m_cursorY);
        placeRow(rows[i], widths, cellStyle,
                 i % 2 == 1 ? m_geometry.tableAlternateBackground : QColor());
        ++rowsOnPage;
    }
    closeTableFragment(fragmentTop, rowTops, widths);
    m_cursorY += m_geometry.tableSpaceAfter;
}

// --- Footers ---

void Engine::layoutFooters()
{
    if (!m_geometry.footerEnabled || m_geometry.footerTemplate.isEmpty())
        return;

    TextStyle style = styleFrom(m_geometry.footer);
    const qreal top = m_bottom + m_geometry.footerOffset - baselineOffset(style);
    const int pageCount = m_result.pages.size();

    for (int i = 0; i < pageCount; ++i) {
        PageMetadata meta;
        meta.pageNumber = i;
        meta.totalPages = pageCount;
        meta.title = m_title;

        TextLine line = singleLine(PageFurniture::resolveField(m_geometry.footerTemplate, meta),
                                   style);
        m_pageIndex = i;
        emitLine(line, m_left + (m_width - line.width) / 2, top, style,
                 std::numeric_limits<qreal>::max());
    }
    m_pageIndex = pageCount - 1;
}

// --- Cursor and emission ---

void Engine::newPage()
{
    Page page;
    page.index = m_result.pages.size();
    m_result.pages.append(page);
    m_pageIndex = page.index;
    m_cursorY = m_top;
}

bool Engine::pageIsEmpty() const
{
    return m_result.pages[m_pageIndex].boxes.isEmpty();
}

void Engine::addSpace(qreal space)
{
    // Vertical space is dropped at the top of a page
    if (!pageIsEmpty())
        m_cursorY += space;
}

void Engine::ensureSpace(qreal height)
{
    if (m_cursorY + height > m_bottom && !pageIsEmpty())
        newPage();
}

qreal Engine::baselineOffset(const TextStyle &style) const
{
    const qreal ascent = m_measurer.ascent(Fonts::Role::LatinRegular, style.fontSize);
    const qreal descent = m_measurer.descent(Fonts::Role::LatinRegular, style.fontSize);
    return (style.leading - (ascent + descent)) / 2 + ascent;
}

void Engine::emitLine(const TextLine &line, qreal x, qreal top, const TextStyle &style,
                      qreal available)
{
    const qreal baseline = top + baselineOffset(style);
    for (const Fragment &fragment : line.fragments) {
        TextContent content = fragment.text;
        content.baseline = baseline;
        addBox(QRectF(x + fragment.x, top, fragment.width, style.leading), content);
    }

    if (line.overflow) {
        DegradedRenderWarning warning;
        warning.pageIndex = m_pageIndex;
        warning.text = line.text();
        warning.width = line.width;
        warning.available = available;
        qWarning() << "LayoutEngine: unbreakable text wider than" << available
                   << "pt drawn unwrapped on page" << m_pageIndex + 1 << ":" << warning.text;
        m_result.warnings.append(warning);
    }
}

void Engine::addBox(const QRectF &rect, BoxContent content)
{
    LayoutBox box;
    box.pageIndex = m_pageIndex;
    box.rect = rect;
    box.content = std::move(content);
    m_result.pages[m_pageIndex].boxes.append(std::move(box));
}

void Engine::addLine(const QPointF &from, const QPointF &to, qreal width, const QColor &color)
{
    LineContent line;
    line.from = from;
    line.to = to;
    line.width = width;
    line.color = color;
    addBox(QRectF(from, to).normalized(), line);
}

void Engine::addFill(const QRectF &rect, const QColor &color)
{
    addBox(rect, FillContent{color});
}

void Engine::addFrame(const QRectF &rect, qreal width, const QColor &color)
{
    addLine(rect.topLeft(), rect.topRight(), width, color);
    addLine(rect.topRight(), rect.bottomRight(), width, color);
    addLine(rect.bottomRight(), rect.bottomLeft(), width, color);
    addLine(rect.bottomLeft(), rect.topLeft(), width, color);
}

} // namespace Layout
