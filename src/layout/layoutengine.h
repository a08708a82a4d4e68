/*
 * layoutengine.h — Content → positioned page boxes
 *
 * Flows a Content::Document down the pages of a PageGeometry with a single
 * vertical cursor. The output is flat: every page holds an ordered list of
 * LayoutBoxes (text fragments, lines, filled rectangles) in paint order,
 * in page coordinates (points, origin at the top-left corner).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_LAYOUTENGINE_H
#define REPORTPDF_LAYOUTENGINE_H

#include <QColor>
#include <QList>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include <variant>

#include "contentmodel.h"
#include "fontrole.h"
#include "pagegeometry.h"
#include "textmeasurer.h"

namespace Layout {

// --- Boxes ---

struct TextContent {
    QString text;
    Content::Script script = Content::Script::Latin;
    bool bold = false;
    bool italic = false; // painted as an oblique for Latin, ignored for Devanagari
    Fonts::Role role = Fonts::Role::LatinRegular;
    qreal fontSize = 10.0;
    QColor color = QColor(0, 0, 0);
    qreal baseline = 0; // page y
    QList<GlyphInfo> glyphs; // clusters index into text
};

struct LineContent {
    QPointF from;
    QPointF to;
    qreal width = 1.0;
    QColor color = QColor(0, 0, 0);
};

struct FillContent {
    QColor color;
};

using BoxContent = std::variant<TextContent, LineContent, FillContent>;

struct LayoutBox {
    int pageIndex = 0;
    QRectF rect;
    BoxContent content;
};

struct Page {
    int index = 0;
    QList<LayoutBox> boxes;
};

// Content drawn past its available width instead of being wrapped.
struct DegradedRenderWarning {
    int pageIndex = 0;
    QString text;
    qreal width = 0;
    qreal available = 0;
};

struct LayoutResult {
    QList<Page> pages;
    QSizeF pageSize; // in points
    QList<DegradedRenderWarning> warnings;
};

// --- Layout Engine ---

class Engine {
public:
    explicit Engine(const TextMeasurer &measurer);

    LayoutResult layout(const Content::Document &doc, const PageGeometry &geometry);

    // Substituted for {title} in the footer template
    void setDocumentTitle(const QString &title) { m_title = title; }

private:
    struct TextStyle {
        qreal fontSize = 10.0;
        qreal leading = 14.0;
        QColor color;
        bool forceBold = false;
        bool forceItalic = false;
    };

    // A broken line before placement; fragment x is relative to the line start
    struct Fragment {
        qreal x = 0;
        qreal width = 0;
        TextContent text;
    };

    struct TextLine {
        QList<Fragment> fragments;
        qreal width = 0;
        bool overflow = false;
        QString text() const;
    };

    struct TableRow {
        QList<QList<TextLine>> cells;
        qreal height = 0;
    };

    static TextStyle styleFrom(const BlockStyle &block, bool bold = false, bool italic = false);
    const BlockStyle &paragraphStyle(const Content::Paragraph &para) const;

    // Line breaking
    QList<TextLine> breakInlines(const Content::Inlines &inlines, const TextStyle &style,
                                 qreal availWidth) const;
    TextLine singleLine(const QString &text, const TextStyle &style) const;

    // Height that must fit below a heading for it to stay on the page
    qreal headingHeight(const Content::Heading &heading, int lineCount) const;
    qreal keepHeight(const QList<Content::BlockNode> &blocks, int index) const;

    // Block layout
    void layoutHeading(const Content::Heading &heading, qreal keepWithNext);
    void layoutParagraph(const Content::Paragraph &para);
    void layoutDisclaimer(const Content::Paragraph &para);
    void layoutList(const Content::ListBlock &list);
    void layoutTable(const Content::Table &table);
    void layoutRule();
    void layoutFooters();

    // Tables
    QList<qreal> columnWidths(int columnCount) const;
    TableRow layoutRow(const QList<Content::Inlines> &cells, int columnCount,
                       const QList<qreal> &widths, const TextStyle &style,
                       qreal bottomPadding) const;
    void placeRow(const TableRow &row, const QList<qreal> &widths, const TextStyle &style,
                  const QColor &background);
    void closeTableFragment(qreal top, const QList<qreal> &rowTops,
                            const QList<qreal> &widths);

    // Cursor and emission
    void newPage();
    bool pageIsEmpty() const;
    void addSpace(qreal space);
    void ensureSpace(qreal height);
    void emitLine(const TextLine &line, qreal x, qreal top, const TextStyle &style,
                  qreal available);
    void addBox(const QRectF &rect, BoxContent content);
    void addLine(const QPointF &from, const QPointF &to, qreal width, const QColor &color);
    void addFill(const QRectF &rect, const QColor &color);
    void addFrame(const QRectF &rect, qreal width, const QColor &color);
    qreal baselineOffset(const TextStyle &style) const;

    const TextMeasurer &m_measurer;
    PageGeometry m_geometry;
    QString m_title;

    LayoutResult m_result;
    int m_pageIndex = 0;
    qreal m_cursorY = 0; // page y of the next line top

    // Content area, page coordinates
    qreal m_left = 0;
    qreal m_top = 0;
    qreal m_bottom = 0;
    qreal m_width = 0;
};

} // namespace Layout

#endif // REPORTPDF_LAYOUTENGINE_H
