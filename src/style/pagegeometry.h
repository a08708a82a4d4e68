/*
 * pagegeometry.h — Page size, margins and block styles for one report
 *
 * Defaults reproduce the land-use report layout: A4, half-inch side
 * margins, three-quarter-inch top/bottom margins, 10/14pt body text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_PAGEGEOMETRY_H
#define REPORTPDF_PAGEGEOMETRY_H

#include <QColor>
#include <QJsonObject>
#include <QMarginsF>
#include <QPageSize>
#include <QSizeF>
#include <QString>

struct BlockStyle {
    qreal fontSize = 10.0;
    qreal leading = 14.0;       // baseline-to-baseline distance
    QColor color = QColor(0, 0, 0);
    qreal spaceBefore = 0;
    qreal spaceAfter = 0;

    static BlockStyle fromJson(const QJsonObject &obj, const BlockStyle &defaults);
    QJsonObject toJson() const;
};

struct PageGeometry
{
    enum class ColumnPolicy {
        Equal,    // content width divided evenly between columns
        KeyValue, // two-column tables split 35% / 65%
    };

    QPageSize::PageSizeId pageSizeId = QPageSize::A4;
    QMarginsF margins{12.7, 19.05, 12.7, 19.05}; // mm

    // Block styles
    BlockStyle headings[3] = {
        {18.0, 21.6, QColor(0x2c, 0x3e, 0x50), 6.0, 12.0},
        {14.0, 16.8, QColor(0x16, 0xa0, 0x85), 6.0, 10.0},
        {12.0, 14.4, QColor(0x34, 0x49, 0x5e), 4.0, 8.0},
    };
    BlockStyle body{10.0, 14.0, QColor(0, 0, 0), 0.0, 6.0};
    BlockStyle listItem{10.0, 14.0, QColor(0, 0, 0), 0.0, 4.0};
    BlockStyle tableCell{9.0, 11.0, QColor(0, 0, 0), 0.0, 0.0};
    BlockStyle tableHeader{10.0, 12.0, QColor(0x2c, 0x3e, 0x50), 0.0, 0.0};
    BlockStyle disclaimer{9.0, 10.8, QColor(0x80, 0x80, 0x80), 12.0, 6.0};
    BlockStyle footer{8.0, 10.0, QColor(0x80, 0x80, 0x80), 0.0, 0.0};

    // Heading underline
    qreal headingRuleWidth = 0.75;
    qreal headingRuleGap = 3.0;
    QColor headingRuleColor = QColor(0xbd, 0xc3, 0xc7);

    // Thematic break
    qreal ruleWidth = 0.5;
    qreal ruleSpace = 8.0;
    QColor ruleColor = QColor(0xbd, 0xc3, 0xc7);

    // Lists
    qreal listIndent = 20.0;
    qreal listMarkerIndent = 10.0; // marker start, from the list edge

    // Tables
    ColumnPolicy columnPolicy = ColumnPolicy::Equal;
    qreal cellPadding = 6.0;
    qreal headerBottomPadding = 12.0;
    qreal tableSpaceAfter = 7.2;
    QColor tableHeaderBackground = QColor(0xec, 0xf0, 0xf1);
    QColor tableAlternateBackground = QColor(0xf7, 0xf9, 0xf9);
    qreal tableGridWidth = 1.0;
    QColor tableGridColor = QColor(0xbd, 0xc3, 0xc7);
    qreal tableBorderWidth = 1.0;
    QColor tableBorderColor = QColor(0, 0, 0);

    // Disclaimer box
    qreal disclaimerPadding = 10.0;
    qreal disclaimerBorderWidth = 1.0;
    QColor disclaimerBorderColor = QColor(0xd3, 0xd3, 0xd3);

    // Footer, below the bottom margin edge
    bool footerEnabled = true;
    QString footerTemplate; // empty = language default
    qreal footerOffset = 24.0; // content bottom → footer baseline

    const BlockStyle &headingStyle(int level) const
    {
        return headings[qBound(1, level, 3) - 1];
    }

    // Return the full page size in points
    QSizeF pageSizePoints() const
    {
        return QPageSize(pageSizeId).size(QPageSize::Point);
    }

    // Return margins in points
    QMarginsF marginsPoints() const
    {
        constexpr qreal mmToPt = 72.0 / 25.4;
        return QMarginsF(margins.left()   * mmToPt,
                         margins.top()    * mmToPt,
                         margins.right()  * mmToPt,
                         margins.bottom() * mmToPt);
    }

    // Return the content area size in points (72 dpi)
    QSizeF contentSizePoints() const
    {
        QSizeF full = pageSizePoints();
        QMarginsF m = marginsPoints();
        return QSizeF(full.width() - m.left() - m.right(),
                      full.height() - m.top() - m.bottom());
    }

    static PageGeometry fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    // Reads a JSON style file over the defaults. Returns false (and leaves
    // *geometry untouched) when the file is unreadable or not a JSON object.
    static bool loadFile(const QString &path, PageGeometry *geometry,
                         QString *errorMessage = nullptr);
};

#endif // REPORTPDF_PAGEGEOMETRY_H
