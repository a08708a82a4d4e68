/*
 * linebreaker.h — Greedy line breaking over measured pieces
 * SPDX-License-Identifier: GPL-2.0-or-later
 */
#ifndef REPORTPDF_LINEBREAKER_H
#define REPORTPDF_LINEBREAKER_H

#include <QList>
#include <QString>

namespace LineBreaking {

// A measured, unbreakable piece of text. Pieces with breakAfter == false are
// glued to the next piece (a style or script change inside one word).
struct Item {
    qreal width = 0;          // without trailing whitespace
    qreal trailingSpace = 0;  // trailing whitespace, dropped at line end
    bool breakAfter = true;
};

struct Line {
    int first = 0;  // item index, inclusive
    int last = 0;   // item index, inclusive
    qreal width = 0;
    bool overflow = false; // a single unbreakable group wider than the line
};

// First-fit: fill each line until the next group would exceed availWidth.
QList<Line> breakGreedy(const QList<Item> &items, qreal availWidth);

// UTF-16 offsets in text where ICU's line break rules allow a break,
// excluding 0 and text.size().
QList<int> breakOpportunities(const QString &text);

} // namespace LineBreaking

#endif // REPORTPDF_LINEBREAKER_H
