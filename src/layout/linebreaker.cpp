/*
 * linebreaker.cpp — Greedy line breaking over measured pieces
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "linebreaker.h"

#include <unicode/brkiter.h>
#include <unicode/unistr.h>

#include <memory>

namespace LineBreaking {

namespace {

// Consecutive items joined by breakAfter == false
struct Group {
    int first = 0;
    int last = 0;
    qreal width = 0;
    qreal trailingSpace = 0;
};

QList<Group> collectGroups(const QList<Item> &items)
{
    QList<Group> groups;
    Group current;
    bool open = false;
    for (int i = 0; i < items.size(); ++i) {
        const Item &item = items[i];
        if (!open) {
            current = Group{i, i, 0, 0};
            open = true;
        } else {
            // Whitespace inside a glued group still takes space
            current.width += current.trailingSpace;
        }
        current.last = i;
        current.width += item.width;
        current.trailingSpace = item.trailingSpace;
        if (item.breakAfter) {
            groups.append(current);
            open = false;
        }
    }
    if (open)
        groups.append(current);
    return groups;
}

} // anonymous namespace

QList<Line> breakGreedy(const QList<Item> &items, qreal availWidth)
{
    QList<Line> lines;
    const QList<Group> groups = collectGroups(items);
    if (groups.isEmpty())
        return lines;

    Line line;
    bool lineOpen = false;
    qreal pendingSpace = 0; // trailing space of the last group on the line

    for (const Group &g : groups) {
        if (lineOpen && line.width + pendingSpace + g.width > availWidth) {
            lines.append(line);
            lineOpen = false;
        }
        if (!lineOpen) {
            line = Line{g.first, g.last, g.width, g.width > availWidth};
            lineOpen = true;
        } else {
            line.last = g.last;
            line.width += pendingSpace + g.width;
        }
        pendingSpace = g.trailingSpace;
    }
    lines.append(line);
    return lines;
}

QList<int> breakOpportunities(const QString &text)
{
    QList<int> positions;
    if (text.isEmpty())
        return positions;

    UErrorCode err = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> lineBreakIter(
        icu::BreakIterator::createLineInstance(icu::Locale::getDefault(), err));
    if (U_FAILURE(err) || !lineBreakIter) {
        // Without ICU data, fall back to breaking after spaces
        for (int i = 1; i < text.size(); ++i) {
            if (text.at(i - 1).isSpace() && !text.at(i).isSpace())
                positions.append(i);
        }
        return positions;
    }

    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()), text.length());
    lineBreakIter->setText(ustr);
    for (int32_t pos = lineBreakIter->first();
         pos != icu::BreakIterator::DONE;
         pos = lineBreakIter->next()) {
        if (pos > 0 && pos < text.size())
            positions.append(pos);
    }
    return positions;
}

} // namespace LineBreaking
