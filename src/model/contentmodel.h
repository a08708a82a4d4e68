/*
 * contentmodel.h — Report document nodes (header-only, std::variant)
 *
 * Intermediate representation between Markdown parsing and the layout
 * engine. Block nodes form a closed variant; only list items and table
 * cells carry nested content, and that content is inline runs only.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_CONTENTMODEL_H
#define REPORTPDF_CONTENTMODEL_H

#include <QList>
#include <QString>

#include <variant>

namespace Content {

// --- Script classification ---

enum class Script {
    Latin,
    Devanagari,
};

// A script-homogeneous slice of an InlineRun. Filled by ScriptSegmenter::annotate().
struct ScriptRun {
    QString text;
    Script script = Script::Latin;
    bool bold = false;
    bool italic = false;
};

// --- Inline nodes ---

struct InlineRun {
    QString text;
    bool bold = false;
    bool italic = false;
    QList<ScriptRun> scriptRuns; // empty until segmented
};

using Inlines = QList<InlineRun>;

// --- Block nodes ---

struct Heading {
    int level = 1; // 1-3
    Inlines inlines;
};

struct Paragraph {
    Inlines inlines;
    bool disclaimer = false; // "Disclaimer:" boxed paragraph
    int headingStyle = 0;    // 1-3: set in that heading's style without its rule
};

struct ListBlock {
    bool ordered = false;
    QList<Inlines> items;
};

struct Table {
    QList<Inlines> header;
    QList<QList<Inlines>> rows; // each row has header.size() cells

    int columnCount() const { return header.size(); }
};

struct Rule {
};

using BlockNode = std::variant<Heading, Paragraph, ListBlock, Table, Rule>;

struct Document {
    QList<BlockNode> blocks;
};

// --- Helpers ---

inline QString plainText(const Inlines &inlines)
{
    QString text;
    for (const auto &run : inlines)
        text += run.text;
    return text;
}

} // namespace Content

#endif // REPORTPDF_CONTENTMODEL_H
