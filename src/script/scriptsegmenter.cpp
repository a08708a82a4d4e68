/*
 * scriptsegmenter.cpp — Split inline runs into script-homogeneous runs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "scriptsegmenter.h"

#include <algorithm>
#include <iterator>

#include <unicode/uscript.h>

namespace ScriptSegmenter {

namespace {

struct BlockRange {
    char32_t first;
    char32_t last;
    Content::Script script;
};

// Sorted by first code point
constexpr BlockRange kScriptBlocks[] = {
    {0x0900, 0x097F, Content::Script::Devanagari},   // Devanagari
    {0x1CD0, 0x1CFF, Content::Script::Devanagari},   // Vedic Extensions
    {0xA8E0, 0xA8FF, Content::Script::Devanagari},   // Devanagari Extended
    {0x11B00, 0x11B5F, Content::Script::Devanagari}, // Devanagari Extended-A
};

const BlockRange *findBlock(char32_t cp)
{
    auto it = std::upper_bound(std::begin(kScriptBlocks), std::end(kScriptBlocks), cp,
                               [](char32_t value, const BlockRange &r) {
                                   return value < r.first;
                               });
    if (it == std::begin(kScriptBlocks))
        return nullptr;
    --it;
    return (cp <= it->last) ? it : nullptr;
}

void addToRun(QList<Content::ScriptRun> &runs, const Content::InlineRun &source,
              Content::Script script, QStringView text)
{
    if (!runs.isEmpty() && runs.last().script == script) {
        runs.last().text += text;
        return;
    }
    Content::ScriptRun run;
    run.text = text.toString();
    run.script = script;
    run.bold = source.bold;
    run.italic = source.italic;
    runs.append(run);
}

void annotateInlines(Content::Inlines &inlines)
{
    for (auto &run : inlines)
        run.scriptRuns = segment(run);
}

} // anonymous namespace

CharClass classify(char32_t codePoint)
{
    if (const BlockRange *block = findBlock(codePoint))
        return block->script == Content::Script::Devanagari
            ? CharClass::Devanagari : CharClass::Latin;

    UErrorCode err = U_ZERO_ERROR;
    UScriptCode script = uscript_getScript(static_cast<UChar32>(codePoint), &err);
    if (U_FAILURE(err) || script == USCRIPT_COMMON || script == USCRIPT_INHERITED
        || script == USCRIPT_INVALID_CODE)
        return CharClass::Neutral;
    return CharClass::Latin;
}

QList<Content::ScriptRun> segment(const Content::InlineRun &run)
{
    QList<Content::ScriptRun> runs;
    const QString &text = run.text;
    Content::Script current = Content::Script::Latin;

    int pos = 0;
    while (pos < text.size()) {
        // Decode code point (handle surrogate pairs)
        char32_t cp = text.at(pos).unicode();
        int len = 1;
        if (pos + 1 < text.size()
            && QChar::isHighSurrogate(text.at(pos).unicode())
            && QChar::isLowSurrogate(text.at(pos + 1).unicode())) {
            cp = QChar::surrogateToUcs4(text.at(pos), text.at(pos + 1));
            len = 2;
        }

        switch (classify(cp)) {
        case CharClass::Latin:
            current = Content::Script::Latin;
            break;
        case CharClass::Devanagari:
            current = Content::Script::Devanagari;
            break;
        case CharClass::Neutral:
            break;
        }

        addToRun(runs, run, current, QStringView(text).mid(pos, len));
        pos += len;
    }
    return runs;
}

void annotate(Content::Document &doc)
{
    for (auto &block : doc.blocks) {
        std::visit([](auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Content::Heading>
                          || std::is_same_v<T, Content::Paragraph>) {
                annotateInlines(b.inlines);
            } else if constexpr (std::is_same_v<T, Content::ListBlock>) {
                for (auto &item : b.items)
                    annotateInlines(item);
            } else if constexpr (std::is_same_v<T, Content::Table>) {
                for (auto &cell : b.header)
                    annotateInlines(cell);
                for (auto &row : b.rows)
                    for (auto &cell : row)
                        annotateInlines(cell);
            }
        }, block);
    }
}

} // namespace ScriptSegmenter
