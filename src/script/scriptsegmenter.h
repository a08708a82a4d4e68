/*
 * scriptsegmenter.h — Split inline runs into script-homogeneous runs
 *
 * Classification is driven by a sorted table of Unicode block ranges;
 * characters ICU reports as Common/Inherited (spaces, digits,
 * punctuation, joiners) take the class of the preceding character.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_SCRIPTSEGMENTER_H
#define REPORTPDF_SCRIPTSEGMENTER_H

#include <QList>

#include "contentmodel.h"

namespace ScriptSegmenter {

enum class CharClass {
    Latin,
    Devanagari,
    Neutral, // inherits from the preceding character
};

CharClass classify(char32_t codePoint);

QList<Content::ScriptRun> segment(const Content::InlineRun &run);

// Fill InlineRun::scriptRuns for every run in the document
void annotate(Content::Document &doc);

} // namespace ScriptSegmenter

#endif // REPORTPDF_SCRIPTSEGMENTER_H
