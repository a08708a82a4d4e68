/*
 * textmeasurer.h — Measurement interface used by the layout engine
 *
 * The engine never touches fonts directly. TextShaper implements this
 * interface with HarfBuzz; tests substitute a fixed-advance measurer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_TEXTMEASURER_H
#define REPORTPDF_TEXTMEASURER_H

#include <QList>
#include <QString>

#include "contentmodel.h"
#include "fontrole.h"

namespace Layout {

struct GlyphInfo {
    uint glyphId = 0;
    qreal xAdvance = 0; // points
    qreal xOffset = 0;
    qreal yOffset = 0;
    int cluster = 0; // character index in the shaped text
};

struct ShapedText {
    QList<GlyphInfo> glyphs;
    qreal width = 0;
};

class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;

    virtual ShapedText shape(const QString &text, Content::Script script,
                             Fonts::Role role, qreal sizePoints) const = 0;
    virtual qreal ascent(Fonts::Role role, qreal sizePoints) const = 0;
    virtual qreal descent(Fonts::Role role, qreal sizePoints) const = 0;
};

} // namespace Layout

#endif // REPORTPDF_TEXTMEASURER_H
