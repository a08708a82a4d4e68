/*
 * sfnt.h — TrueType/OpenType subsetting via HarfBuzz
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_SFNT_H
#define REPORTPDF_SFNT_H

#include <QByteArray>
#include <QSet>

#include <hb.h>

namespace sfnt {

struct SubsetResult {
    QByteArray fontData;
    bool success = false;
};

// Glyph IDs are retained, so content streams written against the full
// face stay valid for the subset. Glyph 0 is always kept.
SubsetResult subsetFace(hb_face_t *face, const QSet<uint> &glyphIds);

} // namespace sfnt

#endif // REPORTPDF_SFNT_H
