/*
 * fontregistry.h — Process-wide, read-only font resources
 *
 * Loads the four report faces once (FreeType for metadata, fontconfig for
 * family lookup, HarfBuzz faces for shaping and subsetting). A loaded
 * registry is never mutated and may be shared between threads; per-document
 * state such as glyph usage lives in the PDF generator instead.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_FONTREGISTRY_H
#define REPORTPDF_FONTREGISTRY_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <array>
#include <memory>

#include <hb.h>

#include "fontrole.h"

namespace Fonts {

// Where the four faces come from. A non-empty path wins; otherwise the
// family is resolved through fontconfig (regular or bold weight).
struct FontSources {
    QString latinRegular;
    QString latinBold;
    QString devanagariRegular;
    QString devanagariBold;

    QString latinFamily = QStringLiteral("Noto Sans");
    QString devanagariFamily = QStringLiteral("Noto Sans Devanagari");

    QString path(Role role) const;
    QString family(Role role) const;

    // NotoSans-{Regular,Bold}.ttf and NotoSansDevanagari-{Regular,Bold}.ttf
    static FontSources fromDirectory(const QString &dir);
};

struct ConfigurationError {
    QString fontRole;
    QString path;
    QString message;
};

struct FontFace {
    QString filePath;
    int faceIndex = 0;
    QByteArray rawData; // backing store of hbFace
    hb_face_t *hbFace = nullptr;

    QString postScriptName;
    int unitsPerEm = 1000;
    int ascender = 0;   // font units, positive up
    int descender = 0;  // font units, negative below baseline
    int capHeight = 0;
    qreal italicAngle = 0;
    int flags = 0;      // PDF font flags
    QList<int> bbox;    // PDF units (1000/em)
    QList<int> advances; // per glyph, font units

    FontFace() = default;
    FontFace(const FontFace &) = delete;
    FontFace &operator=(const FontFace &) = delete;
    ~FontFace();

    // Metrics in points at the given size
    qreal ascent(qreal sizePoints) const { return ascender * sizePoints / unitsPerEm; }
    qreal descent(qreal sizePoints) const { return -descender * sizePoints / unitsPerEm; }

    // Advance width in PDF glyph space (1000/em)
    int pdfAdvance(uint glyphId) const;
};

class FontRegistry {
public:
    // Loads all four faces. Returns nullptr and fills *error when any face
    // is missing or unreadable.
    static std::shared_ptr<const FontRegistry> load(const FontSources &sources,
                                                    ConfigurationError *error = nullptr);

    const FontFace *face(Role role) const;

private:
    FontRegistry() = default;

    static QString resolveFontPath(const QString &family, bool bold);
    static std::unique_ptr<FontFace> loadFace(const QString &filePath,
                                              QString *errorMessage);

    std::array<std::unique_ptr<FontFace>, kRoleCount> m_faces;
};

} // namespace Fonts

#endif // REPORTPDF_FONTREGISTRY_H
