/*
 * fontregistry.cpp — Font loading and metadata extraction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontregistry.h"

#include <QDebug>
#include <QDir>
#include <QFile>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>

#include <fontconfig/fontconfig.h>

namespace Fonts {

namespace {

struct FtLibraryDeleter {
    void operator()(FT_Library lib) const { if (lib) FT_Done_FreeType(lib); }
};
struct FtFaceDeleter {
    void operator()(FT_Face face) const { if (face) FT_Done_Face(face); }
};
struct HbFontDeleter {
    void operator()(hb_font_t *f) const { if (f) hb_font_destroy(f); }
};

using FtLibraryPtr = std::unique_ptr<std::remove_pointer_t<FT_Library>, FtLibraryDeleter>;
using FtFacePtr = std::unique_ptr<std::remove_pointer_t<FT_Face>, FtFaceDeleter>;

// A character each role's face must map, so that a Latin-only file
// configured as a Devanagari face is caught at startup.
constexpr char32_t kProbeLatin = U'A';
constexpr char32_t kProbeDevanagari = U'क'; // DEVANAGARI LETTER KA

} // anonymous namespace

// ---------------------------------------------------------------------------
// FontSources
// ---------------------------------------------------------------------------

QString FontSources::path(Role role) const
{
    switch (role) {
    case Role::LatinRegular:      return latinRegular;
    case Role::LatinBold:         return latinBold;
    case Role::DevanagariRegular: return devanagariRegular;
    case Role::DevanagariBold:    return devanagariBold;
    }
    return QString();
}

QString FontSources::family(Role role) const
{
    return isDevanagari(role) ? devanagariFamily : latinFamily;
}

FontSources FontSources::fromDirectory(const QString &dir)
{
    QDir d(dir);
    FontSources sources;
    sources.latinRegular = d.filePath(QStringLiteral("NotoSans-Regular.ttf"));
    sources.latinBold = d.filePath(QStringLiteral("NotoSans-Bold.ttf"));
    sources.devanagariRegular = d.filePath(QStringLiteral("NotoSansDevanagari-Regular.ttf"));
    sources.devanagariBold = d.filePath(QStringLiteral("NotoSansDevanagari-Bold.ttf"));
    return sources;
}

// ---------------------------------------------------------------------------
// FontFace
// ---------------------------------------------------------------------------

FontFace::~FontFace()
{
    if (hbFace) {
        hb_face_destroy(hbFace);
        hbFace = nullptr;
    }
}

int FontFace::pdfAdvance(uint glyphId) const
{
    if (glyphId >= static_cast<uint>(advances.size()) || unitsPerEm == 0)
        return 0;
    return qRound(advances.at(static_cast<int>(glyphId)) * 1000.0 / unitsPerEm);
}

// ---------------------------------------------------------------------------
// FontRegistry
// ---------------------------------------------------------------------------

QString FontRegistry::resolveFontPath(const QString &family, bool bold)
{
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config)
        return {};

    QByteArray familyUtf8 = family.toUtf8();
    FcPattern *pat = FcPatternCreate();
    FcPatternAddString(pat, FC_FAMILY,
                       reinterpret_cast<const FcChar8 *>(familyUtf8.constData()));
    FcPatternAddInteger(pat, FC_WEIGHT, bold ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pat, FC_SLANT, FC_SLANT_ROMAN);

    FcConfigSubstitute(config, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    FcResult fcResult;
    FcPattern *match = FcFontMatch(config, pat, &fcResult);
    QString path;
    if (match) {
        // fontconfig always returns its best guess; only accept the family
        // that was asked for, so a missing font is reported instead of
        // silently replaced.
        FcChar8 *matchedFamily = nullptr;
        FcChar8 *file = nullptr;
        if (FcPatternGetString(match, FC_FAMILY, 0, &matchedFamily) == FcResultMatch
            && matchedFamily
            && QString::fromUtf8(reinterpret_cast<const char *>(matchedFamily))
                       .compare(family, Qt::CaseInsensitive) == 0
            && FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file) {
            path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        }
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pat);
    FcConfigDestroy(config);
    return path;
}

std::unique_ptr<FontFace> FontRegistry::loadFace(const QString &filePath,
                                                 QString *errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorMessage = QStringLiteral("cannot open font file");
        return nullptr;
    }

    auto face = std::make_unique<FontFace>();
    face->filePath = filePath;
    face->rawData = file.readAll();
    if (face->rawData.isEmpty()) {
        *errorMessage = QStringLiteral("font file is empty");
        return nullptr;
    }

    // --- Metadata via FreeType ---
    FT_Library ftLib = nullptr;
    if (FT_Init_FreeType(&ftLib)) {
        *errorMessage = QStringLiteral("FreeType initialisation failed");
        return nullptr;
    }
    FtLibraryPtr library(ftLib);

    FT_Face ftFaceRaw = nullptr;
    FT_Error err = FT_New_Memory_Face(
        library.get(),
        reinterpret_cast<const FT_Byte *>(face->rawData.constData()),
        face->rawData.size(), face->faceIndex, &ftFaceRaw);
    if (err) {
        *errorMessage = QStringLiteral("FreeType cannot read the font (error %1)").arg(err);
        return nullptr;
    }
    FtFacePtr ftFace(ftFaceRaw);

    if (!FT_IS_SFNT(ftFace.get())) {
        *errorMessage = QStringLiteral("not a TrueType/OpenType font");
        return nullptr;
    }

    face->unitsPerEm = ftFace->units_per_EM > 0 ? ftFace->units_per_EM : 1000;
    face->ascender = ftFace->ascender;
    face->descender = ftFace->descender;

    const char *psName = FT_Get_Postscript_Name(ftFace.get());
    face->postScriptName = psName ? QString::fromLatin1(psName) : QStringLiteral("Unknown");

    auto *os2 = reinterpret_cast<TT_OS2 *>(FT_Get_Sfnt_Table(ftFace.get(), FT_SFNT_OS2));
    face->capHeight = (os2 && os2->sCapHeight > 0)
        ? os2->sCapHeight : qRound(face->unitsPerEm * 0.7);

    auto *post = reinterpret_cast<TT_Postscript *>(FT_Get_Sfnt_Table(ftFace.get(), FT_SFNT_POST));
    face->italicAngle = post ? static_cast<qreal>(post->italicAngle) / 65536.0 : 0.0;

    // PDF font flags (PDF32000-2008, Table 123)
    int flags = 0;
    if (FT_IS_FIXED_WIDTH(ftFace.get()))
        flags |= (1 << 0); // FixedPitch
    flags |= (1 << 5); // Nonsymbolic
    if (ftFace->style_flags & FT_STYLE_FLAG_ITALIC)
        flags |= (1 << 6); // Italic
    face->flags = flags;

    FT_BBox bbox = ftFace->bbox;
    const int upem = face->unitsPerEm;
    auto scale = [upem](FT_Pos v) { return static_cast<int>(v * 1000 / upem); };
    face->bbox = {scale(bbox.xMin), scale(bbox.yMin), scale(bbox.xMax), scale(bbox.yMax)};

    // --- Shaping face via HarfBuzz ---
    hb_blob_t *blob = hb_blob_create(face->rawData.constData(), face->rawData.size(),
                                     HB_MEMORY_MODE_READONLY, nullptr, nullptr);
    face->hbFace = hb_face_create(blob, face->faceIndex);
    hb_blob_destroy(blob);
    if (!face->hbFace || hb_face_get_glyph_count(face->hbFace) == 0) {
        *errorMessage = QStringLiteral("HarfBuzz cannot read the font");
        return nullptr;
    }
    hb_face_make_immutable(face->hbFace);

    // Advances in font units, for the PDF /W array
    std::unique_ptr<hb_font_t, HbFontDeleter> hbFont(hb_font_create(face->hbFace));
    hb_font_set_scale(hbFont.get(), upem, upem);
    const unsigned int glyphCount = hb_face_get_glyph_count(face->hbFace);
    face->advances.reserve(static_cast<int>(glyphCount));
    for (unsigned int gid = 0; gid < glyphCount; ++gid)
        face->advances.append(hb_font_get_glyph_h_advance(hbFont.get(), gid));

    return face;
}

std::shared_ptr<const FontRegistry> FontRegistry::load(const FontSources &sources,
                                                       ConfigurationError *error)
{
    std::shared_ptr<FontRegistry> registry(new FontRegistry);

    for (Role role : kAllRoles) {
        const bool bold = role == Role::LatinBold || role == Role::DevanagariBold;
        QString path = sources.path(role);
        if (path.isEmpty())
            path = resolveFontPath(sources.family(role), bold);

        QString message;
        std::unique_ptr<FontFace> face;
        if (path.isEmpty()) {
            message = QStringLiteral("font family \"%1\" not found").arg(sources.family(role));
        } else {
            face = loadFace(path, &message);
            if (face) {
                hb_font_t *probeFont = hb_font_create(face->hbFace);
                hb_codepoint_t gid = 0;
                const char32_t probe = isDevanagari(role) ? kProbeDevanagari : kProbeLatin;
                if (!hb_font_get_nominal_glyph(probeFont, probe, &gid)) {
                    message = QStringLiteral("font has no glyph for U+%1")
                                  .arg(QString::number(static_cast<uint>(probe), 16)
                                           .toUpper().rightJustified(4, QLatin1Char('0')));
                    face.reset();
                }
                hb_font_destroy(probeFont);
            }
        }

        if (!face) {
            qWarning() << "FontRegistry:" << roleName(role) << path << message;
            if (error)
                *error = ConfigurationError{roleName(role), path, message};
            return nullptr;
        }

        qDebug() << "FontRegistry: loaded" << roleName(role) << face->postScriptName
                 << "from" << path;
        registry->m_faces[static_cast<int>(role)] = std::move(face);
    }

    return registry;
}

const FontFace *FontRegistry::face(Role role) const
{
    return m_faces[static_cast<int>(role)].get();
}

} // namespace Fonts
