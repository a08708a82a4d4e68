/*
 * textshaper.cpp — HarfBuzz shaping of script-homogeneous runs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textshaper.h"

#include <hb.h>
#include <hb-icu.h>

#include <unicode/uscript.h>

#include <QDebug>

TextShaper::TextShaper(std::shared_ptr<const Fonts::FontRegistry> registry)
    : m_registry(std::move(registry))
{
    if (!m_registry)
        return;
    for (Fonts::Role role : Fonts::kAllRoles) {
        const Fonts::FontFace *face = m_registry->face(role);
        if (!face || !face->hbFace)
            continue;
        hb_font_t *font = hb_font_create(face->hbFace);
        // Positions come back in font units; scaled to points per call
        hb_font_set_scale(font, face->unitsPerEm, face->unitsPerEm);
        m_fonts[static_cast<int>(role)] = font;
    }
}

TextShaper::~TextShaper()
{
    for (hb_font_t *&font : m_fonts) {
        if (font) {
            hb_font_destroy(font);
            font = nullptr;
        }
    }
}

Layout::ShapedText TextShaper::shape(const QString &text, Content::Script script,
                                     Fonts::Role role, qreal sizePoints) const
{
    Layout::ShapedText result;
    hb_font_t *font = m_fonts[static_cast<int>(role)];
    if (text.isEmpty() || !font)
        return result;

    const Fonts::FontFace *face = m_registry->face(role);
    const qreal scale = sizePoints / face->unitsPerEm;

    hb_buffer_t *buf = hb_buffer_create();
    hb_buffer_add_utf16(buf, text.utf16(), text.length(), 0, text.length());
    hb_buffer_set_direction(buf, HB_DIRECTION_LTR);
    hb_buffer_set_script(buf, hb_icu_script_to_script(
        script == Content::Script::Devanagari ? USCRIPT_DEVANAGARI : USCRIPT_LATIN));
    hb_buffer_set_cluster_level(buf, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);
    hb_buffer_guess_segment_properties(buf);

    const char *shapers[] = {"ot", "fallback", nullptr};
    if (!hb_shape_full(font, buf, nullptr, 0, shapers)) {
        qWarning() << "TextShaper: shaping failed for" << Fonts::roleName(role) << text;
        hb_buffer_destroy(buf);
        return result;
    }

    unsigned int count = hb_buffer_get_length(buf);
    hb_glyph_info_t *infos = hb_buffer_get_glyph_infos(buf, nullptr);
    hb_glyph_position_t *positions = hb_buffer_get_glyph_positions(buf, nullptr);

    result.glyphs.reserve(static_cast<int>(count));
    for (unsigned int i = 0; i < count; ++i) {
        Layout::GlyphInfo g;
        g.glyphId = infos[i].codepoint;
        g.xAdvance = positions[i].x_advance * scale;
        g.xOffset = positions[i].x_offset * scale;
        g.yOffset = positions[i].y_offset * scale;
        g.cluster = static_cast<int>(infos[i].cluster);
        result.width += g.xAdvance;
        result.glyphs.append(g);
    }

    hb_buffer_destroy(buf);
    return result;
}

qreal TextShaper::ascent(Fonts::Role role, qreal sizePoints) const
{
    const Fonts::FontFace *face = m_registry ? m_registry->face(role) : nullptr;
    return face ? face->ascent(sizePoints) : sizePoints * 0.8;
}

qreal TextShaper::descent(Fonts::Role role, qreal sizePoints) const
{
    const Fonts::FontFace *face = m_registry ? m_registry->face(role) : nullptr;
    return face ? face->descent(sizePoints) : sizePoints * 0.2;
}
