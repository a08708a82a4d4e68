/*
 * textshaper.h — HarfBuzz shaping of script-homogeneous runs
 *
 * One TextShaper belongs to one document generation. It owns an hb_font_t
 * per font role, created over the registry's shared immutable faces, so
 * concurrent generations never share mutable HarfBuzz state.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_TEXTSHAPER_H
#define REPORTPDF_TEXTSHAPER_H

#include <array>
#include <memory>

#include <hb.h>

#include "fontregistry.h"
#include "textmeasurer.h"

class TextShaper : public Layout::TextMeasurer {
public:
    explicit TextShaper(std::shared_ptr<const Fonts::FontRegistry> registry);
    ~TextShaper() override;

    TextShaper(const TextShaper &) = delete;
    TextShaper &operator=(const TextShaper &) = delete;

    Layout::ShapedText shape(const QString &text, Content::Script script,
                             Fonts::Role role, qreal sizePoints) const override;
    qreal ascent(Fonts::Role role, qreal sizePoints) const override;
    qreal descent(Fonts::Role role, qreal sizePoints) const override;

private:
    std::shared_ptr<const Fonts::FontRegistry> m_registry;
    std::array<hb_font_t *, Fonts::kRoleCount> m_fonts{};
};

#endif // REPORTPDF_TEXTSHAPER_H
