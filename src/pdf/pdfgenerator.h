/*
 * pdfgenerator.h — Page boxes → PDF content streams + font embedding
 *
 * Converts Layout::LayoutResult into a complete PDF document. Text uses
 * CIDFontType2 + Identity-H with subset fonts; the ToUnicode map is built
 * from the shaped clusters, so complex Devanagari glyphs extract back to
 * their source text. One generator serves one document.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_PDFGENERATOR_H
#define REPORTPDF_PDFGENERATOR_H

#include <QByteArray>
#include <QMap>
#include <QSet>
#include <QString>

#include <array>
#include <memory>

#include "fontregistry.h"
#include "layoutengine.h"
#include "pdfwriter.h"

struct PdfDocumentInfo {
    QString title;
    QString author;
    QString subject;
};

class PdfGenerator {
public:
    explicit PdfGenerator(std::shared_ptr<const Fonts::FontRegistry> registry);

    QByteArray generate(const Layout::LayoutResult &layout, const PdfDocumentInfo &info);

private:
    // Page content rendering
    QByteArray renderPage(const Layout::Page &page, qreal pageHeight);
    void renderText(const Layout::TextContent &text, const QRectF &rect,
                    QByteArray &stream, qreal pageHeight);
    void renderLine(const Layout::LineContent &line, QByteArray &stream, qreal pageHeight);
    void renderFill(const QRectF &rect, const Layout::FillContent &fill,
                    QByteArray &stream, qreal pageHeight);

    // Font embedding
    struct EmbeddedFont {
        Pdf::ObjId fontObjId = 0;
        QByteArray pdfName; // e.g. "F0", "F1"
        const Fonts::FontFace *face = nullptr;
        QSet<uint> usedGlyphs;
        QMap<uint, QString> glyphText; // glyph → source text, for ToUnicode
    };
    std::array<EmbeddedFont, Fonts::kRoleCount> m_fonts;

    void recordGlyphs(const Layout::TextContent &text);
    Pdf::ObjId writeCidFont(Pdf::Writer &writer, EmbeddedFont &font, int roleIndex);
    QByteArray buildToUnicodeCMap(const EmbeddedFont &font) const;

    // Utility
    static QByteArray colorOperator(const QColor &color, bool fill = true);
    static QByteArray pdfCoord(qreal v);

    std::shared_ptr<const Fonts::FontRegistry> m_registry;
};

#endif // REPORTPDF_PDFGENERATOR_H
