/*
 * pdfgenerator.cpp — Page boxes → PDF content streams + font embedding
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfgenerator.h"
#include "sfnt.h"

#include <QDebug>

#include <algorithm>

namespace {

// Synthetic oblique for Latin italic runs (tan 12°)
constexpr qreal kObliqueSkew = 0.2126;

// UTF-16BE hex digits of a string, without BOM or brackets
QByteArray utf16Hex(const QString &text)
{
    QByteArray hex;
    for (QChar c : text)
        hex += QByteArray::number(c.unicode(), 16).rightJustified(4, '0').toUpper();
    return hex;
}

} // anonymous namespace

PdfGenerator::PdfGenerator(std::shared_ptr<const Fonts::FontRegistry> registry)
    : m_registry(std::move(registry))
{
}

// --- PDF coordinate helpers ---

QByteArray PdfGenerator::pdfCoord(qreal v)
{
    return Pdf::toPdf(v);
}

QByteArray PdfGenerator::colorOperator(const QColor &color, bool fill)
{
    if (!color.isValid())
        return {};
    QByteArray op = fill ? " rg\n" : " RG\n";
    return pdfCoord(color.redF()) + " " + pdfCoord(color.greenF()) + " "
         + pdfCoord(color.blueF()) + op;
}

// --- Glyph usage ---

void PdfGenerator::recordGlyphs(const Layout::TextContent &text)
{
    EmbeddedFont &font = m_fonts[static_cast<int>(text.role)];

    // Glyphs sharing a cluster map the whole cluster text onto the first one
    const int count = text.glyphs.size();
    for (int i = 0; i < count; ++i) {
        const Layout::GlyphInfo &g = text.glyphs[i];
        font.usedGlyphs.insert(g.glyphId);
        if (i > 0 && text.glyphs[i - 1].cluster == g.cluster)
            continue;
        int end = text.text.size();
        for (int j = i + 1; j < count; ++j) {
            if (text.glyphs[j].cluster > g.cluster) {
                end = text.glyphs[j].cluster;
                break;
            }
        }
        if (g.cluster >= end || font.glyphText.contains(g.glyphId))
            continue;
        font.glyphText.insert(g.glyphId, text.text.mid(g.cluster, end - g.cluster));
    }
}

// --- Main generate ---

QByteArray PdfGenerator::generate(const Layout::LayoutResult &layout,
                                  const PdfDocumentInfo &info)
{
    if (!m_registry) {
        qWarning() << "PdfGenerator: no font registry";
        return {};
    }

    for (int r = 0; r < Fonts::kRoleCount; ++r) {
        m_fonts[r] = EmbeddedFont{};
        m_fonts[r].pdfName = "F" + QByteArray::number(r);
        m_fonts[r].face = m_registry->face(Fonts::kAllRoles[r]);
    }

    // First pass: collect glyph usage per font role
    for (const auto &page : layout.pages) {
        for (const auto &box : page.boxes) {
            if (const auto *text = std::get_if<Layout::TextContent>(&box.content))
                recordGlyphs(*text);
        }
    }

    QByteArray output;
    Pdf::Writer writer(&output);
    writer.writeHeader();

    // Embed fonts
    Pdf::ResourceDict resources;
    for (int r = 0; r < Fonts::kRoleCount; ++r) {
        EmbeddedFont &font = m_fonts[r];
        if (font.usedGlyphs.isEmpty() || !font.face)
            continue;
        font.fontObjId = writeCidFont(writer, font, r);
        resources.fonts[font.pdfName] = font.fontObjId;
    }

    // Write pages
    const qreal pageHeight = layout.pageSize.height();
    QList<Pdf::ObjId> pageObjIds;
    for (const auto &page : layout.pages) {
        QByteArray contentStream = renderPage(page, pageHeight);

        Pdf::ObjId contentObj = writer.startObj();
        writer.write("<<\n");
        writer.endObjectWithStream(contentStream);

        Pdf::ObjId pageObj = writer.startObj();
        writer.write("<<\n");
        writer.write("/Type /Page\n");
        writer.write("/Parent " + Pdf::toObjRef(writer.pagesObj()) + "\n");
        writer.write("/MediaBox "
                     + Pdf::toRectangleArray(QRectF(QPointF(0, 0), layout.pageSize)) + "\n");
        writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n");
        writer.write("/Resources ");
        writer.writeResourceDict(resources);
        writer.write(">>");
        writer.endObj();
        pageObjIds.append(pageObj);
    }

    // Pages object
    writer.startObj(writer.pagesObj());
    writer.write("<<\n/Type /Pages\n/Kids [");
    for (auto id : pageObjIds)
        writer.write(Pdf::toObjRef(id) + " ");
    writer.write("]\n/Count " + Pdf::toPdf(pageObjIds.size()) + "\n>>");
    writer.endObj();

    // Info object
    writer.startObj(writer.infoObj());
    writer.write("<<\n");
    writer.write("/Producer " + Pdf::toTextString(QStringLiteral("reportpdf")) + "\n");
    writer.write("/Creator " + Pdf::toTextString(QStringLiteral("reportpdf")) + "\n");
    if (!info.title.isEmpty())
        writer.write("/Title " + Pdf::toTextString(info.title) + "\n");
    if (!info.author.isEmpty())
        writer.write("/Author " + Pdf::toTextString(info.author) + "\n");
    if (!info.subject.isEmpty())
        writer.write("/Subject " + Pdf::toTextString(info.subject) + "\n");
    writer.write(">>");
    writer.endObj();

    // Catalog object
    writer.startObj(writer.catalogObj());
    writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(writer.pagesObj()) + "\n");
    writer.write(">>");
    writer.endObj();

    writer.writeXrefAndTrailer();
    return output;
}

// --- Page rendering ---

QByteArray PdfGenerator::renderPage(const Layout::Page &page, qreal pageHeight)
{
    QByteArray stream;
    for (const auto &box : page.boxes) {
        std::visit([&](const auto &c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, Layout::TextContent>) {
                renderText(c, box.rect, stream, pageHeight);
            } else if constexpr (std::is_same_v<T, Layout::LineContent>) {
                renderLine(c, stream, pageHeight);
            } else if constexpr (std::is_same_v<T, Layout::FillContent>) {
                renderFill(box.rect, c, stream, pageHeight);
            }
        }, box.content);
    }
    return stream;
}

void PdfGenerator::renderText(const Layout::TextContent &text, const QRectF &rect,
                              QByteArray &stream, qreal pageHeight)
{
    if (text.glyphs.isEmpty())
        return;

    const EmbeddedFont &font = m_fonts[static_cast<int>(text.role)];
    const bool oblique = text.italic && text.script == Content::Script::Latin;
    const QByteArray matrix = oblique ? "1 0 " + pdfCoord(kObliqueSkew) + " 1 " : QByteArray("1 0 0 1 ");

    stream += "BT\n";
    stream += "/" + font.pdfName + " " + pdfCoord(text.fontSize) + " Tf\n";
    stream += colorOperator(text.color, true);

    const qreal y = pageHeight - text.baseline;
    qreal curX = rect.left();
    for (const auto &g : text.glyphs) {
        // Position each glyph with Tm (text matrix)
        qreal gx = curX + g.xOffset;
        qreal gy = y + g.yOffset;
        stream += matrix + pdfCoord(gx) + " " + pdfCoord(gy) + " Tm\n";
        stream += Pdf::toHexString16(static_cast<quint16>(g.glyphId)) + " Tj\n";
        curX += g.xAdvance;
    }

    stream += "ET\n";
}

void PdfGenerator::renderLine(const Layout::LineContent &line, QByteArray &stream,
                              qreal pageHeight)
{
    stream += "q\n";
    stream += colorOperator(line.color, false);
    stream += pdfCoord(line.width) + " w\n";
    stream += pdfCoord(line.from.x()) + " " + pdfCoord(pageHeight - line.from.y()) + " m "
            + pdfCoord(line.to.x()) + " " + pdfCoord(pageHeight - line.to.y()) + " l S\n";
    stream += "Q\n";
}

void PdfGenerator::renderFill(const QRectF &rect, const Layout::FillContent &fill,
                              QByteArray &stream, qreal pageHeight)
{
    stream += "q\n";
    stream += colorOperator(fill.color, true);
    stream += pdfCoord(rect.left()) + " " + pdfCoord(pageHeight - rect.bottom()) + " "
            + pdfCoord(rect.width()) + " " + pdfCoord(rect.height()) + " re f\n";
    stream += "Q\n";
}

// --- Font embedding ---

Pdf::ObjId PdfGenerator::writeCidFont(Pdf::Writer &writer, EmbeddedFont &font, int roleIndex)
{
    const Fonts::FontFace *face = font.face;

    // 1. Subset the font
    sfnt::SubsetResult subset = sfnt::subsetFace(face->hbFace, font.usedGlyphs);
    if (!subset.success)
        qWarning() << "PdfGenerator: subsetting failed, embedding full font"
                   << face->postScriptName;
    QByteArray fontData = subset.success ? subset.fontData : face->rawData;

    // 2. Embed font stream
    Pdf::ObjId fontStreamObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(fontData);

    // 3. Font descriptor
    QByteArray psNameBytes = face->postScriptName.toLatin1();
    if (subset.success) {
        QByteArray tag("RPDFA");
        tag.append(static_cast<char>('A' + roleIndex));
        psNameBytes = tag + "+" + psNameBytes;
    }

    auto toPdfUnits = [face](int units) {
        return static_cast<int>(units * 1000.0 / face->unitsPerEm);
    };

    Pdf::ObjId fontDescObj = writer.startObj();
    writer.write("<<\n/Type /FontDescriptor\n");
    writer.write("/FontName " + Pdf::toName(psNameBytes) + "\n");
    const QList<int> &bbox = face->bbox;
    writer.write("/FontBBox [" + Pdf::toPdf(bbox.value(0)) + " " + Pdf::toPdf(bbox.value(1))
                 + " " + Pdf::toPdf(bbox.value(2)) + " " + Pdf::toPdf(bbox.value(3)) + "]\n");
    writer.write("/Flags " + Pdf::toPdf(face->flags) + "\n");
    writer.write("/Ascent " + Pdf::toPdf(toPdfUnits(face->ascender)) + "\n");
    writer.write("/Descent " + Pdf::toPdf(toPdfUnits(face->descender)) + "\n");
    writer.write("/CapHeight " + Pdf::toPdf(toPdfUnits(face->capHeight)) + "\n");
    writer.write("/ItalicAngle " + Pdf::toPdf(face->italicAngle) + "\n");
    writer.write("/StemV 80\n");
    writer.write("/FontFile2 " + Pdf::toObjRef(fontStreamObj) + "\n");
    writer.write(">>");
    writer.endObj();

    // 4. Glyph widths, in glyph order
    QList<uint> glyphs(font.usedGlyphs.begin(), font.usedGlyphs.end());
    std::sort(glyphs.begin(), glyphs.end());

    Pdf::ObjId widthsObj = writer.startObj();
    writer.write("[");
    for (uint gid : glyphs)
        writer.write(Pdf::toPdf(gid) + " [" + Pdf::toPdf(face->pdfAdvance(gid)) + "] ");
    writer.write("]");
    writer.endObj();

    // 5. ToUnicode CMap
    QByteArray cmapData = buildToUnicodeCMap(font);
    Pdf::ObjId cmapObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(cmapData);

    // 6. Type0 font with CIDFont descendant
    Pdf::ObjId fontObj = writer.startObj();
    writer.write("<<\n/Type /Font\n/Subtype /Type0\n");
    writer.write("/Name " + Pdf::toName(font.pdfName) + "\n");
    writer.write("/BaseFont " + Pdf::toName(psNameBytes) + "\n");
    writer.write("/Encoding /Identity-H\n");
    writer.write("/ToUnicode " + Pdf::toObjRef(cmapObj) + "\n");
    writer.write("/DescendantFonts [");
    writer.write("<<\n/Type /Font\n/Subtype /CIDFontType2\n");
    writer.write("/BaseFont " + Pdf::toName(psNameBytes) + "\n");
    writer.write("/FontDescriptor " + Pdf::toObjRef(fontDescObj) + "\n");
    writer.write("/CIDSystemInfo <</Ordering(Identity)/Registry(Adobe)/Supplement 0>>\n");
    writer.write("/DW 1000\n");
    writer.write("/W " + Pdf::toObjRef(widthsObj) + "\n");
    writer.write("/CIDToGIDMap /Identity\n");
    writer.write(">>]\n");
    writer.write(">>");
    writer.endObj();

    return fontObj;
}

QByteArray PdfGenerator::buildToUnicodeCMap(const EmbeddedFont &font) const
{
    QByteArray cmap;
    cmap += "/CIDInit /ProcSet findresource begin\n";
    cmap += "12 dict begin\n";
    cmap += "begincmap\n";
    cmap += "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n";
    cmap += "/CMapName /Adobe-Identity-UCS def\n";
    cmap += "/CMapType 2 def\n";
    cmap += "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    // QMap iterates in glyph order
    QList<uint> glyphs = font.glyphText.keys();

    // Write in batches of 100
    int pos = 0;
    while (pos < glyphs.size()) {
        int batchSize = qMin(100, int(glyphs.size()) - pos);
        cmap += Pdf::toPdf(batchSize) + " beginbfchar\n";
        for (int i = 0; i < batchSize; ++i) {
            uint gid = glyphs[pos + i];
            cmap += "<" + QByteArray::number(gid, 16).rightJustified(4, '0').toUpper() + "> "
                  + "<" + utf16Hex(font.glyphText.value(gid)) + ">\n";
        }
        cmap += "endbfchar\n";
        pos += batchSize;
    }

    cmap += "endcmap\n";
    cmap += "CMapName currentdict /CMap defineresource pop\n";
    cmap += "end\nend\n";
    return cmap;
}
