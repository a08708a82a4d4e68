/*
 * pdfwriter.h — Low-level PDF object serializer
 *
 * Writes PDF-1.7 objects into an in-memory buffer and tracks their offsets
 * for the cross-reference table. Output is deterministic: the trailer /ID
 * is a hash of the document body, and resource names are written in sorted
 * order.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_PDFWRITER_H
#define REPORTPDF_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QList>
#include <QMap>
#include <QRectF>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- PDF serialization helpers (cf. PDF32000-2008) ---

bool isDelimiter(char c);

QByteArray toUTF16(const QString &s);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

// Up to three decimals, trailing zeros trimmed ("12.5", "0", "-3.125")
template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v)
{
    QByteArray s = QByteArray::number(static_cast<double>(v), 'f', 3);
    while (s.endsWith('0'))
        s.chop(1);
    if (s.endsWith('.'))
        s.chop(1);
    if (s == "-0")
        s = "0";
    return s;
}

QByteArray toObjRef(ObjId id);

QByteArray toLiteralString(const QByteArray &s);
// ASCII strings as literals, anything else as UTF-16BE hex with BOM
QByteArray toTextString(const QString &s);

QByteArray toHexString(const QByteArray &s);
QByteArray toHexString16(quint16 b);

QByteArray toName(const QByteArray &s);

QByteArray toRectangleArray(const QRectF &r);

// --- Resource dictionary ---

struct ResourceDict {
    QMap<QByteArray, ObjId> fonts;
};

// --- PDF Writer ---

class Writer {
public:
    explicit Writer(QByteArray *buffer);

    qint64 bytesWritten() const;

    // PDF structure
    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management
    ObjId reserveObjects(unsigned int n);
    ObjId newObject() { return reserveObjects(1); }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj();
    void endObjectWithStream(const QByteArray &streamContent, bool compress = true);

    // Well-known object IDs
    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    QByteArray *m_buffer;
    ObjId m_objCounter = 4; // 1=catalog, 2=info, 3=pages
    QList<qint64> m_xref;

    ObjId m_catalogObj = 1;
    ObjId m_infoObj = 2;
    ObjId m_pagesObj = 3;
};

} // namespace Pdf

#endif // REPORTPDF_PDFWRITER_H
