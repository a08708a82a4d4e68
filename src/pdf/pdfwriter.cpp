/*
 * pdfwriter.cpp — Low-level PDF object serializer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <QCryptographicHash>
#include <QDebug>

#include <zlib.h>

namespace Pdf {

namespace {

const char kHexDigits[] = "0123456789ABCDEF";

bool isAscii(const QString &s)
{
    for (QChar c : s) {
        if (c.unicode() < 32 || c.unicode() > 126)
            return false;
    }
    return true;
}

} // anonymous namespace

// --- Serialization helpers ---

bool isDelimiter(char c)
{
    return QByteArray("()<>[]{}/%").contains(c);
}

QByteArray toUTF16(const QString &s)
{
    QByteArray result;
    result.reserve(2 + s.length() * 2);
    result.append('\xfe');
    result.append('\xff');
    for (int i = 0; i < s.length(); ++i) {
        result.append(static_cast<char>(s[i].row()));
        result.append(static_cast<char>(s[i].cell()));
    }
    return result;
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray result("(");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(static_cast<char>(v));
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append("01234567"[(v / 64) % 8]);
            result.append("01234567"[(v / 8) % 8]);
            result.append("01234567"[v % 8]);
        } else {
            result.append(static_cast<char>(v));
        }
    }
    result.append(')');
    return result;
}

QByteArray toTextString(const QString &s)
{
    if (isAscii(s))
        return toLiteralString(s.toLatin1());
    return toHexString(toUTF16(s));
}

QByteArray toHexString(const QByteArray &s)
{
    constexpr int lineLength = 80;
    QByteArray result("<");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        result.append(kHexDigits[v / 16]);
        result.append(kHexDigits[v % 16]);
        if (i % lineLength == lineLength - 1)
            result.append('\n');
    }
    result.append('>');
    return result;
}

QByteArray toHexString16(quint16 b)
{
    QByteArray result("<");
    result.append(kHexDigits[(b >> 12) & 0xf]);
    result.append(kHexDigits[(b >> 8) & 0xf]);
    result.append(kHexDigits[(b >> 4) & 0xf]);
    result.append(kHexDigits[b & 0xf]);
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (int i = 0; i < s.length(); ++i) {
        uchar c = s[i];
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(static_cast<char>(c))) {
            result.append('#');
            result.append(kHexDigits[c / 16]);
            result.append(kHexDigits[c % 16]);
        } else {
            result.append(static_cast<char>(c));
        }
    }
    return result;
}

QByteArray toRectangleArray(const QRectF &r)
{
    return "[" + toPdf(r.left()) + " " + toPdf(r.top()) + " "
         + toPdf(r.right()) + " " + toPdf(r.bottom()) + "]";
}

// --- Writer implementation ---

Writer::Writer(QByteArray *buffer)
    : m_buffer(buffer)
{
    m_buffer->clear();
}

qint64 Writer::bytesWritten() const
{
    return m_buffer->size();
}

void Writer::write(const QByteArray &bytes)
{
    m_buffer->append(bytes);
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // high-bit bytes to signal binary
}

void Writer::writeXrefAndTrailer()
{
    // The ID is derived from the body so identical input gives identical bytes
    const QByteArray fileId = QCryptographicHash::hash(*m_buffer, QCryptographicHash::Md5);

    while (static_cast<ObjId>(m_xref.size()) < m_objCounter)
        m_xref.append(0);

    qint64 startXref = bytesWritten();
    write("xref\n");
    write("0 " + toPdf(m_xref.size()) + "\n");
    for (int i = 0; i < m_xref.size(); ++i) {
        if (m_xref[i] > 0) {
            QByteArray offset = QByteArray::number(m_xref[i]);
            while (offset.length() < 10)
                offset.prepend('0');
            write(offset + " 00000 n \n");
        } else {
            write("0000000000 65535 f \n");
        }
    }
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_xref.size()) + "\n");
    QByteArray idHex = toHexString(fileId);
    write("/Root " + toObjRef(m_catalogObj) + "\n");
    write("/Info " + toObjRef(m_infoObj) + "\n");
    write("/ID [" + idHex + idHex + "]\n");
    write(">>\nstartxref\n");
    write(toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text]\n");
    if (!dict.fonts.isEmpty()) {
        write("/Font <<\n");
        for (auto it = dict.fonts.begin(); it != dict.fonts.end(); ++it)
            write(toName(it.key()) + " " + toObjRef(it.value()) + "\n");
        write(">>\n");
    }
    write(">>\n");
}

ObjId Writer::reserveObjects(unsigned int n)
{
    ObjId result = m_objCounter;
    m_objCounter += n;
    return result;
}

void Writer::startObj(ObjId id)
{
    while (static_cast<ObjId>(m_xref.size()) <= id)
        m_xref.append(0);
    m_xref[id] = bytesWritten();
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    ObjId id = newObject();
    startObj(id);
    return id;
}

void Writer::endObj()
{
    write("\nendobj\n");
}

void Writer::endObjectWithStream(const QByteArray &streamContent, bool compress)
{
    QByteArray data = streamContent;
    bool compressed = false;
    if (compress && streamContent.size() > 128) {
        uLongf destLen = compressBound(streamContent.size());
        QByteArray packed;
        packed.resize(static_cast<int>(destLen));
        int zret = ::compress2(reinterpret_cast<Bytef *>(packed.data()), &destLen,
                               reinterpret_cast<const Bytef *>(streamContent.constData()),
                               streamContent.size(), Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            packed.resize(static_cast<int>(destLen));
            data = packed;
            compressed = true;
        } else {
            qWarning() << "Pdf::Writer: zlib compress2 failed (" << zret
                       << "), writing stream uncompressed";
        }
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (compressed) {
        write("/Filter /FlateDecode\n");
        write("/Length1 " + toPdf(streamContent.size()) + "\n");
    }
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj();
}

} // namespace Pdf
