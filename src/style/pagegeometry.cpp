/*
 * pagegeometry.cpp — JSON serialization for PageGeometry
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagegeometry.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>

namespace {

QColor colorValue(const QJsonObject &obj, const char *key, const QColor &fallback)
{
    const QString name = obj.value(QLatin1String(key)).toString();
    if (name.isEmpty())
        return fallback;
    QColor c(name);
    return c.isValid() ? c : fallback;
}

qreal realValue(const QJsonObject &obj, const char *key, qreal fallback)
{
    return obj.value(QLatin1String(key)).toDouble(fallback);
}

QString pageSizeToString(QPageSize::PageSizeId id)
{
    switch (id) {
    case QPageSize::Letter: return QStringLiteral("Letter");
    case QPageSize::A5:     return QStringLiteral("A5");
    case QPageSize::Legal:  return QStringLiteral("Legal");
    default:                return QStringLiteral("A4");
    }
}

const char *const kHeadingKeys[3] = {"heading1", "heading2", "heading3"};

} // anonymous namespace

// ---------------------------------------------------------------------------
// BlockStyle
// ---------------------------------------------------------------------------

BlockStyle BlockStyle::fromJson(const QJsonObject &obj, const BlockStyle &defaults)
{
    BlockStyle s = defaults;
    s.fontSize = realValue(obj, "fontSize", s.fontSize);
    s.leading = realValue(obj, "leading", s.leading);
    s.color = colorValue(obj, "color", s.color);
    s.spaceBefore = realValue(obj, "spaceBefore", s.spaceBefore);
    s.spaceAfter = realValue(obj, "spaceAfter", s.spaceAfter);
    return s;
}

QJsonObject BlockStyle::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("fontSize")] = fontSize;
    obj[QLatin1String("leading")] = leading;
    obj[QLatin1String("color")] = color.name();
    obj[QLatin1String("spaceBefore")] = spaceBefore;
    obj[QLatin1String("spaceAfter")] = spaceAfter;
    return obj;
}

// ---------------------------------------------------------------------------
// PageGeometry
// ---------------------------------------------------------------------------

PageGeometry PageGeometry::fromJson(const QJsonObject &obj)
{
    PageGeometry g;

    if (obj.contains(QLatin1String("pageSize"))) {
        QString sizeStr = obj.value(QLatin1String("pageSize")).toString();
        if (sizeStr == QLatin1String("Letter"))      g.pageSizeId = QPageSize::Letter;
        else if (sizeStr == QLatin1String("A5"))     g.pageSizeId = QPageSize::A5;
        else if (sizeStr == QLatin1String("Legal"))  g.pageSizeId = QPageSize::Legal;
        else                                          g.pageSizeId = QPageSize::A4;
    }
    if (obj.contains(QLatin1String("margins"))) {
        QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        g.margins = QMarginsF(
            m.value(QLatin1String("left")).toDouble(g.margins.left()),
            m.value(QLatin1String("top")).toDouble(g.margins.top()),
            m.value(QLatin1String("right")).toDouble(g.margins.right()),
            m.value(QLatin1String("bottom")).toDouble(g.margins.bottom()));
    }

    for (int i = 0; i < 3; ++i) {
        if (obj.contains(QLatin1String(kHeadingKeys[i])))
            g.headings[i] = BlockStyle::fromJson(
                obj.value(QLatin1String(kHeadingKeys[i])).toObject(), g.headings[i]);
    }
    g.body = BlockStyle::fromJson(obj.value(QLatin1String("body")).toObject(), g.body);
    g.listItem = BlockStyle::fromJson(obj.value(QLatin1String("listItem")).toObject(), g.listItem);
    g.tableCell = BlockStyle::fromJson(obj.value(QLatin1String("tableCell")).toObject(), g.tableCell);
    g.tableHeader = BlockStyle::fromJson(obj.value(QLatin1String("tableHeader")).toObject(), g.tableHeader);
    g.disclaimer = BlockStyle::fromJson(obj.value(QLatin1String("disclaimer")).toObject(), g.disclaimer);

    if (obj.contains(QLatin1String("headingRule"))) {
        QJsonObject r = obj.value(QLatin1String("headingRule")).toObject();
        g.headingRuleWidth = realValue(r, "width", g.headingRuleWidth);
        g.headingRuleGap = realValue(r, "gap", g.headingRuleGap);
        g.headingRuleColor = colorValue(r, "color", g.headingRuleColor);
    }
    if (obj.contains(QLatin1String("rule"))) {
        QJsonObject r = obj.value(QLatin1String("rule")).toObject();
        g.ruleWidth = realValue(r, "width", g.ruleWidth);
        g.ruleSpace = realValue(r, "space", g.ruleSpace);
        g.ruleColor = colorValue(r, "color", g.ruleColor);
    }
    if (obj.contains(QLatin1String("list"))) {
        QJsonObject l = obj.value(QLatin1String("list")).toObject();
        g.listIndent = realValue(l, "indent", g.listIndent);
        g.listMarkerIndent = realValue(l, "markerIndent", g.listMarkerIndent);
    }
    if (obj.contains(QLatin1String("table"))) {
        QJsonObject t = obj.value(QLatin1String("table")).toObject();
        if (t.value(QLatin1String("columns")).toString() == QLatin1String("keyValue"))
            g.columnPolicy = ColumnPolicy::KeyValue;
        g.cellPadding = realValue(t, "cellPadding", g.cellPadding);
        g.headerBottomPadding = realValue(t, "headerBottomPadding", g.headerBottomPadding);
        g.tableSpaceAfter = realValue(t, "spaceAfter", g.tableSpaceAfter);
        g.tableHeaderBackground = colorValue(t, "headerBackground", g.tableHeaderBackground);
        g.tableAlternateBackground = colorValue(t, "alternateBackground", g.tableAlternateBackground);
        g.tableGridWidth = realValue(t, "gridWidth", g.tableGridWidth);
        g.tableGridColor = colorValue(t, "gridColor", g.tableGridColor);
        g.tableBorderWidth = realValue(t, "borderWidth", g.tableBorderWidth);
        g.tableBorderColor = colorValue(t, "borderColor", g.tableBorderColor);
    }
    if (obj.contains(QLatin1String("disclaimerBox"))) {
        QJsonObject d = obj.value(QLatin1String("disclaimerBox")).toObject();
        g.disclaimerPadding = realValue(d, "padding", g.disclaimerPadding);
        g.disclaimerBorderWidth = realValue(d, "borderWidth", g.disclaimerBorderWidth);
        g.disclaimerBorderColor = colorValue(d, "borderColor", g.disclaimerBorderColor);
    }
    if (obj.contains(QLatin1String("footer"))) {
        QJsonObject f = obj.value(QLatin1String("footer")).toObject();
        g.footerEnabled = f.value(QLatin1String("enabled")).toBool(true);
        g.footerTemplate = f.value(QLatin1String("template")).toString();
        g.footerOffset = realValue(f, "offset", g.footerOffset);
        g.footer = BlockStyle::fromJson(f, g.footer);
    }

    return g;
}

QJsonObject PageGeometry::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("pageSize")] = pageSizeToString(pageSizeId);

    QJsonObject m;
    m[QLatin1String("left")] = margins.left();
    m[QLatin1String("top")] = margins.top();
    m[QLatin1String("right")] = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();
    obj[QLatin1String("margins")] = m;

    for (int i = 0; i < 3; ++i)
        obj[QLatin1String(kHeadingKeys[i])] = headings[i].toJson();
    obj[QLatin1String("body")] = body.toJson();
    obj[QLatin1String("listItem")] = listItem.toJson();
    obj[QLatin1String("tableCell")] = tableCell.toJson();
    obj[QLatin1String("tableHeader")] = tableHeader.toJson();
    obj[QLatin1String("disclaimer")] = disclaimer.toJson();

    QJsonObject hr;
    hr[QLatin1String("width")] = headingRuleWidth;
    hr[QLatin1String("gap")] = headingRuleGap;
    hr[QLatin1String("color")] = headingRuleColor.name();
    obj[QLatin1String("headingRule")] = hr;

    QJsonObject r;
    r[QLatin1String("width")] = ruleWidth;
    r[QLatin1String("space")] = ruleSpace;
    r[QLatin1String("color")] = ruleColor.name();
    obj[QLatin1String("rule")] = r;

    QJsonObject l;
    l[QLatin1String("indent")] = listIndent;
    l[QLatin1String("markerIndent")] = listMarkerIndent;
    obj[QLatin1String("list")] = l;

    QJsonObject t;
    t[QLatin1String("columns")] = columnPolicy == ColumnPolicy::KeyValue
        ? QStringLiteral("keyValue") : QStringLiteral("equal");
    t[QLatin1String("cellPadding")] = cellPadding;
    t[QLatin1String("headerBottomPadding")] = headerBottomPadding;
    t[QLatin1String("spaceAfter")] = tableSpaceAfter;
    t[QLatin1String("headerBackground")] = tableHeaderBackground.name();
    t[QLatin1String("alternateBackground")] = tableAlternateBackground.name();
    t[QLatin1String("gridWidth")] = tableGridWidth;
    t[QLatin1String("gridColor")] = tableGridColor.name();
    t[QLatin1String("borderWidth")] = tableBorderWidth;
    t[QLatin1String("borderColor")] = tableBorderColor.name();
    obj[QLatin1String("table")] = t;

    QJsonObject d;
    d[QLatin1String("padding")] = disclaimerPadding;
    d[QLatin1String("borderWidth")] = disclaimerBorderWidth;
    d[QLatin1String("borderColor")] = disclaimerBorderColor.name();
    obj[QLatin1String("disclaimerBox")] = d;

    QJsonObject f = footer.toJson();
    f[QLatin1String("enabled")] = footerEnabled;
    f[QLatin1String("template")] = footerTemplate;
    f[QLatin1String("offset")] = footerOffset;
    obj[QLatin1String("footer")] = f;

    return obj;
}

bool PageGeometry::loadFile(const QString &path, PageGeometry *geometry,
                            QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "PageGeometry: cannot open" << path;
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot open %1").arg(path);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "PageGeometry: invalid JSON in" << path << parseError.errorString();
        if (errorMessage)
            *errorMessage = QStringLiteral("invalid style file %1: %2")
                                .arg(path, parseError.errorString());
        return false;
    }

    *geometry = fromJson(doc.object());
    return true;
}
