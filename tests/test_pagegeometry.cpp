/*
 * test_pagegeometry.cpp — Unit tests for page geometry defaults and style files
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QJsonDocument>
#include <QTemporaryDir>
#include <QFile>

#include "pagegeometry.h"

TEST(PageGeometry, DefaultsDescribeA4Report) {
    PageGeometry g;
    const QSizeF page = g.pageSizePoints();
    EXPECT_NEAR(page.width(), 595.0, 1.0);
    EXPECT_NEAR(page.height(), 842.0, 1.0);

    const QMarginsF m = g.marginsPoints();
    EXPECT_NEAR(m.left(), 36.0, 0.01);   // 0.5 in
    EXPECT_NEAR(m.top(), 54.0, 0.01);    // 0.75 in
    EXPECT_NEAR(m.right(), 36.0, 0.01);
    EXPECT_NEAR(m.bottom(), 54.0, 0.01);

    EXPECT_NEAR(g.contentSizePoints().width(), page.width() - 72.0, 0.01);
    EXPECT_DOUBLE_EQ(g.headingStyle(1).fontSize, 18.0);
    EXPECT_EQ(g.headingStyle(2).color, QColor(QStringLiteral("#16a085")));
    EXPECT_DOUBLE_EQ(g.body.leading, 14.0);
    EXPECT_EQ(g.tableHeaderBackground, QColor(QStringLiteral("#ecf0f1")));
}

TEST(PageGeometry, HeadingLevelIsClamped) {
    PageGeometry g;
    EXPECT_DOUBLE_EQ(g.headingStyle(0).fontSize, g.headings[0].fontSize);
    EXPECT_DOUBLE_EQ(g.headingStyle(6).fontSize, g.headings[2].fontSize);
}

TEST(PageGeometry, JsonOverridesOnlyGivenKeys) {
    const QByteArray json = R"({
        "pageSize": "Letter",
        "body": { "fontSize": 11, "color": "#333333" },
        "table": { "columns": "keyValue", "cellPadding": 4 },
        "footer": { "template": "{title} - {page}" }
    })";
    PageGeometry g = PageGeometry::fromJson(QJsonDocument::fromJson(json).object());

    EXPECT_EQ(g.pageSizeId, QPageSize::Letter);
    EXPECT_DOUBLE_EQ(g.body.fontSize, 11.0);
    EXPECT_DOUBLE_EQ(g.body.leading, 14.0);
    EXPECT_EQ(g.body.color, QColor(0x33, 0x33, 0x33));
    EXPECT_EQ(g.columnPolicy, PageGeometry::ColumnPolicy::KeyValue);
    EXPECT_DOUBLE_EQ(g.cellPadding, 4.0);
    EXPECT_DOUBLE_EQ(g.headerBottomPadding, 12.0);
    EXPECT_EQ(g.footerTemplate, QStringLiteral("{title} - {page}"));
    EXPECT_TRUE(g.footerEnabled);
    EXPECT_DOUBLE_EQ(g.headings[0].fontSize, 18.0);
}

TEST(PageGeometry, JsonRoundTripKeepsValues) {
    PageGeometry g;
    g.listIndent = 24;
    g.disclaimerPadding = 8;
    g.headings[2].spaceAfter = 5;
    PageGeometry back = PageGeometry::fromJson(g.toJson());
    EXPECT_DOUBLE_EQ(back.listIndent, 24.0);
    EXPECT_DOUBLE_EQ(back.disclaimerPadding, 8.0);
    EXPECT_DOUBLE_EQ(back.headings[2].spaceAfter, 5.0);
    EXPECT_EQ(back.pageSizeId, QPageSize::A4);
}

TEST(PageGeometry, LoadFileRejectsMissingAndInvalidFiles) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    PageGeometry g;
    g.listIndent = 99;
    QString error;
    EXPECT_FALSE(PageGeometry::loadFile(dir.filePath(QStringLiteral("missing.json")), &g, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_DOUBLE_EQ(g.listIndent, 99.0);

    const QString badPath = dir.filePath(QStringLiteral("bad.json"));
    QFile bad(badPath);
    ASSERT_TRUE(bad.open(QIODevice::WriteOnly));
    bad.write("[1, 2");
    bad.close();
    EXPECT_FALSE(PageGeometry::loadFile(badPath, &g, &error));
    EXPECT_DOUBLE_EQ(g.listIndent, 99.0);
}

TEST(PageGeometry, LoadFileAppliesStyle) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("style.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({ "list": { "indent": 30 }, "footer": { "enabled": false } })");
    file.close();

    PageGeometry g;
    ASSERT_TRUE(PageGeometry::loadFile(path, &g));
    EXPECT_DOUBLE_EQ(g.listIndent, 30.0);
    EXPECT_FALSE(g.footerEnabled);
}
