/*
 * contentbuilder.h — MD4C → Content::Document builder
 *
 * Lenient: md4c never rejects input, and whatever it recognises outside
 * the report subset (code, quotes, links, images, nested lists) is
 * flattened into plain inline runs of the enclosing block.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_CONTENTBUILDER_H
#define REPORTPDF_CONTENTBUILDER_H

#include <QString>

#include <md4c.h>

#include "contentmodel.h"

class ContentBuilder {
public:
    ContentBuilder() = default;

    Content::Document build(const QString &markdownText);

    // True for paragraphs that open with "Disclaimer:" / "अस्वीकरण:".
    static bool isDisclaimer(const QString &text);

private:
    // MD4C static callbacks
    static int sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata);
    static int sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata);
    static int sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size,
                     void *userdata);

    // Instance handlers
    int enterBlock(MD_BLOCKTYPE type, void *detail);
    int leaveBlock(MD_BLOCKTYPE type, void *detail);
    int enterSpan(MD_SPANTYPE type, void *detail);
    int leaveSpan(MD_SPANTYPE type, void *detail);
    int onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size);

    // Helpers
    static QString prepareSource(const QString &markdownText);
    QString resolveEntity(const QString &entity) const;
    void appendText(const QString &text);
    void addBlock(Content::BlockNode node);
    void flushListItem();
    void breakOutOfList();
    Content::Inlines takeInlines();
    void normalize();
    void buildPlain(const QString &markdownText);

    // State
    Content::Document m_doc;
    Content::Inlines m_inlines; // inline target of the open block
    int m_boldDepth = 0;
    int m_italicDepth = 0;

    int m_headingLevel = 0; // 0 = not inside a heading
    bool m_inCodeBlock = false;

    // List tracking (nested lists are flattened into the outermost one)
    int m_listDepth = 0;
    Content::ListBlock m_list;
    bool m_itemOpen = false;

    // Table tracking
    bool m_inTable = false;
    bool m_inTableHeader = false;
    bool m_headerSeen = false;
    Content::Table m_table;
    QList<Content::Inlines> m_currentRowCells;
};

#endif // REPORTPDF_CONTENTBUILDER_H
