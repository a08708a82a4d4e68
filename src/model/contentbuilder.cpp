/*
 * contentbuilder.cpp — MD4C → Content::Document builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "contentbuilder.h"

#include <QDebug>
#include <QHash>
#include <QRegularExpression>
#include <QStringList>

// --- Build ---

Content::Document ContentBuilder::build(const QString &markdownText)
{
    m_doc = Content::Document{};
    m_inlines.clear();
    m_boldDepth = 0;
    m_italicDepth = 0;
    m_headingLevel = 0;
    m_inCodeBlock = false;
    m_listDepth = 0;
    m_list = Content::ListBlock{};
    m_itemOpen = false;
    m_inTable = false;
    m_inTableHeader = false;
    m_headerSeen = false;
    m_table = Content::Table{};
    m_currentRowCells.clear();

    QByteArray utf8 = prepareSource(markdownText).toUtf8();

    // Parse
    MD_PARSER parser = {};
    parser.abi_version = 0;
    parser.flags = MD_FLAG_TABLES | MD_FLAG_NOHTML;
    parser.enter_block = &ContentBuilder::sEnterBlock;
    parser.leave_block = &ContentBuilder::sLeaveBlock;
    parser.enter_span = &ContentBuilder::sEnterSpan;
    parser.leave_span = &ContentBuilder::sLeaveSpan;
    parser.text = &ContentBuilder::sText;

    int rc = md_parse(utf8.constData(), static_cast<MD_SIZE>(utf8.size()), &parser, this);
    if (rc != 0) {
        qWarning() << "ContentBuilder: md4c aborted with" << rc
                   << "- falling back to plain paragraphs";
        m_doc = Content::Document{};
        buildPlain(markdownText);
    }

    normalize();
    return m_doc;
}

// Report line rules that CommonMark block parsing would otherwise override:
// a thematic break or any list item ends the paragraph above it, a line of
// "=" under text stays text, and more than three '#' is a level-3 heading.
QString ContentBuilder::prepareSource(const QString &markdownText)
{
    static const QRegularExpression fenceRx(QStringLiteral(R"(^ {0,3}(```|~~~))"));
    static const QRegularExpression breakRx(
        QStringLiteral(R"(^ {0,3}(?:(?:-[ \t]*){3,}|(?:\*[ \t]*){3,})$)"));
    static const QRegularExpression listItemRx(
        QStringLiteral(R"(^ {0,3}(?:[-*]|\d+\.)[ \t]+\S)"));
    static const QRegularExpression nestedItemRx(
        QStringLiteral(R"(^[ \t]*(?:[-*]|\d+\.)[ \t]+\S)"));
    static const QRegularExpression underlineRx(QStringLiteral(R"(^ {0,3}=+[ \t]*$)"));
    static const QRegularExpression deepHeadingRx(QStringLiteral(R"(^( {0,3})#{4,}(?=[ \t]|$))"));

    QStringList lines = markdownText.split(QLatin1Char('\n'));
    QStringList out;
    out.reserve(lines.size());
    bool inFence = false;
    QString previous;

    for (QString line : lines) {
        if (line.endsWith(QLatin1Char('\r')))
            line.chop(1);

        if (fenceRx.match(line).hasMatch()) {
            inFence = !inFence;
        } else if (!inFence) {
            const bool afterText = !previous.trimmed().isEmpty();
            if (breakRx.match(line).hasMatch()) {
                if (afterText)
                    out.append(QString());
            } else if (listItemRx.match(line).hasMatch()) {
                if (afterText && !nestedItemRx.match(previous).hasMatch())
                    out.append(QString());
            } else if (underlineRx.match(line).hasMatch()) {
                if (afterText)
                    line.insert(line.indexOf(QLatin1Char('=')), QLatin1Char('\\'));
            } else {
                line.replace(deepHeadingRx, QStringLiteral("\\1###"));
            }
        }

        out.append(line);
        previous = line;
    }
    return out.join(QLatin1Char('\n'));
}

bool ContentBuilder::isDisclaimer(const QString &text)
{
    const QString t = text.trimmed();
    return t.startsWith(QLatin1String("Disclaimer:"), Qt::CaseInsensitive)
        || t.startsWith(QStringLiteral("अस्वीकरण:"));
}

// --- Static callbacks ---

int ContentBuilder::sEnterBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<ContentBuilder *>(userdata)->enterBlock(type, detail); }
int ContentBuilder::sLeaveBlock(MD_BLOCKTYPE type, void *detail, void *userdata)
{ return static_cast<ContentBuilder *>(userdata)->leaveBlock(type, detail); }
int ContentBuilder::sEnterSpan(MD_SPANTYPE type, void *detail, void *userdata)
{ return static_cast<ContentBuilder *>(userdata)->enterSpan(type, detail); }
int ContentBuilder::sLeaveSpan(MD_SPANTYPE type, void *detail, void *userdata)
{ return static_cast<ContentBuilder *>(userdata)->leaveSpan(type, detail); }
int ContentBuilder::sText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size, void *userdata)
{ return static_cast<ContentBuilder *>(userdata)->onText(type, text, size); }

// --- Block handlers ---

int ContentBuilder::enterBlock(MD_BLOCKTYPE type, void *detail)
{
    switch (type) {
    case MD_BLOCK_DOC:
    case MD_BLOCK_QUOTE:
    case MD_BLOCK_HTML:
        break;

    case MD_BLOCK_P:
        // Inside list items and cells a paragraph only separates text
        if (m_listDepth > 0 || m_inTable) {
            if (!m_inlines.isEmpty())
                appendText(QStringLiteral(" "));
        } else {
            m_inlines.clear();
        }
        break;

    case MD_BLOCK_H: {
        auto *d = static_cast<MD_BLOCK_H_DETAIL *>(detail);
        if (m_listDepth > 0)
            breakOutOfList();
        m_headingLevel = qBound(1, static_cast<int>(d->level), 3);
        m_inlines.clear();
        break;
    }

    case MD_BLOCK_UL:
    case MD_BLOCK_OL:
        if (m_listDepth == 0) {
            m_list = Content::ListBlock{};
            m_list.ordered = (type == MD_BLOCK_OL);
        } else {
            // Nested list: its items continue the outer list
            flushListItem();
        }
        ++m_listDepth;
        break;

    case MD_BLOCK_LI:
        flushListItem();
        m_itemOpen = true;
        break;

    case MD_BLOCK_CODE:
        m_inCodeBlock = true;
        if (m_listDepth > 0 || m_inTable) {
            if (!m_inlines.isEmpty())
                appendText(QStringLiteral(" "));
        } else {
            m_inlines.clear();
        }
        break;

    case MD_BLOCK_HR:
        if (m_listDepth > 0)
            breakOutOfList();
        addBlock(Content::Rule{});
        break;

    case MD_BLOCK_TABLE:
        if (m_listDepth > 0)
            breakOutOfList();
        m_inTable = true;
        m_headerSeen = false;
        m_table = Content::Table{};
        break;

    case MD_BLOCK_THEAD:
        m_inTableHeader = true;
        break;

    case MD_BLOCK_TBODY:
        m_inTableHeader = false;
        break;

    case MD_BLOCK_TR:
        m_currentRowCells.clear();
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        m_inlines.clear();
        break;
    }

    return 0;
}

int ContentBuilder::leaveBlock(MD_BLOCKTYPE type, void * /*detail*/)
{
    switch (type) {
    case MD_BLOCK_P:
        if (m_listDepth == 0 && !m_inTable) {
            Content::Paragraph para;
            para.inlines = takeInlines();
            if (!para.inlines.isEmpty()) {
                para.disclaimer = isDisclaimer(Content::plainText(para.inlines));
                addBlock(std::move(para));
            }
        }
        break;

    case MD_BLOCK_H: {
        Content::Heading heading;
        heading.level = m_headingLevel;
        heading.inlines = takeInlines();
        m_headingLevel = 0;
        if (!heading.inlines.isEmpty())
            addBlock(std::move(heading));
        break;
    }

    case MD_BLOCK_UL:
    case MD_BLOCK_OL:
        --m_listDepth;
        if (m_listDepth == 0) {
            flushListItem();
            if (!m_list.items.isEmpty())
                addBlock(m_list);
            m_list = Content::ListBlock{};
        }
        break;

    case MD_BLOCK_LI:
        flushListItem();
        break;

    case MD_BLOCK_CODE:
        m_inCodeBlock = false;
        if (m_listDepth == 0 && !m_inTable) {
            Content::Paragraph para;
            para.inlines = takeInlines();
            if (!para.inlines.isEmpty())
                addBlock(std::move(para));
        }
        break;

    case MD_BLOCK_TABLE: {
        m_inTable = false;
        // Body rows take the header's column count
        const int columns = m_table.header.size();
        for (auto &row : m_table.rows)
            row.resize(columns);
        if (columns > 0)
            addBlock(m_table);
        m_table = Content::Table{};
        break;
    }

    case MD_BLOCK_THEAD:
        m_inTableHeader = false;
        break;

    case MD_BLOCK_TR:
        if (m_inTableHeader && !m_headerSeen) {
            m_table.header = m_currentRowCells;
            m_headerSeen = true;
        } else {
            m_table.rows.append(m_currentRowCells);
        }
        m_currentRowCells.clear();
        break;

    case MD_BLOCK_TH:
    case MD_BLOCK_TD:
        m_currentRowCells.append(takeInlines());
        break;

    default:
        break;
    }
    return 0;
}

// --- Span handlers ---

int ContentBuilder::enterSpan(MD_SPANTYPE type, void * /*detail*/)
{
    switch (type) {
    case MD_SPAN_EM:
        ++m_italicDepth;
        break;
    case MD_SPAN_STRONG:
        ++m_boldDepth;
        break;
    default:
        // Code spans, links and images keep their text as plain runs
        break;
    }
    return 0;
}

int ContentBuilder::leaveSpan(MD_SPANTYPE type, void * /*detail*/)
{
    switch (type) {
    case MD_SPAN_EM:
        m_italicDepth = qMax(0, m_italicDepth - 1);
        break;
    case MD_SPAN_STRONG:
        m_boldDepth = qMax(0, m_boldDepth - 1);
        break;
    default:
        break;
    }
    return 0;
}

// --- Text handler ---

int ContentBuilder::onText(MD_TEXTTYPE type, const MD_CHAR *text, MD_SIZE size)
{
    QString str = QString::fromUtf8(text, static_cast<int>(size));

    switch (type) {
    case MD_TEXT_CODE:
        if (m_inCodeBlock)
            str.replace(QLatin1Char('\n'), QLatin1Char(' '));
        appendText(str);
        break;

    case MD_TEXT_BR:
    case MD_TEXT_SOFTBR:
        appendText(QStringLiteral(" "));
        break;

    case MD_TEXT_ENTITY:
        appendText(resolveEntity(str));
        break;

    case MD_TEXT_NULLCHAR:
        appendText(QString(QChar(0xFFFD)));
        break;

    default:
        appendText(str);
        break;
    }
    return 0;
}

// --- Helpers ---

void ContentBuilder::appendText(const QString &text)
{
    if (text.isEmpty())
        return;

    const bool bold = m_boldDepth > 0;
    const bool italic = m_italicDepth > 0;
    if (!m_inlines.isEmpty()
        && m_inlines.last().bold == bold && m_inlines.last().italic == italic) {
        m_inlines.last().text += text;
        return;
    }

    Content::InlineRun run;
    run.text = text;
    run.bold = bold;
    run.italic = italic;
    m_inlines.append(run);
}

void ContentBuilder::addBlock(Content::BlockNode node)
{
    m_doc.blocks.append(std::move(node));
}

void ContentBuilder::flushListItem()
{
    Content::Inlines item = takeInlines();
    if (m_itemOpen || !item.isEmpty())
        m_list.items.append(item);
    m_itemOpen = false;
}

void ContentBuilder::breakOutOfList()
{
    // A block that cannot live in a list item closes the list so far;
    // remaining items continue as a new list after it.
    flushListItem();
    if (!m_list.items.isEmpty()) {
        addBlock(m_list);
        m_list.items.clear();
    }
}

Content::Inlines ContentBuilder::takeInlines()
{
    Content::Inlines runs;
    runs.swap(m_inlines);

    while (!runs.isEmpty()) {
        QString &t = runs.first().text;
        int i = 0;
        while (i < t.size() && t.at(i).isSpace())
            ++i;
        t.remove(0, i);
        if (!t.isEmpty())
            break;
        runs.removeFirst();
    }
    while (!runs.isEmpty()) {
        QString &t = runs.last().text;
        int n = t.size();
        while (n > 0 && t.at(n - 1).isSpace())
            --n;
        t.truncate(n);
        if (!t.isEmpty())
            break;
        runs.removeLast();
    }
    return runs;
}

void ContentBuilder::normalize()
{
    // "-" and "*" bullets are one kind; CommonMark splits lists on a
    // marker change, so re-join neighbouring lists of the same kind.
    QList<Content::BlockNode> merged;
    merged.reserve(m_doc.blocks.size());
    for (auto &block : m_doc.blocks) {
        auto *list = std::get_if<Content::ListBlock>(&block);
        Content::ListBlock *prev = merged.isEmpty()
            ? nullptr : std::get_if<Content::ListBlock>(&merged.last());
        if (list && prev && prev->ordered == list->ordered) {
            prev->items.append(list->items);
            continue;
        }
        merged.append(std::move(block));
    }
    m_doc.blocks = std::move(merged);
}

void ContentBuilder::buildPlain(const QString &markdownText)
{
    QStringList pending;
    auto flush = [&]() {
        if (pending.isEmpty())
            return;
        Content::InlineRun run;
        run.text = pending.join(QLatin1Char(' '));
        Content::Paragraph para;
        para.inlines.append(run);
        para.disclaimer = isDisclaimer(run.text);
        addBlock(std::move(para));
        pending.clear();
    };

    const QStringList lines = markdownText.split(QLatin1Char('\n'));
    for (const QString &line : lines) {
        const QString t = line.trimmed();
        if (t.isEmpty())
            flush();
        else
            pending.append(t);
    }
    flush();
}

QString ContentBuilder::resolveEntity(const QString &entity) const
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("&amp;"),    QStringLiteral("&")},
        {QStringLiteral("&lt;"),     QStringLiteral("<")},
        {QStringLiteral("&gt;"),     QStringLiteral(">")},
        {QStringLiteral("&quot;"),   QStringLiteral("\"")},
        {QStringLiteral("&apos;"),   QStringLiteral("'")},
        {QStringLiteral("&nbsp;"),   QString(QChar(0x00A0))},
        {QStringLiteral("&mdash;"),  QString(QChar(0x2014))},
        {QStringLiteral("&ndash;"),  QString(QChar(0x2013))},
        {QStringLiteral("&lsquo;"),  QString(QChar(0x2018))},
        {QStringLiteral("&rsquo;"),  QString(QChar(0x2019))},
        {QStringLiteral("&ldquo;"),  QString(QChar(0x201C))},
        {QStringLiteral("&rdquo;"),  QString(QChar(0x201D))},
        {QStringLiteral("&hellip;"), QString(QChar(0x2026))},
        {QStringLiteral("&deg;"),    QString(QChar(0x00B0))},
        {QStringLiteral("&times;"),  QString(QChar(0x00D7))},
    };
    auto it = entities.constFind(entity);
    if (it != entities.constEnd())
        return it.value();
    if (entity.startsWith(QLatin1String("&#"))) {
        QString num = entity.mid(2, entity.size() - 3);
        bool ok = false;
        uint code;
        if (num.startsWith(QLatin1Char('x'), Qt::CaseInsensitive))
            code = num.mid(1).toUInt(&ok, 16);
        else
            code = num.toUInt(&ok, 10);
        if (ok && code > 0 && code <= 0x10FFFF) {
            char32_t cp = code;
            return QString::fromUcs4(&cp, 1);
        }
    }
    return entity;
}
