/*
 * pagefurniture.cpp — Footer field substitution
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagefurniture.h"

namespace PageFurniture {

QString resolveField(const QString &text, const PageMetadata &meta)
{
    if (text.isEmpty())
        return {};

    QString result = text;
    result.replace(QLatin1String("{pages}"), QString::number(meta.totalPages));
    result.replace(QLatin1String("{page}"), QString::number(meta.pageNumber + 1));
    result.replace(QLatin1String("{title}"), meta.title);
    return result;
}

} // namespace PageFurniture
