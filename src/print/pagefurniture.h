/*
 * pagefurniture.h — Footer field substitution
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_PAGEFURNITURE_H
#define REPORTPDF_PAGEFURNITURE_H

#include <QString>

struct PageMetadata {
    int pageNumber = 0;   // 0-based
    int totalPages = 1;
    QString title;
};

namespace PageFurniture {

// Replaces {page} (1-based), {pages} and {title}.
QString resolveField(const QString &text, const PageMetadata &meta);

} // namespace PageFurniture

#endif // REPORTPDF_PAGEFURNITURE_H
