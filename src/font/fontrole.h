/*
 * fontrole.h — The four font resources a report can use
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTPDF_FONTROLE_H
#define REPORTPDF_FONTROLE_H

#include <QString>

#include "contentmodel.h"

namespace Fonts {

enum class Role {
    LatinRegular,
    LatinBold,
    DevanagariRegular,
    DevanagariBold,
};

constexpr int kRoleCount = 4;

constexpr Role kAllRoles[kRoleCount] = {
    Role::LatinRegular,
    Role::LatinBold,
    Role::DevanagariRegular,
    Role::DevanagariBold,
};

// Bold wins over italic; italic never selects a separate face.
inline Role roleFor(Content::Script script, bool bold)
{
    if (script == Content::Script::Devanagari)
        return bold ? Role::DevanagariBold : Role::DevanagariRegular;
    return bold ? Role::LatinBold : Role::LatinRegular;
}

inline bool isDevanagari(Role role)
{
    return role == Role::DevanagariRegular || role == Role::DevanagariBold;
}

inline QString roleName(Role role)
{
    switch (role) {
    case Role::LatinRegular:      return QStringLiteral("latin-regular");
    case Role::LatinBold:         return QStringLiteral("latin-bold");
    case Role::DevanagariRegular: return QStringLiteral("devanagari-regular");
    case Role::DevanagariBold:    return QStringLiteral("devanagari-bold");
    }
    return QString();
}

} // namespace Fonts

#endif // REPORTPDF_FONTROLE_H
