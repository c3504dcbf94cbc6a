/*
 * variantname.h - Display-name composition for card records
 *
 * Prefix/suffix precedence: the record's own override wins over the
 * section default; with neither set the name carries no affix.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_VARIANTNAME_H
#define CARDBINDER_VARIANTNAME_H

#include <QString>

#include "documentmodel.h"

namespace VariantName {

struct Affixes {
    QString prefix;
    QString suffix;
};

// Resolve (prefix, suffix) for a record: record > section > none.
Affixes resolveAffixes(const Binder::CardRecord &record,
                       const Binder::Section &section);

// "<prefix> <base> <paired form> <suffix[ δ]>", empty parts skipped.
// The result may contain inline tokens such as "[EX_NEW]".
QString compose(const Binder::CardRecord &record,
                const Binder::Section &section,
                const QString &language);

} // namespace VariantName

#endif // CARDBINDER_VARIANTNAME_H
