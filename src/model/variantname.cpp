/*
 * variantname.cpp - Display-name composition for card records
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "variantname.h"

#include <QStringList>

namespace VariantName {

Affixes resolveAffixes(const Binder::CardRecord &record,
                       const Binder::Section &section)
{
    Affixes affixes;
    if (record.hasPrefix)
        affixes.prefix = record.prefix;
    else if (section.hasPrefix)
        affixes.prefix = section.prefix;

    if (record.hasSuffix)
        affixes.suffix = record.suffix;
    else if (section.hasSuffix)
        affixes.suffix = section.suffix;
    return affixes;
}

QString compose(const Binder::CardRecord &record,
                const Binder::Section &section,
                const QString &language)
{
    const Affixes affixes = resolveAffixes(record, section);

    QString suffix = affixes.suffix.trimmed();
    if (record.delta)
        suffix = suffix.isEmpty() ? QStringLiteral("δ")
                                  : suffix + QStringLiteral(" δ");

    QStringList parts;
    parts << affixes.prefix.trimmed()
          << record.name(language).trimmed()
          << record.pairedForm.trimmed().toUpper()
          << suffix;
    parts.removeAll(QString());
    return parts.join(QLatin1Char(' '));
}

} // namespace VariantName
