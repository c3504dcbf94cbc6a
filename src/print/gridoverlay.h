/*
 * gridoverlay.h - Cutting guides and footer for card grid pages
 *
 * Drawn after the cells so the guides stay visible on top.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_GRIDOVERLAY_H
#define CARDBINDER_GRIDOVERLAY_H

#include <QFont>
#include <QString>

class QPainter;
struct PageLayout;

namespace GridOverlay {

void drawCuttingGuides(QPainter *painter, const PageLayout &layout);

// The caption is drawn as given; an empty caption draws nothing.
void drawFooter(QPainter *painter, const PageLayout &layout, const QFont &font,
                const QString &caption);

} // namespace GridOverlay

#endif // CARDBINDER_GRIDOVERLAY_H
