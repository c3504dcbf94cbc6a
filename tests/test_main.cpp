/*
 * test_main.cpp - GoogleTest entry point with a headless Qt application
 *
 * Fonts, QPainter and QPdfWriter need a QGuiApplication; the offscreen
 * platform lets the suite run without a display.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QGuiApplication>

int main(int argc, char **argv)
{
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
