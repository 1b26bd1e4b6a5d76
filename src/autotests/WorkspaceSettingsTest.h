/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESETTINGSTEST_H
#define WORKSPACESETTINGSTEST_H

#include <QObject>

namespace Workdeck
{

class WorkspaceSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void init();
    void cleanup();

    void testDefaults();
    void testInvalidValuesFallBack();
    void testPersistence();
    void testProfileStore();
    void testSocketPath();
    void testChangeSignal();
};

}

#endif // WORKSPACESETTINGSTEST_H
