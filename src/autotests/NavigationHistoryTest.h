/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NAVIGATIONHISTORYTEST_H
#define NAVIGATIONHISTORYTEST_H

#include <QObject>

namespace Workdeck
{

class NavigationHistoryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testEmpty();
    void testNavigateAppends();
    void testSameAddressNotDuplicated();
    void testBackForwardRestores();
    void testNavigateAfterBackTruncates();
    void testGuardAbsorbsOneAddressChange();
    void testUserNavigationClearsGuard();
    void testBoundaries();
};

}

#endif // NAVIGATIONHISTORYTEST_H
