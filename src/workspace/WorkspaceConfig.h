/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACECONFIG_H
#define WORKSPACECONFIG_H

#include "workdeckprivate_export.h"

#include <QString>

namespace Workdeck
{

/**
 * Tunables read once when the manager is built
 */
struct WORKDECKPRIVATE_EXPORT WorkspaceConfig {
    int pollIntervalMs = 10;
    int exportLineLimit = 2000;
    int scrollback = 5000;
    int defaultColumns = 80;
    int defaultRows = 24;
    QString socketPath; // Empty = LocalSocketHostBridge::defaultSocketPath()
};

/**
 * Persistence of the default shell profile id
 */
class WORKDECKPRIVATE_EXPORT ProfileStore
{
public:
    virtual ~ProfileStore() = default;

    virtual QString loadDefaultProfileId() const = 0;
    virtual void saveDefaultProfileId(const QString &id) = 0;
};

} // namespace Workdeck

#endif // WORKSPACECONFIG_H
