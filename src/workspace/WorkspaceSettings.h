/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef WORKSPACESETTINGS_H
#define WORKSPACESETTINGS_H

#include "workdeckprivate_export.h"

#include "WorkspaceConfig.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace Workdeck
{

/**
 * WorkspaceSettings reads and writes workdeckrc.
 *
 * Groups:
 * - Terminal: DefaultProfile, PollIntervalMs, ExportLineLimit, Scrollback,
 *   DefaultColumns, DefaultRows
 * - Host: SocketPath
 */
class WORKDECKPRIVATE_EXPORT WorkspaceSettings : public QObject, public ProfileStore
{
    Q_OBJECT

public:
    explicit WorkspaceSettings(const QString &configName = QStringLiteral("workdeckrc"), QObject *parent = nullptr);
    ~WorkspaceSettings() override;

    /**
     * Snapshot of every tunable, with out-of-range values replaced by defaults
     */
    WorkspaceConfig config() const;

    QString defaultProfileId() const;
    void setDefaultProfileId(const QString &id);

    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    int exportLineLimit() const;
    void setExportLineLimit(int lines);

    int scrollback() const;
    void setScrollback(int lines);

    int defaultColumns() const;
    int defaultRows() const;
    void setDefaultGeometry(int columns, int rows);

    /**
     * Host socket path; falls back to the runtime-dir default
     */
    QString socketPath() const;
    void setSocketPath(const QString &path);

    // ProfileStore
    QString loadDefaultProfileId() const override;
    void saveDefaultProfileId(const QString &id) override;

    /**
     * Write pending changes to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfigPtr m_config;
};

} // namespace Workdeck

#endif // WORKSPACESETTINGS_H
