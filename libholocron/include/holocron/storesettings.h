/**
 * @file storesettings.h
 * Persistent settings of resource store users. @ingroup resource
 *
 * @authors Copyright © 2013 The Holocron Authors
 *
 * @par License
 * GPL: http://www.gnu.org/licenses/gpl.html
 *
 * <small>This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by the
 * Free Software Foundation; either version 2 of the License, or (at your
 * option) any later version. This program is distributed in the hope that it
 * will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty
 * of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
 * Public License for more details. You should have received a copy of the GNU
 * General Public License along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA</small>
 */

#ifndef LIBHOLOCRON_STORESETTINGS_H
#define LIBHOLOCRON_STORESETTINGS_H

#include "error.h"
#include "log.h"
#include "searchlocation.h"

#include <QStringList>

namespace holocron {

/**
 * Installation paths and query preferences, stored with QSettings.
 * Values that are not set fall back to built-in defaults.
 */
class HOLOCRON_PUBLIC StoreSettings
{
public:
    /// A stored value cannot be interpreted. @ingroup errors
    HOLOCRON_ERROR(ValueError);

public:
    /**
     * @param fileName  INI file to use. If empty, the application's default
     *                  settings location is used.
     */
    StoreSettings(QString const &fileName = "");
    ~StoreSettings();

    /// Root of the primary installation. Empty if not set.
    QString installationPath() const;

    /// Other installations, e.g. for comparisons.
    QStringList secondaryPaths() const;

    /**
     * Default search order for queries.
     *
     * @throws ValueError  The stored order names an unknown category.
     */
    SearchOrder searchOrder() const;

    bool explain() const;

    /**
     * Minimum level of log entries to show. Defaults to MESSAGE.
     *
     * @throws ValueError  The stored level is not a level name.
     */
    LogEntry::Level logLevel() const;

    void setInstallationPath(QString const &path);
    void setSecondaryPaths(QStringList const &paths);
    void setSearchOrder(SearchOrder const &order);
    void setExplain(bool explain);
    void setLogLevel(LogEntry::Level level);

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_STORESETTINGS_H
