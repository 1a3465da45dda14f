/**
 * @file storesettings.cpp
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

#include "holocron/storesettings.h"

#include <QScopedPointer>
#include <QSettings>

#define STK_INSTALLATION_PATH   "installation/path"
#define STK_SECONDARY_PATHS     "installation/secondaryPaths"
#define STK_SEARCH_ORDER        "search/order"
#define STK_EXPLAIN             "search/explain"
#define STK_LOG_LEVEL           "log/level"

namespace holocron {

HOLOCRON_PIMPL_NOREF(StoreSettings)
{
    QScopedPointer<QSettings> settings;

    Instance(QString const &fileName)
        : settings(fileName.isEmpty()? new QSettings
                                     : new QSettings(fileName, QSettings::IniFormat))
    {}
};

StoreSettings::StoreSettings(QString const &fileName) : d(new Instance(fileName))
{}

StoreSettings::~StoreSettings()
{}

QString StoreSettings::installationPath() const
{
    return d->settings->value(STK_INSTALLATION_PATH).toString();
}

QStringList StoreSettings::secondaryPaths() const
{
    return d->settings->value(STK_SECONDARY_PATHS).toStringList();
}

SearchOrder StoreSettings::searchOrder() const
{
    if(!d->settings->contains(STK_SEARCH_ORDER)) return defaultSearchOrder();

    // Unquoted comma-separated INI values are read back as lists.
    QVariant const value = d->settings->value(STK_SEARCH_ORDER);
    QString const text = (value.type() == QVariant::StringList? value.toStringList().join(",")
                                                               : value.toString());
    try
    {
        return searchOrderFromText(text);
    }
    catch(UnknownSearchLocationError const &er)
    {
        throw ValueError("StoreSettings::searchOrder",
                         QString("Invalid value \"%1\" for " STK_SEARCH_ORDER ": %2")
                             .arg(text).arg(er.asText()));
    }
}

bool StoreSettings::explain() const
{
    return d->settings->value(STK_EXPLAIN, false).toBool();
}

LogEntry::Level StoreSettings::logLevel() const
{
    if(!d->settings->contains(STK_LOG_LEVEL)) return LogEntry::MESSAGE;

    QString const text = d->settings->value(STK_LOG_LEVEL).toString();
    LogEntry::Level const level = LogEntry::textToLevel(text, LogEntry::MAX_LOG_LEVELS);
    if(level == LogEntry::MAX_LOG_LEVELS)
    {
        throw ValueError("StoreSettings::logLevel",
                         QString("Invalid value \"%1\" for " STK_LOG_LEVEL).arg(text));
    }
    return level;
}

void StoreSettings::setInstallationPath(QString const &path)
{
    d->settings->setValue(STK_INSTALLATION_PATH, path);
}

void StoreSettings::setSecondaryPaths(QStringList const &paths)
{
    d->settings->setValue(STK_SECONDARY_PATHS, paths);
}

void StoreSettings::setSearchOrder(SearchOrder const &order)
{
    d->settings->setValue(STK_SEARCH_ORDER, searchOrderToText(order));
}

void StoreSettings::setExplain(bool explain)
{
    d->settings->setValue(STK_EXPLAIN, explain);
}

void StoreSettings::setLogLevel(LogEntry::Level level)
{
    d->settings->setValue(STK_LOG_LEVEL, LogEntry::levelToText(level));
}

} // namespace holocron
