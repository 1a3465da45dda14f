/**
 * @file main.cpp
 * Tests for the persistent settings of resource store users.
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

#include "fixtures.h"

#include <holocron/storesettings.h>

#include <QDir>
#include <QTemporaryDir>
#include <QtTest>

using namespace holocron;
using namespace fixtures;

class TestSettings : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir _temp;

    QString iniPath(QString const &name) const { return QDir(_temp.path()).filePath(name); }

private slots:
    void defaults()
    {
        StoreSettings st(iniPath("empty.ini"));
        QVERIFY(st.installationPath().isEmpty());
        QVERIFY(st.secondaryPaths().isEmpty());
        QCOMPARE(st.searchOrder(), defaultSearchOrder());
        QVERIFY(!st.explain());
        QCOMPARE(st.logLevel(), LogEntry::MESSAGE);
    }

    void roundTrip()
    {
        {
            StoreSettings st(iniPath("saved.ini"));
            st.setInstallationPath("/games/kotor");
            st.setSecondaryPaths(QStringList() << "/games/kotor-backup" << "/games/kotor-gog");
            st.setSearchOrder(SearchOrder() << SL_OVERRIDE << SL_CHITIN);
            st.setExplain(true);
            st.setLogLevel(LogEntry::DEBUG);
        }

        StoreSettings st(iniPath("saved.ini"));
        QCOMPARE(st.installationPath(), QString("/games/kotor"));
        QCOMPARE(st.secondaryPaths().size(), 2);
        QCOMPARE(st.searchOrder(), SearchOrder() << SL_OVERRIDE << SL_CHITIN);
        QVERIFY(st.explain());
        QCOMPARE(st.logLevel(), LogEntry::DEBUG);
    }

    void handWrittenFile()
    {
        writeFile(iniPath("manual.ini"),
                  "[search]\n"
                  "order=override, modules, chitin\n"
                  "[log]\n"
                  "level=warning\n");

        StoreSettings st(iniPath("manual.ini"));
        QCOMPARE(st.searchOrder(), SearchOrder() << SL_OVERRIDE << SL_MODULES << SL_CHITIN);
        QCOMPARE(st.logLevel(), LogEntry::WARNING);
    }

    void invalidValues()
    {
        writeFile(iniPath("invalid.ini"),
                  "[search]\n"
                  "order=override,attic\n"
                  "[log]\n"
                  "level=chatty\n");

        StoreSettings st(iniPath("invalid.ini"));
        QVERIFY_EXCEPTION_THROWN(st.searchOrder(), StoreSettings::ValueError);
        QVERIFY_EXCEPTION_THROWN(st.logLevel(), StoreSettings::ValueError);
    }
};

QTEST_APPLESS_MAIN(TestSettings)
#include "main.moc"
