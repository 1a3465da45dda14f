/**
 * @file main.cpp
 * Tests for identifying the game variant of an installation.
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

#include <holocron/game.h>
#include <holocron/installation.h>

#include <QDir>
#include <QTemporaryDir>
#include <QtTest>

using namespace holocron;
using namespace fixtures;

class TestGame : public QObject
{
    Q_OBJECT

private slots:
    void names()
    {
        QCOMPARE(gameName(GAME_K1), QString("K1"));
        QCOMPARE(gameName(GAME_K2_IOS), QString("K2_IOS"));
        QVERIFY(isK1(GAME_K1_ANDROID));
        QVERIFY(isK2(GAME_K2_XBOX));
        QVERIFY(!isK1(GAME_UNKNOWN) && !isK2(GAME_UNKNOWN));
    }

    void identifyDesktopReleases()
    {
        QTemporaryDir k1;
        makeK1Installation(k1.path());
        QCOMPARE(identifyGame(k1.path()), GAME_K1);

        QTemporaryDir k2;
        makeK2Installation(k2.path());
        GameScores scores;
        QCOMPARE(identifyGame(k2.path(), &scores), GAME_K2);
        QVERIFY(scores.value(GAME_K2) > scores.value(GAME_K1));
    }

    void probesIgnoreCase()
    {
        QTemporaryDir temp;
        makeDir(temp.path(), "Modules");
        makeDir(temp.path(), "StreamWaves");
        writeFile(QDir(temp.path()).filePath("SWKOTOR.EXE"));
        QCOMPARE(identifyGame(temp.path()), GAME_K1);
    }

    void mobileRelease()
    {
        QTemporaryDir temp;
        makeDir(temp.path(), "streamvoice");
        writeFile(QDir(temp.path()).filePath("KOTOR II"));
        writeFile(QDir(temp.path()).filePath("KOTOR II.entitlements"));
        writeFile(QDir(temp.path()).filePath("override/ios_mfi_eng.tga"));
        QCOMPARE(identifyGame(temp.path()), GAME_K2_IOS);
    }

    void tieIsUndetermined()
    {
        QTemporaryDir temp;
        writeFile(QDir(temp.path()).filePath("swkotor.exe"));
        writeFile(QDir(temp.path()).filePath("swkotor2.exe"));
        QCOMPARE(identifyGame(temp.path()), GAME_UNKNOWN);
    }

    void emptyIsUndetermined()
    {
        QTemporaryDir temp;
        makeDir(temp.path(), "modules");
        QCOMPARE(identifyGame(temp.path()), GAME_UNKNOWN);

        Installation inst(temp.path());
        QVERIFY_EXCEPTION_THROWN(inst.game(), Installation::UndeterminedGameError);
    }

    void checklists()
    {
        QVERIFY(gameChecklist(GAME_K1).contains("swkotor.exe"));
        QVERIFY(gameChecklist(GAME_K1_XBOX).isEmpty());
        QVERIFY(gameChecklist(GAME_UNKNOWN).isEmpty());
    }
};

QTEST_APPLESS_MAIN(TestGame)
#include "main.moc"
