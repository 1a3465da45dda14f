/**
 * @file main.cpp
 * Tests for talk tables and localized strings.
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

#include <holocron/talktable.h>

#include <QDir>
#include <QTemporaryDir>
#include <QtTest>

using namespace holocron;
using namespace fixtures;

class TestTalkTable : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir _temp;
    QString _path;

private slots:
    void initTestCase()
    {
        QVERIFY(_temp.isValid());
        _path = QDir(_temp.path()).filePath("dialog.tlk");
        writeFile(_path, tlkBytes(QStringList() << "Bad Strref" << "" << "Hello there.", 0));
    }

    void readStrings()
    {
        TalkTable tlk(_path);
        QCOMPARE(tlk.size(), 3);
        QCOMPARE(tlk.language(), 0);
        QCOMPARE(tlk.string(0), QString("Bad Strref"));
        QCOMPARE(tlk.string(2), QString("Hello there."));

        // Entry without text.
        QVERIFY(tlk.contains(1));
        QCOMPARE(tlk.string(1), QString());

        // Out of range.
        QVERIFY(!tlk.contains(3));
        QVERIFY(!tlk.contains(-1));
        QCOMPARE(tlk.string(3), QString());
    }

    void codePages()
    {
        QString const western = QDir(_temp.path()).filePath("western.tlk");
        writeFile(western, tlkBytes(QStringList()
                                    << QString(QChar(0x93)) + "Wait" + QChar(0x85) + QChar(0x94), 0));
        TalkTable tlk(western);
        QCOMPARE(tlk.string(0), QString(QChar(0x201c)) + "Wait" + QChar(0x2026) + QChar(0x201d));

        // Polish uses the Central European page.
        QString const polish = QDir(_temp.path()).filePath("polish.tlk");
        writeFile(polish, tlkBytes(QStringList() << QString(QChar(0xb9)), 5));
        TalkTable pl(polish);
        QCOMPARE(pl.language(), 5);
        QCOMPARE(pl.string(0), QString(QChar(0x0105)));
    }

    void batch()
    {
        TalkTable tlk(_path);
        QMap<int, QString> texts = tlk.strings(QList<int>() << 2 << 0 << 7);
        QCOMPARE(texts.size(), 3);
        QCOMPARE(texts.value(2), QString("Hello there."));
        QCOMPARE(texts.value(0), QString("Bad Strref"));
        QVERIFY(texts.value(7).isEmpty());
    }

    void malformed()
    {
        QString const bogus = QDir(_temp.path()).filePath("bogus.tlk");
        writeFile(bogus, "TLK V2.0 nope");
        QVERIFY_EXCEPTION_THROWN(TalkTable tlk(bogus), TalkTable::FormatError);

        // The entry table must fit in the file.
        QByteArray bytes = tlkBytes(QStringList() << "a" << "b");
        writeFile(bogus, bytes.left(40));
        QVERIFY_EXCEPTION_THROWN(TalkTable tlk(bogus), TalkTable::FormatError);
    }

    void localizedString()
    {
        LocalizedString str(12);
        QCOMPARE(str.stringRef(), 12);
        QVERIFY(!str.hasSubstrings());
        QCOMPARE(str.firstSubstring(), QString());

        str.setSubstring(2, LocalizedString::Female, "Bonjour");
        str.setSubstring(0, LocalizedString::Male, "Hello");
        QCOMPARE(str.substring(2, LocalizedString::Female), QString("Bonjour"));
        QCOMPARE(str.firstSubstring(), QString("Hello"));
    }
};

QTEST_APPLESS_MAIN(TestTalkTable)
#include "main.moc"
