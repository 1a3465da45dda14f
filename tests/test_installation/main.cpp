/**
 * @file main.cpp
 * Tests for locating and reading resources of an installation.
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

#include <holocron/installation.h>
#include <holocron/logbuffer.h>

#include <QDir>
#include <QFile>
#include <QScopedPointer>
#include <QSet>
#include <QTemporaryDir>
#include <QtTest>

using namespace holocron;
using namespace fixtures;

/// Prefixes sound data so that the tests can see the fixup was applied.
class MarkingFixup : public ISoundFixup
{
public:
    int calls;

    MarkingFixup() : calls(0) {}

    QByteArray fixSound(ResourceIdentifier const &, QByteArray const &data)
    {
        calls++;
        return QByteArray("fixed:") + data;
    }
};

static QSet<FileResource> toSet(FileResources const &list)
{
    return QSet<FileResource>::fromList(list);
}

class TestInstallation : public QObject
{
    Q_OBJECT

private:
    QScopedPointer<QTemporaryDir> _temp;

    QString root() const { return _temp->path(); }
    QString file(QString const &rel) const { return QDir(root()).filePath(rel); }

private slots:
    void initTestCase()
    {
        LogBuffer::appBuffer().enableStandardOutput(false);
    }

    /// Each test gets a fresh installation of the first title whose key
    /// file defines c_bantha.utc.
    void init()
    {
        _temp.reset(new QTemporaryDir);
        QVERIFY(_temp->isValid());

        makeK1Installation(root());
        writeChitin(root(), Blobs()
                    << Blob("data/templates.bif", Members()
                            << Member("c_bantha", ResourceType::UTC, "chitin bantha")
                            << Member("tex2", ResourceType::TGA, "chitin tex2")));
        makeDir(root(), "override");
    }

    void cleanup()
    {
        _temp.reset();
    }

    void rootMustExist()
    {
        QVERIFY_EXCEPTION_THROWN(Installation inst(file("nonexistent")), Installation::NotFoundError);
    }

    void modulesDirectoryIsRequired()
    {
        QTemporaryDir bare;
        QVERIFY_EXCEPTION_THROWN(Installation inst(bare.path()), Installation::MissingLocationError);

        // Removed after construction.
        Installation inst(root());
        QDir(root()).rmdir("modules");
        QVERIFY_EXCEPTION_THROWN(inst.reloadModules(), Installation::MissingLocationError);
    }

    void paths()
    {
        makeDir(root(), "Lips");
        Installation inst(root());
        QCOMPARE(inst.overridePath(), file("override"));
        QCOMPARE(inst.lipsPath(), file("Lips"));
        QCOMPARE(inst.chitinPath(), file("chitin.key"));
        QCOMPARE(inst.streamVoicePath(), file("streamwaves"));

        // Missing directories still have a path.
        QCOMPARE(inst.rimsPath(), file("rims"));
    }

    void archiveIndexScenario()
    {
        Installation inst(root());

        ResourceResult res = inst.resource("c_bantha", ResourceType::UTC);
        QVERIFY(!res.isNull());
        QCOMPARE(res.data(), QByteArray("chitin bantha"));
        QCOMPARE(res.path(), file("data/templates.bif"));

        res = inst.resource("c_bantha", ResourceType::UTC, SearchOrder() << SL_OVERRIDE);
        QVERIFY(res.isNull());
    }

    void orderRespectingLocations()
    {
        writeFile(file("override/C_Bantha.utc"), "override bantha");
        Installation inst(root());

        LocationResults found = inst.location("c_bantha", ResourceType::UTC,
                                              SearchOrder() << SL_OVERRIDE << SL_CHITIN);
        QCOMPARE(found.size(), 2);
        QCOMPARE(found.at(0).location, SL_OVERRIDE);
        QVERIFY(found.at(0).path().startsWith(inst.overridePath()));
        QCOMPARE(found.at(1).location, SL_CHITIN);

        found = inst.location("c_bantha", ResourceType::UTC, SearchOrder() << SL_CHITIN << SL_OVERRIDE);
        QCOMPARE(found.at(0).location, SL_CHITIN);
        QCOMPARE(found.at(1).location, SL_OVERRIDE);
    }

    void firstWins()
    {
        writeFile(file("override/c_bantha.utc"), "override bantha");
        Installation inst(root());

        QFile direct(file("override/c_bantha.utc"));
        QVERIFY(direct.open(QFile::ReadOnly));

        ResourceResult const res = inst.resource("C_BANTHA", ResourceType::UTC,
                                                 SearchOrder() << SL_OVERRIDE << SL_CHITIN);
        QCOMPARE(res.data(), direct.readAll());
    }

    void absentIsNotAnError()
    {
        Installation inst(root());

        LocationsMap found = inst.locations(ResourceIdentifiers()
                                            << ResourceIdentifier("nothing", ResourceType::UTC)
                                            << ResourceIdentifier("c_bantha", ResourceType::UTC));
        QCOMPARE(found.size(), 2);
        QVERIFY(found.value(ResourceIdentifier("nothing", ResourceType::UTC)).isEmpty());
        QCOMPARE(found.value(ResourceIdentifier("c_bantha", ResourceType::UTC)).size(), 1);

        ResourcesMap res = inst.resources(ResourceIdentifiers()
                                          << ResourceIdentifier("nothing", ResourceType::UTC));
        QVERIFY(res.contains(ResourceIdentifier("nothing", ResourceType::UTC)));
        QVERIFY(res.value(ResourceIdentifier("nothing", ResourceType::UTC)).isNull());
    }

    void duplicateCategoryIsSearchedOnce()
    {
        Installation inst(root());
        LocationResults found = inst.location("c_bantha", ResourceType::UTC,
                                              SearchOrder() << SL_CHITIN << SL_OVERRIDE << SL_CHITIN);
        QCOMPARE(found.size(), 1);
    }

    void emptyOrderSearchesNothing()
    {
        Installation inst(root());
        QVERIFY(inst.location("c_bantha", ResourceType::UTC, SearchOrder()).isEmpty());
        QVERIFY(!inst.isLoaded(SL_CHITIN));
    }

    void overrideSubdirectories()
    {
        writeFile(file("override/patch1/x.utc"), "patched x");
        writeFile(file("override/top.uti"), "top");
        writeFile(file("override/notes.xyz"), "ignored");

        Installation inst(root());
        inst.reloadOverride();

        QVERIFY(inst.overrideList().contains("patch1"));
        FileResources const sub = inst.overrideResources("patch1");
        QCOMPARE(sub.size(), 1);
        QCOMPARE(sub.first().identifier(), ResourceIdentifier("x", ResourceType::UTC));

        // Each directory lists its own files only.
        FileResources const top = inst.overrideResources("");
        QCOMPARE(top.size(), 1);
        QCOMPARE(top.first().resName(), QString("top"));

        QCOMPARE(inst.resource("x", ResourceType::UTC).data(), QByteArray("patched x"));
    }

    void cachesLoadLazily()
    {
        Installation inst(root());
        QVERIFY(!inst.isLoaded(SL_OVERRIDE));
        QVERIFY(!inst.isLoaded(SL_CHITIN));

        inst.location("c_bantha", ResourceType::UTC, SearchOrder() << SL_OVERRIDE);
        QVERIFY(inst.isLoaded(SL_OVERRIDE));
        QVERIFY(!inst.isLoaded(SL_CHITIN));

        // An empty directory is still a loaded cache.
        QVERIFY(inst.overrideResources(".").isEmpty());
        QVERIFY(inst.isLoaded(SL_OVERRIDE));

        // Missing optional directories load as empty.
        QVERIFY(inst.rimsList().isEmpty());
        QVERIFY(inst.isLoaded(SL_RIMS));

        inst.clearCaches();
        QVERIFY(!inst.isLoaded(SL_OVERRIDE));
        QVERIFY(!inst.isLoaded(SL_RIMS));
    }

    void idempotentReload()
    {
        writeFile(file("override/a.utc"), "a");
        writeFile(file("override/sub/b.utc"), "b");
        writeFile(file("modules/m01aa.rim"), rimBytes(Members() << Member("m01aa", ResourceType::ARE, "are")));

        Installation inst(root());

        inst.reloadOverride();
        QStringList const dirs = inst.overrideList();
        QSet<FileResource> const top = toSet(inst.overrideResources("."));
        QSet<FileResource> const sub = toSet(inst.overrideResources("sub"));
        inst.reloadOverride();
        QCOMPARE(inst.overrideList(), dirs);
        QVERIFY(toSet(inst.overrideResources(".")) == top);
        QVERIFY(toSet(inst.overrideResources("sub")) == sub);

        inst.reloadChitin();
        QSet<FileResource> const core = toSet(inst.chitinResources());
        inst.reloadChitin();
        QVERIFY(toSet(inst.chitinResources()) == core);

        inst.reloadModules();
        QStringList const mods = inst.modulesList();
        inst.reloadModules();
        QCOMPARE(inst.modulesList(), mods);
    }

    void reloadSingleOverrideFile()
    {
        Installation inst(root());
        QVERIFY(inst.overrideResources(".").isEmpty());

        writeFile(file("override/new.uti"), "new item");
        inst.reloadOverrideFile("new.uti");
        QCOMPARE(inst.overrideResources(".").size(), 1);
        QCOMPARE(inst.resource("new", ResourceType::UTI).data(), QByteArray("new item"));

        // Replaced in place.
        writeFile(file("override/new.uti"), "changed item");
        inst.reloadOverrideFile(file("override/new.uti"));
        QCOMPARE(inst.overrideResources(".").size(), 1);
        QCOMPARE(inst.resource("new", ResourceType::UTI).data(), QByteArray("changed item"));

        QFile::remove(file("override/new.uti"));
        inst.reloadOverrideFile("new.uti");
        QVERIFY(inst.overrideResources(".").isEmpty());

        // A file in a directory not seen before brings the directory in.
        writeFile(file("override/patch2/y.utc"), "y");
        inst.reloadOverrideFile("patch2/y.utc");
        QVERIFY(inst.overrideList().contains("patch2"));
        QCOMPARE(inst.overrideResources("patch2").size(), 1);

        // Unknown types are not indexed.
        writeFile(file("override/readme.xyz"), "?");
        inst.reloadOverrideFile("readme.xyz");
        QVERIFY(inst.overrideResources(".").isEmpty());
    }

    void reloadRemovedOverrideDirectory()
    {
        writeFile(file("override/patch1/x.utc"), "x");
        writeFile(file("override/patch1/deeper/z.utc"), "z");

        Installation inst(root());
        QCOMPARE(inst.overrideList().size(), 3);

        QVERIFY(QDir(file("override/patch1")).removeRecursively());
        inst.reloadOverride("patch1");
        QCOMPARE(inst.overrideList(), QStringList() << ".");
        QVERIFY(inst.resource("x", ResourceType::UTC).isNull());
    }

    void reloadRefusesPathsOutsideOverride()
    {
        writeFile(file("stray/x.utc"), "stray x");
        writeFile(file("override/a.utc"), "a");

        Installation inst(root());
        QCOMPARE(inst.overrideList(), QStringList() << ".");

        inst.reloadOverrideFile("../stray/x.utc");
        inst.reloadOverrideFile(file("stray/x.utc"));
        inst.reloadOverride("../stray");
        inst.reloadOverride(file("stray"));

        QCOMPARE(inst.overrideList(), QStringList() << ".");
        QCOMPARE(inst.overrideResources(".").size(), 1);
        QVERIFY(inst.resource("x", ResourceType::UTC, SearchOrder() << SL_OVERRIDE).isNull());
    }

    void linkedDirectoriesAreNotFollowed()
    {
        writeFile(file("override/sub/a.utc"), "a");
        writeFile(file("streamwaves/n_bastila/nb_001.wav"), "voice");
        if(!QFile::link(file("override"), file("override/sub/loop")) ||
           !QFile::link(file("streamwaves"), file("streamwaves/n_bastila/loop")))
        {
            QSKIP("Symbolic links are not available.");
        }

        Installation inst(root());
        QCOMPARE(inst.overrideList(), QStringList() << "." << "sub");
        QCOMPARE(inst.resource("a", ResourceType::UTC).data(), QByteArray("a"));
        QCOMPARE(inst.streamVoiceResources().size(), 1);
    }

    void sharedHandlesWithinOneQuery()
    {
        writeFile(file("modules/m01aa.rim"), rimBytes(Members()
                  << Member("m01aa", ResourceType::ARE, "area")
                  << Member("m01aa", ResourceType::GIT, "instances")));

        MemoryLogSink sink;
        LogBuffer::appBuffer().addSink(sink);
        LogBuffer::appBuffer().enable(LogEntry::TRACE);

        Installation inst(root());
        ResourcesMap const res = inst.resources(ResourceIdentifiers()
                                                << ResourceIdentifier("m01aa", ResourceType::ARE)
                                                << ResourceIdentifier("m01aa", ResourceType::GIT),
                                                SearchOrder() << SL_MODULES);

        LogBuffer::appBuffer().enable(LogEntry::MESSAGE);
        LogBuffer::appBuffer().removeSink(sink);

        QCOMPARE(res.value(ResourceIdentifier("m01aa", ResourceType::ARE)).data(), QByteArray("area"));
        QCOMPARE(res.value(ResourceIdentifier("m01aa", ResourceType::GIT)).data(), QByteArray("instances"));

        // Both members were read through one handle.
        QCOMPARE(sink.count(LogEntry::TRACE, "m01aa.rim"), 1);
    }

    void saves()
    {
        writeFile(file("saves/000001 - Game1/savegame.sav"), "sav");
        writeFile(file("saves/000001 - Game1/savenfo.res"), "nfo");
        writeFile(file("saves/000001 - Game1/screen.tga"), "screen");
        writeFile(file("saves/000001 - Game1/notes.xyz"), "ignored");
        writeFile(file("saves/000002 - Game2/savenfo.res"), "nfo 2");

        // Only the second title keeps cloud saves.
        writeFile(file("cloudsaves/76561197960287930/000003 - Cloud/savenfo.res"), "cloud");

        Installation inst(root());
        QVERIFY(!inst.savesLoaded());
        QCOMPARE(inst.saveLocations(), QStringList() << file("saves"));

        QCOMPARE(inst.savesList(), QStringList() << "saves/000001 - Game1" << "saves/000002 - Game2");
        QVERIFY(inst.savesLoaded());
        QCOMPARE(inst.saveResources("saves/000001 - Game1").size(), 3);
        QCOMPARE(inst.saveResources("SAVES/000002 - game2").first().identifier(),
                 ResourceIdentifier("savenfo", ResourceType::RES));

        writeFile(file("saves/000004 - Game4/savenfo.res"), "nfo 4");
        QCOMPARE(inst.savesList().size(), 2);
        inst.reloadSaves();
        QCOMPARE(inst.savesList().size(), 3);

        inst.clearCaches();
        QVERIFY(!inst.savesLoaded());
    }

    void cloudSavesOfSecondTitle()
    {
        QTemporaryDir k2;
        makeK2Installation(k2.path());
        QDir const dir(k2.path());
        writeFile(dir.filePath("saves/000001 - Local/savenfo.res"), "local");
        writeFile(dir.filePath("cloudsaves/76561197960287930/000002 - Cloud/savenfo.res"), "cloud");
        writeFile(dir.filePath("cloudsaves/76561197960287930/000002 - Cloud/savegame.sav"), "sav");

        Installation inst(k2.path());
        QCOMPARE(inst.saveLocations().size(), 2);
        QCOMPARE(inst.savesList(), QStringList()
                 << "saves/000001 - Local"
                 << "cloudsaves/76561197960287930/000002 - Cloud");
        QCOMPARE(inst.saveResources("cloudsaves/76561197960287930/000002 - Cloud").size(), 2);
    }

    void reloadSingleModule()
    {
        Installation inst(root());
        QVERIFY(inst.modulesList().isEmpty());

        writeFile(file("modules/m02aa.mod"), erfBytes("MOD ", Members()
                  << Member("m02aa", ResourceType::GIT, "git")));
        inst.reloadModule("m02aa.mod");
        QCOMPARE(inst.modulesList(), QStringList() << "m02aa.mod");
        QCOMPARE(inst.moduleResources("M02AA.MOD").size(), 1);

        QFile::remove(file("modules/m02aa.mod"));
        inst.reloadModule("m02aa.mod");
        QVERIFY(inst.modulesList().isEmpty());

        // A broken capsule is reported to the caller.
        writeFile(file("modules/broken.mod"), "garbage");
        QVERIFY_EXCEPTION_THROWN(inst.reloadModule("broken.mod"), Capsule::FormatError);
    }

    void brokenCapsulesAreSkippedOnScan()
    {
        writeFile(file("modules/broken.mod"), "garbage");
        writeFile(file("modules/m01aa.rim"), rimBytes(Members() << Member("m01aa", ResourceType::ARE, "are")));

        Installation inst(root());
        QCOMPARE(inst.modulesList(), QStringList() << "m01aa.rim");
        QCOMPARE(inst.resource("m01aa", ResourceType::ARE).data(), QByteArray("are"));
    }

    void otherCapsuleLocations()
    {
        writeFile(file("lips/m01aa_loc.mod"), erfBytes("MOD ", Members()
                  << Member("n_bastila", ResourceType::LIP, "lip")));
        writeFile(file("lips/ignored.erf"), erfBytes("ERF ", Members()
                  << Member("n_other", ResourceType::LIP, "lip")));
        writeFile(file("rims/mainmenu.rim"), rimBytes(Members()
                  << Member("mainmenu", ResourceType::GUI, "gui")));

        Installation inst(root());
        QCOMPARE(inst.lipsList(), QStringList() << "m01aa_loc.mod");
        QCOMPARE(inst.lipResources("m01aa_loc.mod").size(), 1);
        QCOMPARE(inst.rimsList(), QStringList() << "mainmenu.rim");
        QCOMPARE(inst.rimResources("mainmenu.rim").size(), 1);

        QCOMPARE(inst.resource("n_bastila", ResourceType::LIP, SearchOrder() << SL_LIPS).data(),
                 QByteArray("lip"));
        QVERIFY(inst.resource("n_other", ResourceType::LIP, SearchOrder() << SL_LIPS).isNull());
        QCOMPARE(inst.resource("mainmenu", ResourceType::GUI, SearchOrder() << SL_RIMS).data(),
                 QByteArray("gui"));
    }

    void streams()
    {
        writeFile(file("streammusic/mus_theme.wav"), "music");
        writeFile(file("streamwaves/n_bastila/nb_001.wav"), "voice");

        Installation inst(root());
        QCOMPARE(inst.streamMusicResources().size(), 1);

        // Voice is scanned recursively.
        QCOMPARE(inst.streamVoiceResources().size(), 1);
        QCOMPARE(inst.resource("nb_001", ResourceType::WAV, SearchOrder() << SL_VOICE).data(),
                 QByteArray("voice"));
        QVERIFY(inst.resource("nb_001", ResourceType::WAV, SearchOrder() << SL_MUSIC).isNull());
    }

    void patchCapsuleOfFirstTitle()
    {
        writeFile(file("patch.erf"), erfBytes("ERF ", Members()
                  << Member("appearance", ResourceType::TwoDA, "patched")));

        Installation inst(root());
        QCOMPARE(inst.chitinResources().size(), 2);
        QCOMPARE(inst.coreResources().size(), 3);
        QCOMPARE(inst.resource("appearance", ResourceType::TwoDA).data(), QByteArray("patched"));
    }

    void patchCapsuleIgnoredBySecondTitle()
    {
        QTemporaryDir k2;
        makeK2Installation(k2.path());
        writeFile(QDir(k2.path()).filePath("patch.erf"), erfBytes("ERF ", Members()
                  << Member("appearance", ResourceType::TwoDA, "patched")));

        Installation inst(k2.path());
        QCOMPARE(inst.game(), GAME_K2);
        QVERIFY(inst.coreResources().isEmpty());
        QVERIFY(inst.resource("appearance", ResourceType::TwoDA).isNull());
    }

    void customFoldersAndCapsules()
    {
        QTemporaryDir extra;
        writeFile(QDir(extra.path()).filePath("c_bantha.utc"), "folder bantha");
        writeFile(QDir(extra.path()).filePath("custom.erf"), erfBytes("ERF ", Members()
                  << Member("c_bantha", ResourceType::UTC, "capsule bantha")));

        Installation inst(root());
        Capsule custom(QDir(extra.path()).filePath("custom.erf"));

        SearchExtras extras;
        extras.folders << extra.path();
        extras.capsules << &custom;

        LocationResults found = inst.location("c_bantha", ResourceType::UTC, defaultSearchOrder(), extras);
        QCOMPARE(found.size(), 3);
        QCOMPARE(found.at(0).location, SL_CUSTOM_FOLDERS);
        QCOMPARE(found.at(1).location, SL_CUSTOM_MODULES);
        QCOMPARE(found.at(2).location, SL_CHITIN);

        QCOMPARE(inst.resource("c_bantha", ResourceType::UTC, defaultSearchOrder(), extras).data(),
                 QByteArray("folder bantha"));
        QCOMPARE(inst.resource("c_bantha", ResourceType::UTC,
                               SearchOrder() << SL_CUSTOM_MODULES << SL_CHITIN, extras).data(),
                 QByteArray("capsule bantha"));
    }

    void textures()
    {
        writeFile(file("override/tex1.tga"), "override tga");
        writeFile(file("override/tex1.txi"), "mipmap 0");
        writeFile(file("texturepacks/swpc_tex_tpa.erf"), erfBytes("ERF ", Members()
                  << Member("tex1", ResourceType::TPC, "pack tpc 1")
                  << Member("tex3", ResourceType::TPC, "pack tpc 3")));

        Installation inst(root());
        QCOMPARE(inst.texturePacksList(), QStringList() << "swpc_tex_tpa.erf");

        TextureResult tex = inst.texture("TEX1");
        QVERIFY(!tex.isNull());
        QCOMPARE(tex.format(), ResourceType(ResourceType::TGA));
        QCOMPARE(tex.location(), SL_OVERRIDE);
        QCOMPARE(tex.data(), QByteArray("override tga"));
        QVERIFY(tex.hasTxi());
        QCOMPARE(tex.txi(), QByteArray("mipmap 0"));

        // The pack outranks the override directory here.
        tex = inst.texture("tex1", SearchOrder() << SL_TEXTURES_TPA << SL_OVERRIDE);
        QCOMPARE(tex.format(), ResourceType(ResourceType::TPC));
        QVERIFY(!tex.hasTxi());

        TexturesMap all = inst.textures(QStringList() << "tex2" << "tex3" << "missing");
        QCOMPARE(all.size(), 3);
        QCOMPARE(all.value("tex2").location(), SL_CHITIN);
        QCOMPARE(all.value("tex3").data(), QByteArray("pack tpc 3"));
        QVERIFY(all.value("missing").isNull());
    }

    void txiFromOtherDirectoryIsNotAttached()
    {
        writeFile(file("override/tex1.tga"), "override tga");
        writeFile(file("override/patch1/tex1.txi"), "mipmap 0");
        writeFile(file("override/patch2/tex4.tga"), "tga 4");
        writeFile(file("override/patch2/tex4.txi"), "blending additive");

        Installation inst(root());
        TextureResult tex = inst.texture("tex1");
        QCOMPARE(tex.data(), QByteArray("override tga"));
        QVERIFY(!tex.hasTxi());

        tex = inst.texture("tex4");
        QCOMPARE(tex.txi(), QByteArray("blending additive"));
    }

    void sounds()
    {
        writeFile(file("streamsounds/hello.wav"), "wave");
        writeFile(file("override/bye.mp3"), "mpeg");

        Installation inst(root());
        QCOMPARE(inst.sound("HELLO"), QByteArray("wave"));

        MarkingFixup fixup;
        inst.setSoundFixup(&fixup);

        SoundsMap all = inst.sounds(QStringList() << "hello" << "bye" << "missing");
        QCOMPARE(all.value("hello"), QByteArray("fixed:wave"));
        QCOMPARE(all.value("bye"), QByteArray("fixed:mpeg"));
        QVERIFY(all.value("missing").isEmpty());
        QCOMPARE(fixup.calls, 2);

        inst.setSoundFixup(0);
    }

    void strings()
    {
        writeFile(file("dialog.tlk"), tlkBytes(QStringList() << "Bad Strref" << "Hello"));
        writeFile(file("dialogf.tlk"), tlkBytes(QStringList() << "" << "" << "Female only"));

        Installation inst(root());
        QVERIFY(inst.talkTable());
        QVERIFY(inst.femaleTalkTable());

        QCOMPARE(inst.string(LocalizedString(1)), QString("Hello"));
        QCOMPARE(inst.string(LocalizedString(2)), QString("Female only"));

        LocalizedString withText(99);
        withText.setSubstring(0, LocalizedString::Male, "Inline");
        QCOMPARE(inst.string(withText), QString("Inline"));
        QCOMPARE(inst.string(LocalizedString(), "default"), QString("default"));

        QStringList texts = inst.strings(QList<LocalizedString>()
                                         << LocalizedString(0) << LocalizedString(42), "-");
        QCOMPARE(texts, QStringList() << "Bad Strref" << "-");
    }

    void missingTalkTable()
    {
        writeFile(file("dialogf.tlk"), "not a talk table");

        Installation inst(root());
        QVERIFY(!inst.talkTable());
        QVERIFY(!inst.femaleTalkTable());
        QCOMPARE(inst.string(LocalizedString(0), "default"), QString("default"));
    }
};

QTEST_APPLESS_MAIN(TestInstallation)
#include "main.moc"
