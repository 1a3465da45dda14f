/**
 * @file installation.cpp
 * Read-only resource store of one game installation. @ingroup resource
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

#include "holocron/installation.h"
#include "holocron/chitin.h"
#include "holocron/fs_util.h"
#include "holocron/log.h"
#include "holocron/module.h"
#include "holocron/resourcecache.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QScopedPointer>
#include <QSet>

namespace holocron {

static char const *OVERRIDE_DIR     = "override";
static char const *MODULES_DIR      = "modules";
static char const *LIPS_DIR         = "lips";
static char const *TEXTUREPACKS_DIR = "texturepacks";
static char const *RIMS_DIR         = "rims";
static char const *STREAMMUSIC_DIR  = "streammusic";
static char const *STREAMSOUNDS_DIR = "streamsounds";
static char const *STREAMWAVES_DIR  = "streamwaves";
static char const *STREAMVOICE_DIR  = "streamvoice";
static char const *SAVES_DIR        = "saves";
static char const *CLOUDSAVES_DIR   = "cloudsaves";
static char const *PATCH_FILE       = "patch.erf";
static char const *TALKTABLE_FILE   = "dialog.tlk";
static char const *FEMALE_TALKTABLE_FILE = "dialogf.tlk";

typedef QSet<ResourceIdentifier> IdentifierSet;

/**
 * Backing files opened during one query, keyed by path. Every handle is
 * closed when the set is destroyed.
 */
class FileHandles
{
    HOLOCRON_NO_COPY  (FileHandles)
    HOLOCRON_NO_ASSIGN(FileHandles)

public:
    FileHandles() {}
    ~FileHandles() { qDeleteAll(_files); }

    /**
     * @throws FileResource::ReadError  The file could not be opened.
     */
    QFile &file(QString const &path)
    {
        QFile *found = _files.value(path);
        if(found) return *found;

        LOG_AS("FileHandles");

        QScopedPointer<QFile> opened(new QFile(path));
        if(!opened->open(QFile::ReadOnly))
        {
            throw FileResource::ReadError("FileHandles::file", QString("Failed to open \"%1\": %2")
                                              .arg(path).arg(opened->errorString()));
        }
        LOG_TRACE("Opened \"%s\".") << F_PrettyPath(path);
        found = opened.take();
        _files.insert(path, found);
        return *found;
    }

    QByteArray read(FileResource const &res)
    {
        return res.data(file(res.path()));
    }

private:
    QHash<QString, QFile *> _files;
};

/**
 * Chooses between the first locations of two alias types. The one from the
 * earlier category of @a order wins; @a preferred wins within a category.
 *
 * @return Winning location, or @c NULL if both lists are empty.
 */
static LocationResult const *earliestOf(LocationResults const &preferred,
                                        LocationResults const &alternative,
                                        SearchOrder const &order)
{
    if(preferred.isEmpty())
    {
        return alternative.isEmpty()? 0 : &alternative.first();
    }
    if(alternative.isEmpty()) return &preferred.first();

    if(order.indexOf(alternative.first().location) < order.indexOf(preferred.first().location))
    {
        return &alternative.first();
    }
    return &preferred.first();
}

/**
 * Resource list a location belongs to: the directory of a loose file, the
 * capsule of a capsule member. The key index is one list.
 */
static QString containerOf(LocationResult const &loc)
{
    if(loc.location == SL_CHITIN) return "";

    QString const &path = loc.resource.path();
    if(ResourceIdentifier::fromPath(path) == loc.resource.identifier())
    {
        return QFileInfo(path).absolutePath();
    }
    return path;
}

/// @return @c true if @a rel leaves the directory it is relative to.
static bool isOutside(QString const &rel)
{
    return rel == ".." || rel.startsWith("../") || QDir::isAbsolutePath(rel);
}

static QString normalizedDirectory(QString const &directory)
{
    QString dir = QDir::cleanPath(QString(directory).replace('\\', '/'));
    while(dir.startsWith("./")) dir.remove(0, 2);
    if(dir.isEmpty() || dir == "/") return ".";
    return dir;
}

HOLOCRON_PIMPL(Installation)
{
    QString path;

    /// Memoized result of identifyGame().
    Game game;
    bool gameKnown;

    LoadableCache<FileResources> chitin;
    LoadableCache<FileResources> patch; ///< Loaded along with chitin.
    LoadableCache<FileResourceMap> modules;
    LoadableCache<FileResourceMap> lips;
    LoadableCache<FileResourceMap> texturePacks;
    LoadableCache<FileResourceMap> rims;
    LoadableCache<FileResourceMap> overrides;
    LoadableCache<FileResources> streamMusic;
    LoadableCache<FileResources> streamSounds;
    LoadableCache<FileResources> streamVoice;

    /// Save folder (relative to the root) => its files.
    LoadableCache<FileResourceMap> saves;

    bool talkTablesLoaded;
    QScopedPointer<TalkTable> talkTable;
    QScopedPointer<TalkTable> femaleTalkTable;

    ISoundFixup *soundFixup;

    Instance(Public *i, QString const &rootPath)
        : Base(i),
          path(rootPath),
          game(GAME_UNKNOWN),
          gameKnown(false),
          talkTablesLoaded(false),
          soundFixup(0)
    {}

    /// Path of a root-level entry, matched case-insensitively.
    QString entryPath(char const *name, EntryKind kind) const
    {
        QString found = F_FindCaseInsensitive(path, name, kind);
        if(found.isEmpty()) return QDir(path).filePath(name);
        return found;
    }

    FileResourceMap loadCapsules(QString const &dir, bool (*accept)(QString const &))
    {
        LOG_AS("Installation");

        FileResourceMap map;
        if(!F_DirExists(dir))
        {
            LOG_VERBOSE("\"%s\" does not exist, skipping.") << F_PrettyPath(dir);
            return map;
        }

        foreach(QString const &filePath, F_ListFiles(dir))
        {
            QString const fileName = QFileInfo(filePath).fileName();
            if(!accept(fileName)) continue;

            try
            {
                Capsule capsule(filePath);
                map.insert(fileName, capsule.resources());
            }
            catch(Error const &er)
            {
                LOG_WARNING("Skipping \"%s\": %s") << F_PrettyPath(filePath) << er.asText();
            }
        }

        LOG_VERBOSE("Loaded %i capsules from \"%s\".") << map.size() << F_PrettyPath(dir);
        return map;
    }

    FileResources loadLooseFiles(QString const &dir, bool recursive)
    {
        LOG_AS("Installation");

        FileResources list;
        if(!F_DirExists(dir))
        {
            LOG_VERBOSE("\"%s\" does not exist, skipping.") << F_PrettyPath(dir);
            return list;
        }

        foreach(QString const &filePath, F_ListFiles(dir, recursive))
        {
            ResourceIdentifier const id = ResourceIdentifier::fromPath(filePath);
            if(!id.isValid())
            {
                LOG_DEBUG("Ignoring \"%s\" (unknown resource type).") << F_PrettyPath(filePath);
                continue;
            }
            list << FileResource(id, filePath, 0, duint64(QFileInfo(filePath).size()));
        }

        LOG_VERBOSE("Loaded %i files from \"%s\".") << list.size() << F_PrettyPath(dir);
        return list;
    }

    void loadChitin(bool force = false)
    {
        if(chitin.isLoaded() && !force) return;

        LOG_AS("Installation");

        FileResources indexed;
        QString const keyPath = self.chitinPath();
        if(F_FileExists(keyPath))
        {
            Chitin key(keyPath, path);
            indexed = key.resources();
        }
        else
        {
            LOG_WARNING("No key file found in \"%s\".") << F_PrettyPath(path);
        }

        FileResources patched;
        QString const patchPath = F_FindCaseInsensitive(path, PATCH_FILE, FileEntry);
        if(!patchPath.isEmpty() && isK1(self.game()))
        {
            try
            {
                patched = Capsule(patchPath).resources();
            }
            catch(Error const &er)
            {
                LOG_WARNING("Skipping \"%s\": %s") << F_PrettyPath(patchPath) << er.asText();
            }
        }

        chitin.set(indexed);
        patch.set(patched);
    }

    void loadModules(bool force = false)
    {
        if(modules.isLoaded() && !force) return;

        QString const dir = self.modulesPath();
        if(!F_DirExists(dir))
        {
            throw MissingLocationError("Installation::loadModules",
                                       QString("Modules directory \"%1\" not found").arg(F_PrettyPath(dir)));
        }
        modules.set(loadCapsules(dir, Capsule::isCapsuleFileName));
    }

    void loadLips(bool force = false)
    {
        if(lips.isLoaded() && !force) return;
        lips.set(loadCapsules(self.lipsPath(), Capsule::isModFileName));
    }

    void loadTexturePacks(bool force = false)
    {
        if(texturePacks.isLoaded() && !force) return;
        texturePacks.set(loadCapsules(self.texturePacksPath(), Capsule::isErfFileName));
    }

    void loadRims(bool force = false)
    {
        if(rims.isLoaded() && !force) return;
        rims.set(loadCapsules(self.rimsPath(), Capsule::isRimFileName));
    }

    /**
     * Scans the override directory and each of its subdirectories. Each
     * directory is indexed with its own direct files only.
     */
    void loadOverride(bool force = false)
    {
        if(overrides.isLoaded() && !force) return;

        FileResourceMap map;
        QString const dir = self.overridePath();
        if(F_DirExists(dir))
        {
            map.insert(".", loadLooseFiles(dir, false));
            foreach(QString const &sub, F_ListSubdirectories(dir))
            {
                map.insert(sub, loadLooseFiles(QDir(dir).filePath(sub), false));
            }
        }
        else
        {
            LOG_AS("Installation");
            LOG_VERBOSE("\"%s\" does not exist, skipping.") << F_PrettyPath(dir);
        }
        overrides.set(map);
    }

    void loadStreamMusic(bool force = false)
    {
        if(streamMusic.isLoaded() && !force) return;
        streamMusic.set(loadLooseFiles(self.streamMusicPath(), false));
    }

    void loadStreamSounds(bool force = false)
    {
        if(streamSounds.isLoaded() && !force) return;
        streamSounds.set(loadLooseFiles(self.streamSoundsPath(), false));
    }

    void loadStreamVoice(bool force = false)
    {
        if(streamVoice.isLoaded() && !force) return;

        QString const dir = self.streamVoicePath();
        if(dir.isEmpty())
        {
            streamVoice.set(FileResources());
            return;
        }
        streamVoice.set(loadLooseFiles(dir, true));
    }

    void loadSaves(bool force = false)
    {
        if(saves.isLoaded() && !force) return;

        LOG_AS("Installation");

        FileResourceMap map;
        foreach(QString const &location, self.saveLocations())
        {
            foreach(QFileInfo const &folder, QDir(location).entryInfoList(
                        QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks, QDir::Name | QDir::IgnoreCase))
            {
                map.insert(F_RelativePath(path, folder.filePath()), loadLooseFiles(folder.filePath(), false));
            }
        }

        LOG_VERBOSE("Found %i save folders.") << map.size();
        saves.set(map);
    }

    void loadTalkTables()
    {
        if(talkTablesLoaded) return;

        talkTable.reset(openTalkTable(self.talkTablePath()));
        femaleTalkTable.reset(openTalkTable(self.femaleTalkTablePath()));
        talkTablesLoaded = true;
    }

    static TalkTable *openTalkTable(QString const &tlkPath)
    {
        LOG_AS("Installation");

        if(!F_FileExists(tlkPath))
        {
            LOG_DEBUG("No talk table at \"%s\".") << F_PrettyPath(tlkPath);
            return 0;
        }
        try
        {
            return new TalkTable(tlkPath);
        }
        catch(TalkTable::FormatError const &er)
        {
            LOG_WARNING("Ignoring talk table: %s") << er.asText();
        }
        return 0;
    }

    /// Drops repeated categories, keeping the first position of each.
    static SearchOrder uniqueOrder(SearchOrder const &order)
    {
        LOG_AS("Installation");

        SearchOrder unique;
        foreach(SearchLocation loc, order)
        {
            if(unique.contains(loc))
            {
                LOG_DEBUG("Category \"%s\" is listed more than once, searching it only once.")
                        << searchLocationName(loc);
                continue;
            }
            unique << loc;
        }
        return unique;
    }

    static void matchList(FileResources const &list, SearchLocation loc,
                          IdentifierSet const &wanted, LocationsMap &found)
    {
        foreach(FileResource const &res, list)
        {
            if(!wanted.contains(res.identifier())) continue;
            found[res.identifier()].append(LocationResult(loc, res));
        }
    }

    static void matchMap(FileResourceMap const &map, SearchLocation loc,
                         IdentifierSet const &wanted, LocationsMap &found)
    {
        for(int i = 0; i < map.size(); ++i)
        {
            matchList(map.at(i), loc, wanted, found);
        }
    }

    /**
     * Searches the module capsules. When several capsules of one module
     * contain the same resource, only the one with the best ModuleForm is
     * reported; capsules of equal form keep the one scanned first.
     */
    void matchModules(IdentifierSet const &wanted, QString const &rootFilter, LocationsMap &found)
    {
        LOG_AS("Installation");

        struct ModuleMatch {
            QString root;
            ModuleForm form;
            FileResource resource;
        };
        typedef QList<ModuleMatch> ModuleMatches;
        typedef QHash<ResourceIdentifier, ModuleMatches> Matches;
        Matches matches;

        QString const filter = rootFilter.toLower();
        FileResourceMap const &map = modules.data();
        for(int i = 0; i < map.size(); ++i)
        {
            QString const &fileName = map.keyAt(i);
            QString const root = moduleRoot(fileName);
            if(!filter.isEmpty() && root != filter) continue;

            ModuleForm const form = moduleForm(fileName);
            foreach(FileResource const &res, map.at(i))
            {
                if(!wanted.contains(res.identifier())) continue;

                ModuleMatches &candidates = matches[res.identifier()];
                bool grouped = false;
                for(int k = 0; k < candidates.size(); ++k)
                {
                    ModuleMatch &other = candidates[k];
                    if(other.root != root) continue;

                    grouped = true;
                    if(form < other.form)
                    {
                        other.form = form;
                        other.resource = res;
                    }
                    else if(form == other.form)
                    {
                        LOG_DEBUG("\"%s\" and \"%s\" both provide \"%s\" as %s, keeping the former.")
                                << QFileInfo(other.resource.path()).fileName() << fileName
                                << res.identifier().fileName() << moduleFormName(form);
                    }
                    break;
                }
                if(!grouped)
                {
                    ModuleMatch match;
                    match.root = root;
                    match.form = form;
                    match.resource = res;
                    candidates.append(match);
                }
            }
        }

        HOLOCRON_FOR_EACH_CONST(Matches, i, matches)
        {
            foreach(ModuleMatch const &match, i.value())
            {
                found[i.key()].append(LocationResult(SL_MODULES, match.resource));
            }
        }
    }

    static void matchCapsules(Capsules const &capsules, IdentifierSet const &wanted, LocationsMap &found)
    {
        foreach(Capsule const *capsule, capsules)
        {
            if(!capsule) continue;
            foreach(ResourceIdentifier const &id, wanted)
            {
                if(!capsule->contains(id)) continue;
                found[id].append(LocationResult(SL_CUSTOM_MODULES, capsule->info(id)));
            }
        }
    }

    static void matchFolders(QStringList const &folders, IdentifierSet const &wanted, LocationsMap &found)
    {
        LOG_AS("Installation");

        foreach(QString const &folder, folders)
        {
            if(!F_DirExists(folder))
            {
                LOG_DEBUG("Folder \"%s\" does not exist.") << F_PrettyPath(folder);
                continue;
            }
            foreach(QString const &filePath, F_ListFiles(folder))
            {
                ResourceIdentifier const id = ResourceIdentifier::fromPath(filePath);
                if(!wanted.contains(id)) continue;

                FileResource const res(id, filePath, 0, duint64(QFileInfo(filePath).size()));
                found[id].append(LocationResult(SL_CUSTOM_FOLDERS, res));
            }
        }
    }

    /// Searches one category, loading its cache first if needed.
    void search(SearchLocation loc, IdentifierSet const &wanted, SearchExtras const &extras,
                LocationsMap &found)
    {
        switch(loc)
        {
        case SL_OVERRIDE:
            loadOverride();
            matchMap(overrides.data(), loc, wanted, found);
            break;

        case SL_MODULES:
            loadModules();
            matchModules(wanted, extras.moduleRoot, found);
            break;

        case SL_CHITIN:
            loadChitin();
            matchList(chitin.data(), loc, wanted, found);
            matchList(patch.data(), loc, wanted, found);
            break;

        case SL_TEXTURES_TPA:
        case SL_TEXTURES_TPB:
        case SL_TEXTURES_TPC:
        case SL_TEXTURES_GUI:
            loadTexturePacks();
            matchList(texturePacks.data().value(texturePackFileName(loc)), loc, wanted, found);
            break;

        case SL_MUSIC:
            loadStreamMusic();
            matchList(streamMusic.data(), loc, wanted, found);
            break;

        case SL_SOUND:
            loadStreamSounds();
            matchList(streamSounds.data(), loc, wanted, found);
            break;

        case SL_VOICE:
            loadStreamVoice();
            matchList(streamVoice.data(), loc, wanted, found);
            break;

        case SL_LIPS:
            loadLips();
            matchMap(lips.data(), loc, wanted, found);
            break;

        case SL_RIMS:
            loadRims();
            matchMap(rims.data(), loc, wanted, found);
            break;

        case SL_CUSTOM_MODULES:
            matchCapsules(extras.capsules, wanted, found);
            break;

        case SL_CUSTOM_FOLDERS:
            matchFolders(extras.folders, wanted, found);
            break;

        case SEARCHLOCATION_COUNT:
            break;
        }
    }

    void explain(int step, SearchLocation loc, QHash<ResourceIdentifier, int> const &before,
                 LocationsMap const &found) const
    {
        LOG_AS("Installation");

        HOLOCRON_FOR_EACH_CONST(LocationsMap, i, found)
        {
            LocationResults const &results = i.value();
            int const first = before.value(i.key());
            if(first == results.size())
            {
                LOG_MSG("%s: %i. %s -> not found") << i.key().fileName() << step << searchLocationName(loc);
                continue;
            }
            for(int k = first; k < results.size(); ++k)
            {
                LOG_MSG("%s: %i. %s -> \"%s\"%s")
                        << i.key().fileName() << step << searchLocationName(loc)
                        << F_RelativePath(path, results.at(k).path())
                        << (!first && k == first? " (selected)" : "");
            }
        }
    }

    void logMiss(ResourceIdentifier const &id) const
    {
        LOG_AS("Installation");

        if(id.type().isTexturePayload())
        {
            LOG_DEBUG("\"%s\" not found.") << id.fileName();
        }
        else
        {
            LOG_WARNING("\"%s\" not found.") << id.fileName();
        }
    }
};

Installation::Installation(QString const &path)
    : d(new Instance(this, QDir::cleanPath(QFileInfo(path).absoluteFilePath())))
{
    LOG_AS("Installation");

    if(!F_DirExists(d->path))
    {
        throw NotFoundError("Installation::Installation",
                            QString("\"%1\" is not a directory").arg(F_PrettyPath(path)));
    }
    if(F_FindCaseInsensitive(d->path, MODULES_DIR, DirectoryEntry).isEmpty())
    {
        throw MissingLocationError("Installation::Installation",
                                   QString("No modules directory in \"%1\"").arg(F_PrettyPath(d->path)));
    }

    LOG_VERBOSE("Opened installation \"%s\".") << F_PrettyPath(d->path);
}

Installation::~Installation()
{}

QString Installation::path() const
{
    return d->path;
}

QString Installation::overridePath() const
{
    return d->entryPath(OVERRIDE_DIR, DirectoryEntry);
}

QString Installation::modulesPath() const
{
    return d->entryPath(MODULES_DIR, DirectoryEntry);
}

QString Installation::lipsPath() const
{
    return d->entryPath(LIPS_DIR, DirectoryEntry);
}

QString Installation::texturePacksPath() const
{
    return d->entryPath(TEXTUREPACKS_DIR, DirectoryEntry);
}

QString Installation::rimsPath() const
{
    return d->entryPath(RIMS_DIR, DirectoryEntry);
}

QString Installation::streamMusicPath() const
{
    return d->entryPath(STREAMMUSIC_DIR, DirectoryEntry);
}

QString Installation::streamSoundsPath() const
{
    return d->entryPath(STREAMSOUNDS_DIR, DirectoryEntry);
}

QString Installation::streamVoicePath() const
{
    QString const waves = F_FindCaseInsensitive(d->path, STREAMWAVES_DIR, DirectoryEntry);
    QString const voice = F_FindCaseInsensitive(d->path, STREAMVOICE_DIR, DirectoryEntry);

    if(waves.isEmpty()) return voice;
    if(voice.isEmpty()) return waves;

    // Both exist; the game decides.
    return isK1(game())? waves : voice;
}

QString Installation::savesPath() const
{
    return d->entryPath(SAVES_DIR, DirectoryEntry);
}

QStringList Installation::saveLocations() const
{
    QStringList locations;

    QString const saves = F_FindCaseInsensitive(d->path, SAVES_DIR, DirectoryEntry);
    if(!saves.isEmpty()) locations << saves;

    QString const cloud = F_FindCaseInsensitive(d->path, CLOUDSAVES_DIR, DirectoryEntry);
    if(!cloud.isEmpty() && isK2(game()))
    {
        foreach(QFileInfo const &sub, QDir(cloud).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                                 QDir::Name | QDir::IgnoreCase))
        {
            locations << sub.filePath();
        }
    }
    return locations;
}

QString Installation::chitinPath() const
{
    return d->entryPath(Chitin::KEY_FILE_NAME, FileEntry);
}

QString Installation::patchPath() const
{
    return d->entryPath(PATCH_FILE, FileEntry);
}

QString Installation::talkTablePath() const
{
    return d->entryPath(TALKTABLE_FILE, FileEntry);
}

QString Installation::femaleTalkTablePath() const
{
    return d->entryPath(FEMALE_TALKTABLE_FILE, FileEntry);
}

Game Installation::game() const
{
    if(!d->gameKnown)
    {
        Game const found = identifyGame(d->path);
        if(found == GAME_UNKNOWN)
        {
            throw UndeterminedGameError("Installation::game",
                                        QString("Cannot determine the game installed in \"%1\"")
                                            .arg(F_PrettyPath(d->path)));
        }
        d->game = found;
        d->gameKnown = true;

        LOG_AS("Installation");
        LOG_VERBOSE("\"%s\" is %s.") << F_PrettyPath(d->path) << gameName(found);
    }
    return d->game;
}

bool Installation::isLoaded(SearchLocation location) const
{
    switch(location)
    {
    case SL_OVERRIDE:     return d->overrides.isLoaded();
    case SL_MODULES:      return d->modules.isLoaded();
    case SL_CHITIN:       return d->chitin.isLoaded();
    case SL_TEXTURES_TPA:
    case SL_TEXTURES_TPB:
    case SL_TEXTURES_TPC:
    case SL_TEXTURES_GUI: return d->texturePacks.isLoaded();
    case SL_MUSIC:        return d->streamMusic.isLoaded();
    case SL_SOUND:        return d->streamSounds.isLoaded();
    case SL_VOICE:        return d->streamVoice.isLoaded();
    case SL_LIPS:         return d->lips.isLoaded();
    case SL_RIMS:         return d->rims.isLoaded();

    // Caller-supplied categories have no cache.
    case SL_CUSTOM_MODULES:
    case SL_CUSTOM_FOLDERS:
    case SEARCHLOCATION_COUNT:
        break;
    }
    return false;
}

void Installation::reloadChitin()
{
    d->loadChitin(true);
}

void Installation::reloadModules()
{
    d->loadModules(true);
}

void Installation::reloadModule(QString const &fileName)
{
    LOG_AS("Installation");

    d->loadModules();

    QString const name = QFileInfo(fileName).fileName();
    QString const capsulePath = F_FindCaseInsensitive(modulesPath(), name, FileEntry);
    if(capsulePath.isEmpty())
    {
        if(d->modules.data().remove(name))
        {
            LOG_VERBOSE("Module \"%s\" no longer exists.") << name;
        }
        return;
    }

    Capsule capsule(capsulePath);
    d->modules.data().insert(QFileInfo(capsulePath).fileName(), capsule.resources());
}

void Installation::reloadLips()
{
    d->loadLips(true);
}

void Installation::reloadTexturePacks()
{
    d->loadTexturePacks(true);
}

void Installation::reloadRims()
{
    d->loadRims(true);
}

void Installation::reloadOverride(QString const &directory)
{
    LOG_AS("Installation");

    QString const rel = normalizedDirectory(directory);
    if(!directory.isEmpty() && isOutside(rel))
    {
        LOG_WARNING("Cannot reload \"%s\": not in the override directory.") << directory;
        return;
    }

    if(directory.isEmpty() || !d->overrides.isLoaded())
    {
        d->loadOverride(true);
        return;
    }

    QString const base = overridePath();
    QString const dirPath = (rel == "."? base : F_ResolveCaseInsensitive(base, rel, DirectoryEntry));

    FileResourceMap &map = d->overrides.data();
    if(!F_DirExists(dirPath))
    {
        // The directory and everything under it is gone.
        foreach(QString const &key, map.keys())
        {
            if(!key.compare(rel, Qt::CaseInsensitive) ||
               key.startsWith(rel + "/", Qt::CaseInsensitive))
            {
                map.remove(key);
            }
        }
        return;
    }
    map.insert(F_RelativePath(base, dirPath), d->loadLooseFiles(dirPath, false));
}

void Installation::reloadOverrideFile(QString const &filePath)
{
    LOG_AS("Installation");

    QString const base = overridePath();
    QFileInfo const info(QFileInfo(filePath).isAbsolute()? filePath : QDir(base).filePath(filePath));

    QString const rel = F_RelativePath(base, QDir::cleanPath(info.absolutePath()));
    if(isOutside(rel))
    {
        LOG_WARNING("Cannot reload \"%s\": not in the override directory.") << F_PrettyPath(info.filePath());
        return;
    }

    if(!d->overrides.isLoaded())
    {
        d->loadOverride();
        return;
    }

    ResourceIdentifier const id = ResourceIdentifier::fromPath(info.fileName());
    if(!id.isValid())
    {
        LOG_WARNING("Cannot reload \"%s\": unknown resource type.") << F_PrettyPath(info.filePath());
        return;
    }

    FileResources *list = d->overrides.data().find(rel);
    if(!list)
    {
        // A directory not seen before.
        reloadOverride(rel);
        return;
    }

    int pos = -1;
    for(int i = 0; i < list->size(); ++i)
    {
        if(list->at(i) == id) { pos = i; break; }
    }

    if(!info.isFile())
    {
        if(pos >= 0) list->removeAt(pos);
        return;
    }

    FileResource const res(id, info.filePath(), 0, duint64(info.size()));
    if(pos >= 0)
    {
        (*list)[pos] = res;
    }
    else
    {
        list->append(res);
    }
}

void Installation::reloadStreamMusic()
{
    d->loadStreamMusic(true);
}

void Installation::reloadStreamSounds()
{
    d->loadStreamSounds(true);
}

void Installation::reloadStreamVoice()
{
    d->loadStreamVoice(true);
}

void Installation::reloadSaves()
{
    d->loadSaves(true);
}

void Installation::reloadAll()
{
    d->loadChitin(true);
    d->loadModules(true);
    d->loadLips(true);
    d->loadTexturePacks(true);
    d->loadRims(true);
    d->loadOverride(true);
    d->loadStreamMusic(true);
    d->loadStreamSounds(true);
    d->loadStreamVoice(true);
    d->loadSaves(true);
}

void Installation::clearCaches()
{
    d->chitin.clear();
    d->patch.clear();
    d->modules.clear();
    d->lips.clear();
    d->texturePacks.clear();
    d->rims.clear();
    d->overrides.clear();
    d->streamMusic.clear();
    d->streamSounds.clear();
    d->streamVoice.clear();
    d->saves.clear();

    d->talkTable.reset();
    d->femaleTalkTable.reset();
    d->talkTablesLoaded = false;
}

FileResources const &Installation::chitinResources()
{
    d->loadChitin();
    return d->chitin.data();
}

FileResources Installation::coreResources()
{
    d->loadChitin();
    return d->chitin.data() + d->patch.data();
}

QStringList Installation::modulesList()
{
    d->loadModules();
    return d->modules.data().keys();
}

FileResources Installation::moduleResources(QString const &fileName)
{
    d->loadModules();
    return d->modules.data().value(fileName);
}

QMap<QString, QStringList> Installation::moduleGroups()
{
    d->loadModules();

    QMap<QString, QStringList> groups;
    foreach(QString const &fileName, d->modules.data().keys())
    {
        groups[moduleRoot(fileName)].append(fileName);
    }
    return groups;
}

QStringList Installation::lipsList()
{
    d->loadLips();
    return d->lips.data().keys();
}

FileResources Installation::lipResources(QString const &fileName)
{
    d->loadLips();
    return d->lips.data().value(fileName);
}

QStringList Installation::texturePacksList()
{
    d->loadTexturePacks();
    return d->texturePacks.data().keys();
}

FileResources Installation::texturePackResources(QString const &fileName)
{
    d->loadTexturePacks();
    return d->texturePacks.data().value(fileName);
}

QStringList Installation::rimsList()
{
    d->loadRims();
    return d->rims.data().keys();
}

FileResources Installation::rimResources(QString const &fileName)
{
    d->loadRims();
    return d->rims.data().value(fileName);
}

QStringList Installation::overrideList()
{
    d->loadOverride();
    return d->overrides.data().keys();
}

FileResources Installation::overrideResources(QString const &directory)
{
    d->loadOverride();
    return d->overrides.data().value(normalizedDirectory(directory));
}

QStringList Installation::savesList()
{
    d->loadSaves();
    return d->saves.data().keys();
}

FileResources Installation::saveResources(QString const &saveFolder)
{
    d->loadSaves();
    return d->saves.data().value(normalizedDirectory(saveFolder));
}

bool Installation::savesLoaded() const
{
    return d->saves.isLoaded();
}

FileResources const &Installation::streamMusicResources()
{
    d->loadStreamMusic();
    return d->streamMusic.data();
}

FileResources const &Installation::streamSoundResources()
{
    d->loadStreamSounds();
    return d->streamSounds.data();
}

FileResources const &Installation::streamVoiceResources()
{
    d->loadStreamVoice();
    return d->streamVoice.data();
}

LocationsMap Installation::locations(ResourceIdentifiers const &queries, SearchOrder const &order,
                                     SearchExtras const &extras)
{
    LocationsMap found;
    IdentifierSet wanted;
    foreach(ResourceIdentifier const &id, queries)
    {
        if(wanted.contains(id)) continue;
        wanted.insert(id);
        found.insert(id, LocationResults());
    }
    if(wanted.isEmpty()) return found;

    int step = 0;
    foreach(SearchLocation loc, Instance::uniqueOrder(order))
    {
        step++;

        QHash<ResourceIdentifier, int> before;
        if(extras.explain)
        {
            HOLOCRON_FOR_EACH_CONST(LocationsMap, i, found)
            {
                before.insert(i.key(), i.value().size());
            }
        }

        d->search(loc, wanted, extras, found);

        if(extras.explain)
        {
            d->explain(step, loc, before, found);
        }
    }
    return found;
}

LocationResults Installation::location(QString const &name, ResourceType type,
                                       SearchOrder const &order, SearchExtras const &extras)
{
    ResourceIdentifier const id(name, type);
    return locations(ResourceIdentifiers() << id, order, extras).value(id);
}

ResourcesMap Installation::resources(ResourceIdentifiers const &queries, SearchOrder const &order,
                                     SearchExtras const &extras)
{
    LocationsMap const found = locations(queries, order, extras);

    ResourcesMap results;
    FileHandles handles;
    HOLOCRON_FOR_EACH_CONST(LocationsMap, i, found)
    {
        if(i.value().isEmpty())
        {
            d->logMiss(i.key());
            results.insert(i.key(), ResourceResult());
            continue;
        }

        // The first location has the highest priority.
        LocationResult const &winner = i.value().first();
        results.insert(i.key(), ResourceResult(winner.resource.identifier(), winner.path(),
                                               handles.read(winner.resource)));
    }
    return results;
}

ResourceResult Installation::resource(QString const &name, ResourceType type,
                                      SearchOrder const &order, SearchExtras const &extras)
{
    ResourceIdentifier const id(name, type);
    return resources(ResourceIdentifiers() << id, order, extras).value(id);
}

TextureResult Installation::texture(QString const &name, SearchOrder const &order,
                                    SearchExtras const &extras)
{
    return textures(QStringList() << name, order, extras).value(name.toCaseFolded());
}

TexturesMap Installation::textures(QStringList const &names, SearchOrder const &order,
                                   SearchExtras const &extras)
{
    LOG_AS("Installation");

    ResourceIdentifiers queries;
    foreach(QString const &name, names)
    {
        queries << ResourceIdentifier(name, ResourceType::TPC)
                << ResourceIdentifier(name, ResourceType::TGA)
                << ResourceIdentifier(name, ResourceType::TXI);
    }
    LocationsMap const found = locations(queries, order, extras);

    TexturesMap results;
    FileHandles handles;
    foreach(QString const &name, names)
    {
        QString const key = name.toCaseFolded();
        if(results.contains(key)) continue;

        LocationResults const tpc = found.value(ResourceIdentifier(name, ResourceType::TPC));
        LocationResults const tga = found.value(ResourceIdentifier(name, ResourceType::TGA));

        LocationResult const *image = earliestOf(tpc, tga, order);
        if(!image)
        {
            LOG_DEBUG("Texture \"%s\" not found.") << name;
            results.insert(key, TextureResult());
            continue;
        }

        QByteArray txi;
        if(image->resource.resType() == ResourceType::TGA)
        {
            foreach(LocationResult const &loc, found.value(ResourceIdentifier(name, ResourceType::TXI)))
            {
                if(loc.location != image->location) continue;
                if(containerOf(loc) != containerOf(*image)) continue;
                txi = handles.read(loc.resource);
                break;
            }
        }

        ResourceResult const data(image->resource.identifier(), image->path(),
                                  handles.read(image->resource));
        results.insert(key, TextureResult(data, image->location, txi));
    }
    return results;
}

QByteArray Installation::sound(QString const &name, SearchOrder const &order,
                               SearchExtras const &extras)
{
    return sounds(QStringList() << name, order, extras).value(name.toCaseFolded());
}

SoundsMap Installation::sounds(QStringList const &names, SearchOrder const &order,
                               SearchExtras const &extras)
{
    LOG_AS("Installation");

    ResourceIdentifiers queries;
    foreach(QString const &name, names)
    {
        queries << ResourceIdentifier(name, ResourceType::WAV)
                << ResourceIdentifier(name, ResourceType::MP3);
    }
    LocationsMap const found = locations(queries, order, extras);

    SoundsMap results;
    FileHandles handles;
    foreach(QString const &name, names)
    {
        QString const key = name.toCaseFolded();
        if(results.contains(key)) continue;

        LocationResults const wav = found.value(ResourceIdentifier(name, ResourceType::WAV));
        LocationResults const mp3 = found.value(ResourceIdentifier(name, ResourceType::MP3));

        LocationResult const *winner = earliestOf(wav, mp3, order);
        if(!winner)
        {
            LOG_WARNING("Sound \"%s\" not found.") << name;
            results.insert(key, QByteArray());
            continue;
        }

        QByteArray data = handles.read(winner->resource);
        if(d->soundFixup)
        {
            data = d->soundFixup->fixSound(winner->resource.identifier(), data);
        }
        results.insert(key, data);
    }
    return results;
}

void Installation::setSoundFixup(ISoundFixup *fixup)
{
    d->soundFixup = fixup;
}

TalkTable const *Installation::talkTable()
{
    d->loadTalkTables();
    return d->talkTable.data();
}

TalkTable const *Installation::femaleTalkTable()
{
    d->loadTalkTables();
    return d->femaleTalkTable.data();
}

QString Installation::string(LocalizedString const &str, QString const &defaultText)
{
    return strings(QList<LocalizedString>() << str, defaultText).first();
}

QStringList Installation::strings(QList<LocalizedString> const &strs, QString const &defaultText)
{
    d->loadTalkTables();

    QList<int> refs;
    foreach(LocalizedString const &str, strs)
    {
        if(str.stringRef() >= 0) refs << str.stringRef();
    }

    QMap<int, QString> primary;
    QMap<int, QString> female;
    if(d->talkTable)       primary = d->talkTable->strings(refs);
    if(d->femaleTalkTable) female  = d->femaleTalkTable->strings(refs);

    QStringList texts;
    foreach(LocalizedString const &str, strs)
    {
        int const ref = str.stringRef();
        if(ref >= 0)
        {
            if(d->talkTable && d->talkTable->contains(ref))
            {
                texts << primary.value(ref);
                continue;
            }
            if(d->femaleTalkTable && d->femaleTalkTable->contains(ref))
            {
                texts << female.value(ref);
                continue;
            }
        }
        texts << (str.hasSubstrings()? str.firstSubstring() : defaultText);
    }
    return texts;
}

} // namespace holocron
