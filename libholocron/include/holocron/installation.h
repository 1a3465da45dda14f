/**
 * @file installation.h
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

#ifndef LIBHOLOCRON_INSTALLATION_H
#define LIBHOLOCRON_INSTALLATION_H

#include "capsule.h"
#include "game.h"
#include "locationresult.h"
#include "searchlocation.h"
#include "talktable.h"

#include <QMap>
#include <QStringList>

namespace holocron {

/**
 * Caller-supplied additions to a single query.
 */
struct HOLOCRON_PUBLIC SearchExtras
{
    /// Searched by the SL_CUSTOM_MODULES category. Not owned.
    Capsules capsules;

    /// Searched (non-recursively) by the SL_CUSTOM_FOLDERS category.
    QStringList folders;

    /// If not empty, SL_MODULES only searches the capsules of this module.
    QString moduleRoot;

    /// Log each category consulted for each identifier.
    bool explain;

    SearchExtras() : explain(false) {}
};

/**
 * Post-processing applied to the bytes of sounds before they are returned
 * by Installation::sound().
 */
class HOLOCRON_PUBLIC ISoundFixup
{
public:
    virtual ~ISoundFixup() {}

    virtual QByteArray fixSound(ResourceIdentifier const &id, QByteArray const &data) = 0;
};

/// Sound bytes keyed by the case-folded sound name. Misses map to an
/// empty array.
typedef QHash<QString, QByteArray> SoundsMap;

/**
 * One game installation viewed as a single case-insensitive content store.
 *
 * The contents of each search location are scanned on first use and kept
 * in a cache that stays valid until it is explicitly reloaded or cleared.
 * A cache is never partially loaded.
 *
 * Queries take the categories to search as an ordered list, highest
 * priority first. A category listed more than once is searched only at its
 * first position. Misses are never errors: missing resources are reported
 * as empty location lists or null results.
 *
 * Installation is not thread-safe. Each instance should be used by a single
 * thread at a time.
 */
class HOLOCRON_PUBLIC Installation
{
public:
    /// The installation root does not exist. @ingroup errors
    HOLOCRON_ERROR(NotFoundError);

    /// A directory required by every installation is missing. @ingroup errors
    HOLOCRON_SUB_ERROR(NotFoundError, MissingLocationError);

    /// The game variant could not be determined but is needed. @ingroup errors
    HOLOCRON_ERROR(UndeterminedGameError);

public:
    /**
     * Opens the installation at @a path. Nothing is scanned yet.
     *
     * @throws NotFoundError         @a path is not a directory.
     * @throws MissingLocationError  The modules directory is missing.
     */
    Installation(QString const &path);
    ~Installation();

    /// Root directory of the installation.
    QString path() const;

    /*
     * Location paths. Directory names are matched case-insensitively; if a
     * directory does not exist the path it would have is returned.
     */
    QString overridePath() const;
    QString modulesPath() const;
    QString lipsPath() const;
    QString texturePacksPath() const;
    QString rimsPath() const;
    QString streamMusicPath() const;
    QString streamSoundsPath() const;

    /**
     * Voice-over directory: "streamwaves" in the first title and
     * "streamvoice" in the second. When only one of the two exists it is
     * used regardless of the game.
     *
     * @return Path of the directory, or an empty string if neither exists.
     *
     * @throws UndeterminedGameError  Both exist and the game is unknown.
     */
    QString streamVoicePath() const;

    QString savesPath() const;

    /**
     * Directories holding save folders: the saves directory and, in the
     * second title, each directory of "cloudsaves". Only existing
     * directories are returned.
     *
     * @throws UndeterminedGameError  "cloudsaves" exists and the game is unknown.
     */
    QStringList saveLocations() const;

    QString chitinPath() const;

    /// Core patch capsule (first title only).
    QString patchPath() const;

    QString talkTablePath() const;
    QString femaleTalkTablePath() const;

    /**
     * Game variant of the installation. Determined with identifyGame() on
     * first call and remembered afterwards.
     *
     * @throws UndeterminedGameError  The probes gave no clear answer.
     */
    Game game() const;

    /// @return @c true if the cache of @a location has been loaded.
    bool isLoaded(SearchLocation location) const;

    //
    // Cache management
    //

    /**
     * Rescans the key file and its blobs, and the core patch capsule.
     *
     * @throws Chitin::FormatError    The key file is malformed.
     * @throws UndeterminedGameError  A patch capsule exists and the game is unknown.
     */
    void reloadChitin();

    /**
     * @throws MissingLocationError  The modules directory no longer exists.
     */
    void reloadModules();

    /**
     * Rescans a single capsule of the modules directory. A capsule that no
     * longer exists is removed from the cache.
     *
     * @param fileName  Name of the capsule, e.g. "m01aa.mod".
     *
     * @throws Capsule::FormatError  The capsule is malformed.
     */
    void reloadModule(QString const &fileName);

    void reloadLips();
    void reloadTexturePacks();
    void reloadRims();

    /**
     * Rescans the override directory.
     *
     * @param directory  Subdirectory relative to the override directory
     *                   ("." for the override directory itself). If empty,
     *                   every directory is rescanned.
     */
    void reloadOverride(QString const &directory = "");

    /**
     * Updates the descriptor of one loose file of the override directory.
     * A file that no longer exists is removed from the cache.
     *
     * @param filePath  Absolute path, or path relative to the override directory.
     */
    void reloadOverrideFile(QString const &filePath);

    void reloadStreamMusic();
    void reloadStreamSounds();
    void reloadStreamVoice();

    /**
     * Rescans the save folders of every save location.
     *
     * @throws UndeterminedGameError  "cloudsaves" exists and the game is unknown.
     */
    void reloadSaves();

    /// Rescans every location.
    void reloadAll();

    /// Returns every cache to the unloaded state.
    void clearCaches();

    //
    // Listings (load the relevant cache if needed)
    //

    FileResources const &chitinResources();

    /// Key file resources followed by the core patch capsule members.
    FileResources coreResources();

    /// File names of the capsules in the modules directory, in scan order.
    QStringList modulesList();
    FileResources moduleResources(QString const &fileName);

    /**
     * Capsules of the modules directory grouped by module root. The file
     * names of each group are in scan order.
     */
    QMap<QString, QStringList> moduleGroups();

    QStringList lipsList();
    FileResources lipResources(QString const &fileName);

    QStringList texturePacksList();
    FileResources texturePackResources(QString const &fileName);

    QStringList rimsList();
    FileResources rimResources(QString const &fileName);

    /**
     * Directories of the override directory that have been scanned, as
     * '/'-separated paths relative to it. The override directory itself is
     * ".".
     */
    QStringList overrideList();
    FileResources overrideResources(QString const &directory);

    FileResources const &streamMusicResources();
    FileResources const &streamSoundResources();
    FileResources const &streamVoiceResources();

    /**
     * Save folders as '/'-separated paths relative to the installation
     * root, e.g. "saves/000001 - Game1". Each lists its own files only.
     */
    QStringList savesList();
    FileResources saveResources(QString const &saveFolder);

    /// @return @c true if the save folders have been scanned.
    bool savesLoaded() const;

    //
    // Queries
    //

    /**
     * Finds every location of each queried resource. The categories of
     * @a order are searched in the given order and each identifier's list
     * of results follows it. Within the modules category, only the best
     * form of each module that contains the resource is reported (see
     * ModuleForm).
     *
     * @return Every queried identifier mapped to its locations (possibly none).
     */
    LocationsMap locations(ResourceIdentifiers const &queries,
                           SearchOrder const &order = defaultSearchOrder(),
                           SearchExtras const &extras = SearchExtras());

    LocationResults location(QString const &name, ResourceType type,
                             SearchOrder const &order = defaultSearchOrder(),
                             SearchExtras const &extras = SearchExtras());

    /**
     * Reads the data of each queried resource from its first location. Each
     * backing file is opened at most once.
     *
     * @return Every queried identifier mapped to its result. Misses are null.
     *
     * @throws FileResource::ReadError  A located resource could not be read.
     */
    ResourcesMap resources(ResourceIdentifiers const &queries,
                           SearchOrder const &order = defaultSearchOrder(),
                           SearchExtras const &extras = SearchExtras());

    ResourceResult resource(QString const &name, ResourceType type,
                            SearchOrder const &order = defaultSearchOrder(),
                            SearchExtras const &extras = SearchExtras());

    /**
     * Looks up a texture. TPC and TGA images are aliases of the same
     * texture: the one found in the earliest category wins, and a TPC wins
     * over a TGA found in the same category. A TXI found beside a winning
     * TGA (same category, and same directory or capsule) is attached to the
     * result.
     */
    TextureResult texture(QString const &name,
                          SearchOrder const &order = defaultTextureSearchOrder(),
                          SearchExtras const &extras = SearchExtras());

    /// @return Results keyed by case-folded name.
    TexturesMap textures(QStringList const &names,
                         SearchOrder const &order = defaultTextureSearchOrder(),
                         SearchExtras const &extras = SearchExtras());

    /**
     * Looks up a sound (WAV, or MP3). The data is passed through the
     * installed sound fixup.
     *
     * @return Sound data, or an empty array if not found.
     */
    QByteArray sound(QString const &name,
                     SearchOrder const &order = defaultSoundSearchOrder(),
                     SearchExtras const &extras = SearchExtras());

    SoundsMap sounds(QStringList const &names,
                     SearchOrder const &order = defaultSoundSearchOrder(),
                     SearchExtras const &extras = SearchExtras());

    /**
     * Sets the fixup applied to sounds. Ownership is not transferred.
     *
     * @param fixup  Fixup to use, or @c NULL for none.
     */
    void setSoundFixup(ISoundFixup *fixup);

    /// Primary talk table, or @c NULL if it does not exist or is malformed.
    TalkTable const *talkTable();

    /// Talk table with the female variants, or @c NULL.
    TalkTable const *femaleTalkTable();

    /**
     * Determines the text of a localized string. A string reference is
     * looked up in the primary talk table and then in the female one.
     * Otherwise the first inline substring is used, and failing that
     * @a defaultText.
     */
    QString string(LocalizedString const &str, QString const &defaultText = "");

    /// Texts of several localized strings, in the same order.
    QStringList strings(QList<LocalizedString> const &strs, QString const &defaultText = "");

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_INSTALLATION_H
