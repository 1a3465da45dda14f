/**
 * @file capsule.h
 * Single-file resource archives (ERF, MOD, SAV, HAK and RIM). @ingroup fs
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

#ifndef LIBHOLOCRON_FILESYS_CAPSULE_H
#define LIBHOLOCRON_FILESYS_CAPSULE_H

#include "fileresource.h"

#include <QList>

namespace holocron {

/**
 * Capsule. Runtime representation of an opened single-file archive. The
 * member table is read when the capsule is opened; member data is read on
 * request.
 *
 * Two on-disk layouts are supported: the ERF layout (used by .erf, .mod,
 * .sav and .hak files) and the RIM layout. If the member table lists the
 * same name and type more than once, the first entry is the one used.
 *
 * @ingroup fs
 */
class HOLOCRON_PUBLIC Capsule
{
public:
    /// Base class for format-related errors. @ingroup errors
    HOLOCRON_ERROR(FormatError);

    /// The requested member does not exist in the capsule. @ingroup errors
    HOLOCRON_ERROR(NotFoundError);

    /// On-disk layout and signature.
    enum Format {
        ErfFormat,
        ModFormat,
        SavFormat,
        HakFormat,
        RimFormat
    };

public:
    /**
     * Opens the capsule at @a path and reads its member table.
     *
     * @throws NotFoundError  The file does not exist or cannot be opened.
     * @throws FormatError    The header or member table is malformed.
     */
    Capsule(QString const &path);
    ~Capsule();

    /// Native path of the capsule file.
    QString path() const;

    /// Name of the capsule file, e.g. "m01aa.mod".
    QString fileName() const;

    Format format() const;

    /// @return Number of (distinct) members.
    int size() const;

    /// @return @c true= the capsule has no members.
    bool isEmpty() const;

    /// Members in table order, without duplicates.
    FileResources const &resources() const;

    bool contains(ResourceIdentifier const &id) const;
    bool contains(QString const &name, ResourceType type) const;

    /**
     * Retrieves the descriptor of a member without reading its data.
     *
     * @throws NotFoundError  No such member.
     */
    FileResource const &info(ResourceIdentifier const &id) const;

    /**
     * Reads the data of a member.
     *
     * @throws NotFoundError           No such member.
     * @throws FileResource::ReadError Reading the capsule file failed.
     */
    QByteArray resource(ResourceIdentifier const &id) const;

public:
    /**
     * Determines whether the file at @a path has the signature of one of
     * the supported capsule formats.
     */
    static bool recognise(QString const &path);

    /// @return @c true if the file name has a capsule extension
    /// (.erf, .mod, .sav, .hak or .rim).
    static bool isCapsuleFileName(QString const &fileName);

    /// @return @c true if the file name has the .erf extension.
    static bool isErfFileName(QString const &fileName);

    /// @return @c true if the file name has the .mod extension.
    static bool isModFileName(QString const &fileName);

    /// @return @c true if the file name has the .rim extension.
    static bool isRimFileName(QString const &fileName);

private:
    HOLOCRON_PRIVATE(d)
};

/// Capsules supplied by a caller for one query. Not owned.
typedef QList<Capsule const *> Capsules;

} // namespace holocron

#endif // LIBHOLOCRON_FILESYS_CAPSULE_H
