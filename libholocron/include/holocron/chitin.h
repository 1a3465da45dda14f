/**
 * @file chitin.h
 * Key and blob archive index (KEY/BIF). @ingroup fs
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

#ifndef LIBHOLOCRON_FILESYS_CHITIN_H
#define LIBHOLOCRON_FILESYS_CHITIN_H

#include "fileresource.h"

#include <QStringList>

namespace holocron {

/**
 * Index of the resources stored in the blob (BIF) files listed by the key
 * file "chitin.key" of an installation. The whole index is built when the
 * Chitin is constructed.
 *
 * The key file names the blobs and maps each resource id to a name and
 * type. A resource id carries the index of its blob in the upper 12 bits and
 * the index of the entry within that blob in the lower 20 bits.
 *
 * A blob that cannot be opened or parsed is logged and its resources are
 * left out of the index.
 *
 * @ingroup fs
 */
class HOLOCRON_PUBLIC Chitin
{
public:
    /// The key file is malformed. @ingroup errors
    HOLOCRON_ERROR(FormatError);

    /// The key file cannot be opened. @ingroup errors
    HOLOCRON_ERROR(NotFoundError);

    static char const *KEY_FILE_NAME;

public:
    /**
     * Reads the key file @a keyPath and all the blobs it lists. Blob paths
     * are resolved relative to @a rootPath, ignoring case.
     *
     * @throws NotFoundError  The key file cannot be opened.
     * @throws FormatError    The key file header or its tables are malformed.
     */
    Chitin(QString const &keyPath, QString const &rootPath);
    ~Chitin();

    QString keyPath() const;

    /// Blob file names as listed in the key file ('/' separated).
    QStringList blobNames() const;

    /// All indexed resources, blob by blob, in table order.
    FileResources const &resources() const;

    int size() const;

    bool contains(ResourceIdentifier const &id) const;

    /**
     * Determines whether the file at @a path has the key file signature.
     */
    static bool recognise(QString const &path);

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_FILESYS_CHITIN_H
