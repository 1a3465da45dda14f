/**
 * @file fileresource.h
 * Descriptor of a resource stored somewhere in the file system. @ingroup fs
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

#ifndef LIBHOLOCRON_FILESYS_FILERESOURCE_H
#define LIBHOLOCRON_FILESYS_FILERESOURCE_H

#include "error.h"
#include "resourceidentifier.h"

#include <QByteArray>
#include <QString>
#include <QList>

class QFile;

namespace holocron {

/**
 * Descriptor of one resource: its identifier plus the file, byte offset
 * and length where the data is stored. The data itself is read only when
 * requested. For loose files the offset is zero and the size is the size
 * of the whole file.
 *
 * Two descriptors are equal when they identify the same resource in the
 * same backing file.
 *
 * @ingroup fs
 */
class HOLOCRON_PUBLIC FileResource
{
public:
    /// The backing file could not be opened or read. @ingroup errors
    HOLOCRON_ERROR(ReadError);

public:
    FileResource();
    FileResource(ResourceIdentifier const &identifier, QString const &path,
                 duint64 offset, duint64 size);

    ResourceIdentifier const &identifier() const { return _identifier; }
    QString resName() const { return _identifier.name(); }
    ResourceType resType() const { return _identifier.type(); }

    /// Native path of the backing file (a loose file, a capsule or a blob).
    QString const &path() const { return _path; }

    duint64 offset() const { return _offset; }
    duint64 size() const { return _size; }

    bool isNull() const { return !_identifier.isValid(); }

    /// @return @c true if this and @a other point at the same byte range of
    /// the same file.
    bool isSameLocation(FileResource const &other) const;

    /**
     * Reads the data of the resource by opening the backing file.
     *
     * @throws ReadError  The file could not be opened or was truncated.
     */
    QByteArray data() const;

    /**
     * Reads the data of the resource from an already opened backing file.
     *
     * @param file  Open handle to path().
     *
     * @throws ReadError  Seeking or reading failed.
     */
    QByteArray data(QFile &file) const;

    bool operator == (FileResource const &other) const {
        return _identifier == other._identifier && _path == other._path;
    }
    bool operator != (FileResource const &other) const { return !(*this == other); }

    /// Checks whether this descriptor is for the logical resource @a id.
    bool operator == (ResourceIdentifier const &id) const { return _identifier == id; }

private:
    ResourceIdentifier _identifier;
    QString _path;
    duint64 _offset;
    duint64 _size;
};

typedef QList<FileResource> FileResources;

inline uint qHash(FileResource const &res)
{
    return qHash(res.identifier()) ^ qHash(res.path());
}

} // namespace holocron

#endif // LIBHOLOCRON_FILESYS_FILERESOURCE_H
