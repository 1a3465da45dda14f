/**
 * @file fileresource.cpp
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

#include "holocron/fileresource.h"

#include <QFile>

namespace holocron {

FileResource::FileResource() : _offset(0), _size(0)
{}

FileResource::FileResource(ResourceIdentifier const &identifier, QString const &path,
                           duint64 offset, duint64 size)
    : _identifier(identifier), _path(path), _offset(offset), _size(size)
{}

bool FileResource::isSameLocation(FileResource const &other) const
{
    return _path == other._path && _offset == other._offset && _size == other._size;
}

QByteArray FileResource::data() const
{
    QFile file(_path);
    if(!file.open(QFile::ReadOnly))
    {
        throw ReadError("FileResource::data", QString("Failed to open \"%1\": %2")
                        .arg(_path).arg(file.errorString()));
    }
    return data(file);
}

QByteArray FileResource::data(QFile &file) const
{
    if(!file.seek(qint64(_offset)))
    {
        throw ReadError("FileResource::data", QString("Failed to seek to %1 in \"%2\"")
                        .arg(_offset).arg(_path));
    }
    QByteArray bytes = file.read(qint64(_size));
    if(duint64(bytes.size()) != _size)
    {
        throw ReadError("FileResource::data", QString("Only read %1 of %2 bytes of \"%3\" from \"%4\"")
                        .arg(bytes.size()).arg(_size).arg(_identifier.fileName()).arg(_path));
    }
    return bytes;
}

} // namespace holocron
