/**
 * @file locationresult.h
 * Results of resource queries. @ingroup resource
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

#ifndef LIBHOLOCRON_LOCATIONRESULT_H
#define LIBHOLOCRON_LOCATIONRESULT_H

#include "fileresource.h"
#include "searchlocation.h"

#include <QByteArray>
#include <QHash>
#include <QList>

namespace holocron {

/**
 * One place where a resource was found: the backing file and byte range,
 * and the category that produced the match.
 */
struct HOLOCRON_PUBLIC LocationResult
{
    SearchLocation location;
    FileResource resource;

    LocationResult() : location(SL_OVERRIDE) {}
    LocationResult(SearchLocation loc, FileResource const &res)
        : location(loc), resource(res) {}

    QString const &path() const { return resource.path(); }
    duint64 offset() const { return resource.offset(); }
    duint64 size() const { return resource.size(); }

    bool operator == (LocationResult const &other) const {
        return location == other.location && resource == other.resource &&
               resource.isSameLocation(other.resource);
    }
};

typedef QList<LocationResult> LocationResults;

/// Locations of each queried identifier, in priority order.
typedef QHash<ResourceIdentifier, LocationResults> LocationsMap;

/**
 * Data of a resource read from its highest priority location. A null result
 * means the resource was not found anywhere in the searched locations.
 */
class HOLOCRON_PUBLIC ResourceResult
{
public:
    ResourceResult() {}
    ResourceResult(ResourceIdentifier const &id, QString const &path, QByteArray const &data)
        : _id(id), _path(path), _data(data) {}

    bool isNull() const { return !_id.isValid(); }

    QString resName() const { return _id.name(); }
    ResourceType resType() const { return _id.type(); }
    ResourceIdentifier const &identifier() const { return _id; }
    QString const &path() const { return _path; }
    QByteArray const &data() const { return _data; }

private:
    ResourceIdentifier _id;
    QString _path;
    QByteArray _data;
};

/// Result (or a null result) of each queried identifier.
typedef QHash<ResourceIdentifier, ResourceResult> ResourcesMap;

/**
 * Texture found by Installation::texture(). The payload is either a TPC or
 * a TGA image; decoding it is left to the caller. For TGA images the TXI
 * sidecar found in the same location is attached when present.
 */
class HOLOCRON_PUBLIC TextureResult
{
public:
    TextureResult() : _location(SL_OVERRIDE) {}
    TextureResult(ResourceResult const &image, SearchLocation location, QByteArray const &txi = QByteArray())
        : _image(image), _location(location), _txi(txi) {}

    bool isNull() const { return _image.isNull(); }

    QString name() const { return _image.resName(); }

    /// TPC or TGA.
    ResourceType format() const { return _image.resType(); }

    ResourceResult const &image() const { return _image; }
    QByteArray const &data() const { return _image.data(); }
    SearchLocation location() const { return _location; }

    bool hasTxi() const { return !_txi.isEmpty(); }

    /// Contents of the TXI sidecar (texture metadata).
    QByteArray const &txi() const { return _txi; }

private:
    ResourceResult _image;
    SearchLocation _location;
    QByteArray _txi;
};

typedef QHash<QString, TextureResult> TexturesMap;

} // namespace holocron

#endif // LIBHOLOCRON_LOCATIONRESULT_H
