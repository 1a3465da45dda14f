/**
 * @file resourceidentifier.h
 * Case-insensitive name and type of a resource. @ingroup resource
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

#ifndef LIBHOLOCRON_RESOURCEIDENTIFIER_H
#define LIBHOLOCRON_RESOURCEIDENTIFIER_H

#include "resourcetype.h"

#include <QString>
#include <QList>
#include <QHash>

namespace holocron {

/**
 * Identifies a resource by its name (a "resref") and type. Names are
 * compared and hashed in case-folded form; the original spelling is kept
 * for presentation.
 *
 * @ingroup resource
 */
class HOLOCRON_PUBLIC ResourceIdentifier
{
public:
    ResourceIdentifier();
    ResourceIdentifier(QString const &name, ResourceType type);

    /**
     * Constructs an identifier from a file name such as "c_bantha.utc". The
     * name is the part before the last dot and the type is determined by the
     * extension following it. Any directory part of the path is ignored.
     *
     * If the extension is not recognized, the type of the returned identifier
     * is invalid.
     */
    static ResourceIdentifier fromPath(QString const &path);

    /// Name as originally spelled.
    QString const &name() const { return _name; }

    /// Name in case-folded form.
    QString const &foldedName() const { return _folded; }

    ResourceType type() const { return _type; }

    bool isValid() const { return _type.isValid() && !_name.isEmpty(); }

    /// Composes the file name, e.g. "c_bantha.utc".
    QString fileName() const;

    QString asText() const { return fileName(); }

    bool operator == (ResourceIdentifier const &other) const {
        return _type == other._type && _folded == other._folded;
    }
    bool operator != (ResourceIdentifier const &other) const {
        return !(*this == other);
    }
    bool operator < (ResourceIdentifier const &other) const;

private:
    QString _name;
    QString _folded;
    ResourceType _type;
};

typedef QList<ResourceIdentifier> ResourceIdentifiers;

inline uint qHash(ResourceIdentifier const &id)
{
    return qHash(id.foldedName()) ^ (uint(id.type().id()) * 31u);
}

} // namespace holocron

#endif // LIBHOLOCRON_RESOURCEIDENTIFIER_H
