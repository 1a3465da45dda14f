/**
 * @file resourceidentifier.cpp
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

#include "holocron/resourceidentifier.h"

namespace holocron {

ResourceIdentifier::ResourceIdentifier()
{}

ResourceIdentifier::ResourceIdentifier(QString const &name, ResourceType type)
    : _name(name), _folded(name.toCaseFolded()), _type(type)
{}

ResourceIdentifier ResourceIdentifier::fromPath(QString const &path)
{
    QString fileName = path;
    int sep = qMax(fileName.lastIndexOf('/'), fileName.lastIndexOf('\\'));
    if(sep >= 0) fileName = fileName.mid(sep + 1);

    int dot = fileName.lastIndexOf('.');
    if(dot < 0)
    {
        return ResourceIdentifier(fileName, ResourceType::Invalid);
    }
    return ResourceIdentifier(fileName.left(dot), ResourceType::fromExtension(fileName.mid(dot + 1)));
}

QString ResourceIdentifier::fileName() const
{
    if(!_type.isValid()) return _name;
    return _name + "." + _type.extension();
}

bool ResourceIdentifier::operator < (ResourceIdentifier const &other) const
{
    if(_folded != other._folded) return _folded < other._folded;
    return _type.id() < other._type.id();
}

} // namespace holocron
