/**
 * @file resourcecache.h
 * Containers used by the per-location caches of an installation. @ingroup resource
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

#ifndef LIBHOLOCRON_RESOURCECACHE_H
#define LIBHOLOCRON_RESOURCECACHE_H

#include "fileresource.h"

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

namespace holocron {

/**
 * Ordered mapping from a case-insensitive name to a value. Keys are stored
 * in case-folded form; the spelling used when the key was first inserted
 * is kept for presentation. Iteration follows insertion order.
 */
template <typename Value>
class CaselessMap
{
public:
    CaselessMap() {}

    int size() const { return _values.size(); }
    bool isEmpty() const { return _values.isEmpty(); }

    void clear()
    {
        _keys.clear();
        _values.clear();
        _index.clear();
    }

    bool contains(QString const &key) const
    {
        return _index.contains(key.toCaseFolded());
    }

    /**
     * Inserts a value. If the key already exists its value is replaced
     * without changing the position of the key.
     */
    void insert(QString const &key, Value const &value)
    {
        QString const folded = key.toCaseFolded();
        typename QHash<QString, int>::const_iterator found = _index.constFind(folded);
        if(found != _index.constEnd())
        {
            _values[found.value()] = value;
            return;
        }
        _index.insert(folded, _values.size());
        _keys.append(key);
        _values.append(value);
    }

    bool remove(QString const &key)
    {
        int const pos = indexOf(key);
        if(pos < 0) return false;

        _keys.removeAt(pos);
        _values.removeAt(pos);

        // Positions after the removed one have shifted.
        _index.clear();
        for(int i = 0; i < _keys.size(); ++i)
        {
            _index.insert(_keys.at(i).toCaseFolded(), i);
        }
        return true;
    }

    /// @return Position of @a key in insertion order, or -1.
    int indexOf(QString const &key) const
    {
        return _index.value(key.toCaseFolded(), -1);
    }

    Value value(QString const &key, Value const &defaultValue = Value()) const
    {
        int const pos = indexOf(key);
        if(pos < 0) return defaultValue;
        return _values.at(pos);
    }

    /// @return Pointer to the value of @a key, or @c NULL.
    Value *find(QString const &key)
    {
        int const pos = indexOf(key);
        if(pos < 0) return 0;
        return &_values[pos];
    }

    /// Keys as originally spelled, in insertion order.
    QStringList keys() const { return _keys; }

    QString const &keyAt(int pos) const { return _keys.at(pos); }
    Value const &at(int pos) const { return _values.at(pos); }

    bool operator == (CaselessMap const &other) const
    {
        if(size() != other.size()) return false;
        for(int i = 0; i < _keys.size(); ++i)
        {
            if(_keys.at(i).toCaseFolded() != other._keys.at(i).toCaseFolded()) return false;
            if(!(_values.at(i) == other._values.at(i))) return false;
        }
        return true;
    }

private:
    QStringList _keys;
    QList<Value> _values;
    QHash<QString, int> _index;
};

/// Member descriptors of each container (or loose files of each directory).
typedef CaselessMap<FileResources> FileResourceMap;

/**
 * Contents of one search location cache. A cache is either unloaded or
 * holds the complete result of a scan, which may be empty.
 */
template <typename Type>
class LoadableCache
{
public:
    LoadableCache() : _loaded(false) {}

    bool isLoaded() const { return _loaded; }

    Type const &data() const { return _data; }

    /// Data for in-place updates. The cache must be loaded.
    Type &data()
    {
        HOLOCRON_ASSERT(_loaded);
        return _data;
    }

    /// Replaces the contents and marks the cache loaded.
    void set(Type const &data)
    {
        _data = data;
        _loaded = true;
    }

    /// Returns the cache to the unloaded state.
    void clear()
    {
        _data = Type();
        _loaded = false;
    }

private:
    bool _loaded;
    Type _data;
};

} // namespace holocron

#endif // LIBHOLOCRON_RESOURCECACHE_H
