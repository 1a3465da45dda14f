/**
 * @file fs_util.h
 * File system utility routines. @ingroup fs
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

#ifndef LIBHOLOCRON_FILESYS_UTIL_H
#define LIBHOLOCRON_FILESYS_UTIL_H

#include "libholocron.h"

#include <QString>
#include <QStringList>

namespace holocron {

/// Kind of directory entry accepted by F_FindCaseInsensitive().
enum EntryKind {
    AnyEntry,
    FileEntry,
    DirectoryEntry
};

/**
 * Finds an entry of directory @a dir whose name matches @a name ignoring
 * case. An exact match is preferred over a case-insensitive one.
 *
 * @return Native path of the entry, or an empty string if not found.
 */
HOLOCRON_PUBLIC QString F_FindCaseInsensitive(QString const &dir, QString const &name,
                                              EntryKind kind = AnyEntry);

/**
 * Resolves a relative path (segments separated with '/' or '\\') under
 * @a root one segment at a time, ignoring case.
 *
 * @return Native path, or an empty string if some segment does not exist.
 */
HOLOCRON_PUBLIC QString F_ResolveCaseInsensitive(QString const &root, QString const &relativePath,
                                                 EntryKind kind = AnyEntry);

/// @return @c true if @a path exists and is a regular file.
HOLOCRON_PUBLIC bool F_FileExists(QString const &path);

/// @return @c true if @a path exists and is a directory.
HOLOCRON_PUBLIC bool F_DirExists(QString const &path);

/**
 * Lists the regular files of a directory, sorted by name ignoring case.
 *
 * @param dir        Directory to list.
 * @param recursive  Descend into subdirectories. The files of each
 *                   directory are listed before those of its subdirectories.
 *
 * @return Native paths of the files.
 */
HOLOCRON_PUBLIC QStringList F_ListFiles(QString const &dir, bool recursive = false);

/**
 * Lists the subdirectories of @a dir, recursively, as paths relative to
 * @a dir using '/' as the separator. Sorted by name ignoring case, parents
 * before their children.
 */
HOLOCRON_PUBLIC QStringList F_ListSubdirectories(QString const &dir);

/**
 * Composes the relative path of @a path with respect to @a base, using '/'
 * as the separator. Returns "." if they are the same directory.
 */
HOLOCRON_PUBLIC QString F_RelativePath(QString const &base, QString const &path);

/// Makes a path suitable for presentation in log messages.
HOLOCRON_PUBLIC QString F_PrettyPath(QString const &path);

} // namespace holocron

#endif // LIBHOLOCRON_FILESYS_UTIL_H
