/**
 * @file fs_util.cpp
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

#include "holocron/fs_util.h"

#include <QDir>
#include <QFileInfo>

namespace holocron {

static bool matchesKind(QFileInfo const &info, EntryKind kind)
{
    switch(kind)
    {
    case FileEntry:      return info.isFile();
    case DirectoryEntry: return info.isDir();
    default:             return info.exists();
    }
}

QString F_FindCaseInsensitive(QString const &dir, QString const &name, EntryKind kind)
{
    if(dir.isEmpty() || name.isEmpty()) return "";

    QDir folder(dir);

    // The exact spelling is the most likely.
    QFileInfo exact(folder.filePath(name));
    if(matchesKind(exact, kind))
    {
        return exact.filePath();
    }

    QDir::Filters filters = QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;
    if(kind != DirectoryEntry) filters |= QDir::Files;
    if(kind != FileEntry)      filters |= QDir::Dirs;

    foreach(QFileInfo const &info, folder.entryInfoList(filters, QDir::Name))
    {
        if(!info.fileName().compare(name, Qt::CaseInsensitive))
        {
            return info.filePath();
        }
    }
    return "";
}

QString F_ResolveCaseInsensitive(QString const &root, QString const &relativePath, EntryKind kind)
{
    QStringList segments = QString(relativePath).replace('\\', '/')
            .split('/', QString::SkipEmptyParts);
    if(segments.isEmpty()) return F_DirExists(root)? root : "";

    QString current = root;
    for(int i = 0; i < segments.size(); ++i)
    {
        bool const last = (i == segments.size() - 1);
        current = F_FindCaseInsensitive(current, segments.at(i), last? kind : DirectoryEntry);
        if(current.isEmpty()) return "";
    }
    return current;
}

bool F_FileExists(QString const &path)
{
    return !path.isEmpty() && QFileInfo(path).isFile();
}

bool F_DirExists(QString const &path)
{
    return !path.isEmpty() && QFileInfo(path).isDir();
}

QStringList F_ListFiles(QString const &dir, bool recursive)
{
    QStringList files;
    QDir folder(dir);
    if(!folder.exists()) return files;

    foreach(QFileInfo const &info, folder.entryInfoList(QDir::Files | QDir::Hidden | QDir::System,
                                                         QDir::Name | QDir::IgnoreCase))
    {
        files << info.filePath();
    }

    if(recursive)
    {
        // Linked directories are not descended into; they may loop.
        foreach(QFileInfo const &sub, folder.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                            QDir::Name | QDir::IgnoreCase))
        {
            files << F_ListFiles(sub.filePath(), true);
        }
    }
    return files;
}

static void listSubdirectories(QDir const &base, QString const &dir, QStringList &result)
{
    foreach(QFileInfo const &sub, QDir(dir).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                                                           QDir::Name | QDir::IgnoreCase))
    {
        result << base.relativeFilePath(sub.filePath());
        listSubdirectories(base, sub.filePath(), result);
    }
}

QStringList F_ListSubdirectories(QString const &dir)
{
    QStringList result;
    if(!F_DirExists(dir)) return result;
    listSubdirectories(QDir(dir), dir, result);
    return result;
}

QString F_RelativePath(QString const &base, QString const &path)
{
    QString rel = QDir(base).relativeFilePath(path);
    if(rel.isEmpty()) return ".";
    return QDir::fromNativeSeparators(rel);
}

QString F_PrettyPath(QString const &path)
{
    return QDir::toNativeSeparators(QDir::cleanPath(path));
}

} // namespace holocron
