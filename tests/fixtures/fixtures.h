/**
 * @file fixtures.h
 * Writers for small synthetic game files used by the tests.
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

#ifndef HOLOCRON_TESTS_FIXTURES_H
#define HOLOCRON_TESTS_FIXTURES_H

#include <holocron/resourcetype.h>

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

namespace fixtures {

/// One member of a capsule or blob.
struct Member
{
    QString name;
    holocron::ResourceType type;
    QByteArray data;

    Member(QString const &_name, holocron::ResourceType _type, QByteArray const &_data)
        : name(_name), type(_type), data(_data) {}
};

typedef QList<Member> Members;

/// A blob listed by the key file. @a name is relative to the root, e.g. "data/2da.bif".
/// With @a indexOnlyIds the blob's own table stores bare entry indices.
struct Blob
{
    QString name;
    Members members;
    bool indexOnlyIds;

    Blob(QString const &_name, Members const &_members = Members(), bool _indexOnlyIds = false)
        : name(_name), members(_members), indexOnlyIds(_indexOnlyIds) {}
};

typedef QList<Blob> Blobs;

/**
 * Composes an ERF-family capsule.
 *
 * @param signature  Four-character type, e.g. "ERF " or "MOD ".
 */
QByteArray erfBytes(char const *signature, Members const &members);

/**
 * Composes a RIM capsule. If @a implicitOffset is set, the header leaves the
 * entry table offset zero and the table is placed at the implied position.
 */
QByteArray rimBytes(Members const &members, bool implicitOffset = false);

/// Composes a V3.0 talk table with one entry per text. Empty texts are
/// written without the text-present flag.
QByteArray tlkBytes(QStringList const &texts, int language = 0);

/// Creates @a path (and its parent directories) with @a data.
void writeFile(QString const &path, QByteArray const &data = QByteArray());

/// Creates a directory under @a root. Returns its path.
QString makeDir(QString const &root, QString const &relativePath);

/**
 * Writes "chitin.key" into @a root and each blob to its listed path. Blob
 * names are stored with backslashes, as the games do.
 */
void writeChitin(QString const &root, Blobs const &blobs);

/// Creates the minimal layout of an installation of the first title: an
/// empty modules directory plus the files that identify the game.
void makeK1Installation(QString const &root);

/// Same for the second title.
void makeK2Installation(QString const &root);

} // namespace fixtures

#endif // HOLOCRON_TESTS_FIXTURES_H
