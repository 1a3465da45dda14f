/**
 * @file talktable.h
 * Talk tables (TLK) and localized strings. @ingroup resource
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

#ifndef LIBHOLOCRON_TALKTABLE_H
#define LIBHOLOCRON_TALKTABLE_H

#include "error.h"

#include <QString>
#include <QList>
#include <QMap>
#include <QPair>

namespace holocron {

/**
 * String that is either a reference into the talk table or a set of
 * inline substrings keyed by language and gender.
 */
class HOLOCRON_PUBLIC LocalizedString
{
public:
    enum Gender { Male = 0, Female = 1 };

    typedef QPair<int, int> SubstringKey; ///< (language, gender)

public:
    /// @param stringRef  Talk table index, or -1 if none.
    LocalizedString(int stringRef = -1);

    int stringRef() const { return _stringRef; }
    void setStringRef(int ref) { _stringRef = ref; }

    void setSubstring(int language, Gender gender, QString const &text);
    QString substring(int language, Gender gender) const;
    bool hasSubstrings() const { return !_substrings.isEmpty(); }

    /// The substring with the lowest language/gender key.
    QString firstSubstring() const;

private:
    int _stringRef;
    QMap<SubstringKey, QString> _substrings;
};

/**
 * Talk table (TLK V3.0). The header and entry table are read when the
 * table is opened; texts are read on request.
 */
class HOLOCRON_PUBLIC TalkTable
{
public:
    /// The file is not a talk table or is malformed. @ingroup errors
    HOLOCRON_ERROR(FormatError);

public:
    /**
     * @throws FormatError  The file cannot be opened or parsed.
     */
    TalkTable(QString const &path);
    ~TalkTable();

    QString path() const;

    int language() const;

    /// Number of strings.
    int size() const;

    bool contains(int stringRef) const;

    /**
     * Reads one string. Returns an empty string if @a stringRef is out of
     * range or the entry has no text.
     */
    QString string(int stringRef) const;

    /// Sound resref attached to an entry.
    QString soundResRef(int stringRef) const;

    /**
     * Reads several strings with one open file.
     */
    QMap<int, QString> strings(QList<int> const &stringRefs) const;

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_TALKTABLE_H
