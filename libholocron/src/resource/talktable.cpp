/**
 * @file talktable.cpp
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

#include "holocron/talktable.h"
#include "holocron/log.h"

#include <QFile>
#include <QTextCodec>
#include <QVector>
#include <QtEndian>

namespace holocron {

LocalizedString::LocalizedString(int stringRef) : _stringRef(stringRef)
{}

void LocalizedString::setSubstring(int language, Gender gender, QString const &text)
{
    _substrings.insert(SubstringKey(language, int(gender)), text);
}

QString LocalizedString::substring(int language, Gender gender) const
{
    return _substrings.value(SubstringKey(language, int(gender)));
}

QString LocalizedString::firstSubstring() const
{
    if(_substrings.isEmpty()) return "";
    return _substrings.constBegin().value();
}

#pragma pack(1)
typedef struct {
    char fileType[4];
    char fileVersion[4];
    duint32 language;
    duint32 stringCount;
    duint32 entriesOffset;
} tlkheader_t;

typedef struct {
    duint32 flags;
    char soundResRef[16];
    duint32 volumeVariance;
    duint32 pitchVariance;
    duint32 textOffset;
    duint32 textLength;
    dfloat soundLength;
} tlkentry_t;
#pragma pack()

/// Entry flags.
#define TLK_TEXT_PRESENT    0x1

/**
 * Name of the 8-bit code page the texts of @a language are written in.
 * Unknown languages use the Western code page.
 */
static char const *codePageName(int language)
{
    if(language == 5 || (language >= 68 && language <= 76) || language == 96)
        return "Windows-1250"; // Central European
    if(language >= 58 && language <= 67)
        return "Windows-1251"; // Cyrillic
    if(language == 77) return "Windows-1253";
    if(language >= 79 && language <= 82) return "Windows-1254";
    if(language == 83) return "Windows-1255";
    if(language == 84) return "Windows-1256";
    if(language >= 85 && language <= 87) return "Windows-1257";
    if(language == 88) return "Windows-1258";
    if(language == 89) return "TIS-620";
    if(language == 128) return "cp949";
    if(language == 129) return "Big5";
    if(language == 130) return "GBK";
    if(language == 131) return "Shift_JIS";
    return "Windows-1252";
}

HOLOCRON_PIMPL(TalkTable)
{
    QString path;
    int language;
    QTextCodec *codec;
    duint32 entriesOffset;
    qint64 fileSize;

    struct Entry {
        duint32 flags;
        QString soundResRef;
        duint32 textOffset;
        duint32 textLength;
    };
    QVector<Entry> entries;

    Instance(Public *i, QString const &_path)
        : Base(i), path(_path), language(0), codec(0), entriesOffset(0), fileSize(0)
    {}

    void open()
    {
        QFile file(path);
        if(!file.open(QFile::ReadOnly))
        {
            throw FormatError("TalkTable::TalkTable", QString("Failed to open \"%1\": %2")
                                  .arg(path).arg(file.errorString()));
        }
        fileSize = file.size();

        tlkheader_t hdr;
        if(file.read((char *)&hdr, sizeof(hdr)) != qint64(sizeof(hdr)) ||
           qstrncmp(hdr.fileType, "TLK ", 4) || qstrncmp(hdr.fileVersion, "V3.0", 4))
        {
            throw FormatError("TalkTable::TalkTable", QString("File \"%1\" is not a talk table").arg(path));
        }

        language      = int(qFromLittleEndian(hdr.language));
        codec         = QTextCodec::codecForName(codePageName(language));
        if(!codec)
        {
            LOG_AS("TalkTable");
            LOG_WARNING("No text codec for language %i of \"%s\", using Windows-1252.") << language << path;
            codec = QTextCodec::codecForName("Windows-1252");
        }
        entriesOffset = qFromLittleEndian(hdr.entriesOffset);
        duint32 const count = qFromLittleEndian(hdr.stringCount);

        qint64 const tableSize = qint64(count) * qint64(sizeof(tlkentry_t));
        if(qint64(sizeof(tlkheader_t)) + tableSize > fileSize)
        {
            throw FormatError("TalkTable::TalkTable", QString("Entry table of \"%1\" exceeds the file size")
                                  .arg(path));
        }
        QByteArray table = file.read(tableSize);
        if(table.size() != tableSize)
        {
            throw FormatError("TalkTable::TalkTable", QString("Truncated entry table in \"%1\"").arg(path));
        }

        entries.resize(count);
        tlkentry_t const *te = reinterpret_cast<tlkentry_t const *>(table.constData());
        for(duint32 i = 0; i < count; ++i, ++te)
        {
            Entry &e = entries[i];
            e.flags      = qFromLittleEndian(te->flags);
            int len = 0;
            while(len < 16 && te->soundResRef[len]) { len++; }
            e.soundResRef = QString::fromLatin1(te->soundResRef, len);
            e.textOffset = qFromLittleEndian(te->textOffset);
            e.textLength = qFromLittleEndian(te->textLength);
        }
    }

    QString readText(QFile &file, int stringRef) const
    {
        LOG_AS("TalkTable");

        if(stringRef < 0 || stringRef >= entries.size()) return "";

        Entry const &e = entries.at(stringRef);
        if(!(e.flags & TLK_TEXT_PRESENT) || !e.textLength) return "";

        qint64 const pos = qint64(entriesOffset) + e.textOffset;
        if(pos + e.textLength > fileSize || !file.seek(pos))
        {
            LOG_WARNING("Text of string %i in \"%s\" lies outside the file.") << stringRef << path;
            return "";
        }
        QByteArray text = file.read(e.textLength);
        int end = text.indexOf('\0');
        if(end >= 0) text.truncate(end);

        if(!codec) return QString::fromLatin1(text);
        return codec->toUnicode(text);
    }
};

TalkTable::TalkTable(QString const &path) : d(new Instance(this, path))
{
    d->open();
}

TalkTable::~TalkTable()
{}

QString TalkTable::path() const
{
    return d->path;
}

int TalkTable::language() const
{
    return d->language;
}

int TalkTable::size() const
{
    return d->entries.size();
}

bool TalkTable::contains(int stringRef) const
{
    return stringRef >= 0 && stringRef < d->entries.size();
}

QString TalkTable::string(int stringRef) const
{
    if(!contains(stringRef)) return "";

    QFile file(d->path);
    if(!file.open(QFile::ReadOnly)) return "";
    return d->readText(file, stringRef);
}

QString TalkTable::soundResRef(int stringRef) const
{
    if(!contains(stringRef)) return "";
    return d->entries.at(stringRef).soundResRef;
}

QMap<int, QString> TalkTable::strings(QList<int> const &stringRefs) const
{
    QMap<int, QString> result;

    QFile file(d->path);
    bool const isOpen = file.open(QFile::ReadOnly);
    foreach(int ref, stringRefs)
    {
        result.insert(ref, isOpen? d->readText(file, ref) : QString());
    }
    return result;
}

} // namespace holocron
