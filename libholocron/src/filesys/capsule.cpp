/**
 * @file capsule.cpp
 * Single-file resource archives (ERF, MOD, SAV, HAK and RIM). @ingroup fs
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

#include "holocron/capsule.h"
#include "holocron/log.h"

#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QtEndian>

namespace holocron {

/// The following structures are used to read data directly from capsule files.
#pragma pack(1)
typedef struct {
    char fileType[4];
    char fileVersion[4];
    duint32 languageCount;
    duint32 localizedStringSize;
    duint32 entryCount;
    duint32 offsetToLocalizedStrings;
    duint32 offsetToKeyList;
    duint32 offsetToResourceList;
} erfheader_t;

typedef struct {
    char resRef[16];
    duint32 resId;
    duint16 resType;
    duint16 unused;
} erfkey_t;

typedef struct {
    duint32 offset;
    duint32 size;
} erfresource_t;

typedef struct {
    char fileType[4];
    char fileVersion[4];
    duint32 unknown;
    duint32 entryCount;
    duint32 offsetToEntries;
} rimheader_t;

typedef struct {
    char resRef[16];
    duint32 resType;
    duint32 resId;
    duint32 offset;
    duint32 size;
} rimentry_t;
#pragma pack()

/// Default location of the RIM entry table when the header says zero.
static duint32 const RIM_DEFAULT_ENTRIES_OFFSET = 120;

static bool readSignature(QFile &file, char type[4], char version[4])
{
    if(!file.seek(0)) return false;
    if(file.read(type, 4) != 4) return false;
    if(file.read(version, 4) != 4) return false;
    return true;
}

static bool signatureToFormat(char const type[4], char const version[4], Capsule::Format &format)
{
    if(qstrncmp(version, "V1.0", 4)) return false;

    if(!qstrncmp(type, "ERF ", 4)) { format = Capsule::ErfFormat; return true; }
    if(!qstrncmp(type, "MOD ", 4)) { format = Capsule::ModFormat; return true; }
    if(!qstrncmp(type, "SAV ", 4)) { format = Capsule::SavFormat; return true; }
    if(!qstrncmp(type, "HAK ", 4)) { format = Capsule::HakFormat; return true; }
    if(!qstrncmp(type, "RIM ", 4)) { format = Capsule::RimFormat; return true; }
    return false;
}

static QString resRefToString(char const resRef[16])
{
    int len = 0;
    while(len < 16 && resRef[len]) { len++; }
    return QString::fromLatin1(resRef, len);
}

HOLOCRON_PIMPL(Capsule)
{
    QString path;
    Format format;
    qint64 fileSize;

    /// Members in table order, duplicates excluded.
    FileResources resources;

    /// Lookup from identifier to index in @ref resources.
    QHash<ResourceIdentifier, int> index;

    Instance(Public *i, QString const &_path)
        : Base(i), path(_path), format(ErfFormat), fileSize(0)
    {}

    /// Reads @a count records of type @a Type starting at @a offset.
    template <typename Type>
    QByteArray readTable(QFile &file, duint32 offset, duint32 count, char const *what)
    {
        qint64 const needed = qint64(count) * qint64(sizeof(Type));
        if(qint64(offset) + needed > fileSize)
        {
            throw FormatError("Capsule::readTable",
                              QString("The %1 table of \"%2\" (%3 records at offset %4) exceeds the file size %5")
                                  .arg(what).arg(path).arg(count).arg(offset).arg(fileSize));
        }
        if(!file.seek(offset))
        {
            throw FormatError("Capsule::readTable", QString("Failed to seek to the %1 table of \"%2\"")
                                  .arg(what).arg(path));
        }
        QByteArray table = file.read(needed);
        if(table.size() != needed)
        {
            throw FormatError("Capsule::readTable", QString("Truncated %1 table in \"%2\"")
                                  .arg(what).arg(path));
        }
        return table;
    }

    void checkRange(QString const &name, duint32 offset, duint32 size)
    {
        if(qint64(offset) + qint64(size) > fileSize)
        {
            throw FormatError("Capsule::checkRange",
                              QString("Member \"%1\" of \"%2\" (offset %3, size %4) lies outside the file")
                                  .arg(name).arg(path).arg(offset).arg(size));
        }
    }

    void addMember(QString const &resRef, int typeCode, duint32 offset, duint32 size)
    {
        LOG_AS("Capsule");

        ResourceType type = ResourceType::fromId(typeCode);
        if(resRef.isEmpty() || !type.isValid())
        {
            LOG_DEBUG("Ignoring member \"%s\" of unknown type %i in \"%s\".")
                << resRef << typeCode << path;
            return;
        }

        checkRange(resRef, offset, size);

        ResourceIdentifier id(resRef, type);
        if(index.contains(id))
        {
            // The first entry in the table is the one the game uses.
            LOG_DEBUG("Ignoring duplicate member \"%s\" in \"%s\".") << id.fileName() << path;
            return;
        }

        index.insert(id, resources.size());
        resources.append(FileResource(id, path, offset, size));
    }

    void readErf(QFile &file)
    {
        erfheader_t hdr;
        if(!file.seek(0) || file.read((char *)&hdr, sizeof(hdr)) != qint64(sizeof(hdr)))
        {
            throw FormatError("Capsule::readErf", QString("Truncated header in \"%1\"").arg(path));
        }

        duint32 const entryCount  = qFromLittleEndian(hdr.entryCount);
        duint32 const keysOffset  = qFromLittleEndian(hdr.offsetToKeyList);
        duint32 const resOffset   = qFromLittleEndian(hdr.offsetToResourceList);

        QByteArray keys = readTable<erfkey_t>(file, keysOffset, entryCount, "key");
        QByteArray ress = readTable<erfresource_t>(file, resOffset, entryCount, "resource");

        erfkey_t const *key = reinterpret_cast<erfkey_t const *>(keys.constData());
        erfresource_t const *res = reinterpret_cast<erfresource_t const *>(ress.constData());
        for(duint32 i = 0; i < entryCount; ++i, ++key, ++res)
        {
            addMember(resRefToString(key->resRef),
                      qFromLittleEndian(key->resType),
                      qFromLittleEndian(res->offset),
                      qFromLittleEndian(res->size));
        }
    }

    void readRim(QFile &file)
    {
        rimheader_t hdr;
        if(!file.seek(0) || file.read((char *)&hdr, sizeof(hdr)) != qint64(sizeof(hdr)))
        {
            throw FormatError("Capsule::readRim", QString("Truncated header in \"%1\"").arg(path));
        }

        duint32 const entryCount = qFromLittleEndian(hdr.entryCount);
        duint32 entriesOffset    = qFromLittleEndian(hdr.offsetToEntries);
        if(!entriesOffset) entriesOffset = RIM_DEFAULT_ENTRIES_OFFSET;

        QByteArray entries = readTable<rimentry_t>(file, entriesOffset, entryCount, "entry");

        rimentry_t const *entry = reinterpret_cast<rimentry_t const *>(entries.constData());
        for(duint32 i = 0; i < entryCount; ++i, ++entry)
        {
            addMember(resRefToString(entry->resRef),
                      int(qFromLittleEndian(entry->resType)),
                      qFromLittleEndian(entry->offset),
                      qFromLittleEndian(entry->size));
        }
    }

    void open()
    {
        QFile file(path);
        if(!file.open(QFile::ReadOnly))
        {
            throw NotFoundError("Capsule::Capsule", QString("Failed to open \"%1\": %2")
                                    .arg(path).arg(file.errorString()));
        }
        fileSize = file.size();

        char type[4], version[4];
        if(!readSignature(file, type, version) || !signatureToFormat(type, version, format))
        {
            throw FormatError("Capsule::Capsule", QString("File \"%1\" does not appear to be a known capsule format")
                                  .arg(path));
        }

        if(format == RimFormat)
        {
            readRim(file);
        }
        else
        {
            readErf(file);
        }
    }
};

Capsule::Capsule(QString const &path) : d(new Instance(this, path))
{
    d->open();
}

Capsule::~Capsule()
{}

QString Capsule::path() const
{
    return d->path;
}

QString Capsule::fileName() const
{
    return QFileInfo(d->path).fileName();
}

Capsule::Format Capsule::format() const
{
    return d->format;
}

int Capsule::size() const
{
    return d->resources.size();
}

bool Capsule::isEmpty() const
{
    return d->resources.isEmpty();
}

FileResources const &Capsule::resources() const
{
    return d->resources;
}

bool Capsule::contains(ResourceIdentifier const &id) const
{
    return d->index.contains(id);
}

bool Capsule::contains(QString const &name, ResourceType type) const
{
    return contains(ResourceIdentifier(name, type));
}

FileResource const &Capsule::info(ResourceIdentifier const &id) const
{
    QHash<ResourceIdentifier, int>::const_iterator found = d->index.constFind(id);
    if(found == d->index.constEnd())
    {
        throw NotFoundError("Capsule::info", QString("\"%1\" has no member \"%2\"")
                                .arg(d->path).arg(id.fileName()));
    }
    return d->resources.at(found.value());
}

QByteArray Capsule::resource(ResourceIdentifier const &id) const
{
    return info(id).data();
}

bool Capsule::recognise(QString const &path)
{
    QFile file(path);
    if(!file.open(QFile::ReadOnly)) return false;

    char type[4], version[4];
    Format format;
    return readSignature(file, type, version) && signatureToFormat(type, version, format);
}

bool Capsule::isCapsuleFileName(QString const &fileName)
{
    QString const ext = QFileInfo(fileName).suffix().toLower();
    return ext == "erf" || ext == "mod" || ext == "sav" || ext == "hak" || ext == "rim";
}

bool Capsule::isErfFileName(QString const &fileName)
{
    return !QFileInfo(fileName).suffix().compare("erf", Qt::CaseInsensitive);
}

bool Capsule::isModFileName(QString const &fileName)
{
    return !QFileInfo(fileName).suffix().compare("mod", Qt::CaseInsensitive);
}

bool Capsule::isRimFileName(QString const &fileName)
{
    return !QFileInfo(fileName).suffix().compare("rim", Qt::CaseInsensitive);
}

} // namespace holocron
