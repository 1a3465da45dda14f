/**
 * @file chitin.cpp
 * Key and blob archive index (KEY/BIF). @ingroup fs
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

#include "holocron/chitin.h"
#include "holocron/fs_util.h"
#include "holocron/log.h"

#include <QFile>
#include <QHash>
#include <QSet>
#include <QtEndian>

namespace holocron {

char const *Chitin::KEY_FILE_NAME = "chitin.key";

/// The following structures are used to read data directly from KEY and BIF files.
#pragma pack(1)
typedef struct {
    char fileType[4];
    char fileVersion[4];
    duint32 bifCount;
    duint32 keyCount;
    duint32 offsetToFileTable;
    duint32 offsetToKeyTable;
    duint32 buildYear;
    duint32 buildDay;
    dbyte reserved[32];
} keyheader_t;

typedef struct {
    duint32 fileSize;
    duint32 fileNameOffset;
    duint16 fileNameSize;
    duint16 drives;
} keyfileentry_t;

typedef struct {
    char resRef[16];
    duint16 resType;
    duint32 resId;
} keyentry_t;

typedef struct {
    char fileType[4];
    char fileVersion[4];
    duint32 variableResourceCount;
    duint32 fixedResourceCount;
    duint32 offsetToVariableResources;
} bifheader_t;

typedef struct {
    duint32 id;
    duint32 offset;
    duint32 size;
    duint32 resType;
} bifvarentry_t;
#pragma pack()

#define ENTRY_INDEX(resId)  ((resId) & 0xfffff)

static QString resRefToString(char const resRef[16])
{
    int len = 0;
    while(len < 16 && resRef[len]) { len++; }
    return QString::fromLatin1(resRef, len);
}

static bool isKeySignature(char const *type, char const *version)
{
    return !qstrncmp(type, "KEY ", 4) &&
           (!qstrncmp(version, "V1  ", 4) || !qstrncmp(version, "V1.1", 4));
}

HOLOCRON_PIMPL(Chitin)
{
    QString keyPath;
    QString rootPath;
    QStringList blobNames;

    /// Key table: resource id => (name, type).
    QHash<duint32, ResourceIdentifier> keys;

    FileResources resources;
    QSet<ResourceIdentifier> identifiers;

    Instance(Public *i, QString const &_keyPath, QString const &_rootPath)
        : Base(i), keyPath(_keyPath), rootPath(_rootPath)
    {}

    static QByteArray readRange(QFile &file, qint64 offset, qint64 length)
    {
        if(offset < 0 || length < 0 || offset + length > file.size()) return QByteArray();
        if(!file.seek(offset)) return QByteArray();
        QByteArray bytes = file.read(length);
        if(bytes.size() != length) return QByteArray();
        return bytes;
    }

    void readKey()
    {
        LOG_AS("Chitin");

        QFile file(keyPath);
        if(!file.open(QFile::ReadOnly))
        {
            throw NotFoundError("Chitin::Chitin", QString("Failed to open \"%1\": %2")
                                    .arg(keyPath).arg(file.errorString()));
        }

        keyheader_t hdr;
        if(file.read((char *)&hdr, sizeof(hdr)) != qint64(sizeof(hdr)))
        {
            throw FormatError("Chitin::readKey", QString("Truncated header in \"%1\"").arg(keyPath));
        }
        if(!isKeySignature(hdr.fileType, hdr.fileVersion))
        {
            throw FormatError("Chitin::readKey", QString("File \"%1\" is not a key file").arg(keyPath));
        }

        duint32 const bifCount   = qFromLittleEndian(hdr.bifCount);
        duint32 const keyCount   = qFromLittleEndian(hdr.keyCount);
        duint32 const fileOffset = qFromLittleEndian(hdr.offsetToFileTable);
        duint32 const keyOffset  = qFromLittleEndian(hdr.offsetToKeyTable);

        // Blob file table.
        QByteArray fileTable = readRange(file, fileOffset, qint64(bifCount) * sizeof(keyfileentry_t));
        if(bifCount && fileTable.isEmpty())
        {
            throw FormatError("Chitin::readKey", QString("File table of \"%1\" (%2 entries at offset %3) is out of bounds")
                                  .arg(keyPath).arg(bifCount).arg(fileOffset));
        }
        keyfileentry_t const *fe = reinterpret_cast<keyfileentry_t const *>(fileTable.constData());
        for(duint32 i = 0; i < bifCount; ++i, ++fe)
        {
            QByteArray name = readRange(file, qFromLittleEndian(fe->fileNameOffset),
                                        qFromLittleEndian(fe->fileNameSize));
            if(name.isEmpty() && qFromLittleEndian(fe->fileNameSize))
            {
                throw FormatError("Chitin::readKey", QString("Name of blob #%1 in \"%2\" is out of bounds")
                                      .arg(i).arg(keyPath));
            }
            // Names are zero terminated and use backslashes.
            int end = name.indexOf('\0');
            if(end >= 0) name.truncate(end);
            blobNames << QString::fromLatin1(name).replace('\\', '/');
        }

        // Key table.
        QByteArray keyTable = readRange(file, keyOffset, qint64(keyCount) * sizeof(keyentry_t));
        if(keyCount && keyTable.isEmpty())
        {
            throw FormatError("Chitin::readKey", QString("Key table of \"%1\" (%2 entries at offset %3) is out of bounds")
                                  .arg(keyPath).arg(keyCount).arg(keyOffset));
        }
        keyentry_t const *ke = reinterpret_cast<keyentry_t const *>(keyTable.constData());
        for(duint32 i = 0; i < keyCount; ++i, ++ke)
        {
            ResourceType type = ResourceType::fromId(qFromLittleEndian(ke->resType));
            QString name = resRefToString(ke->resRef);
            if(!type.isValid() || name.isEmpty())
            {
                LOG_DEBUG("Ignoring key \"%s\" of unknown type %i.") << name << qFromLittleEndian(ke->resType);
                continue;
            }
            keys.insert(qFromLittleEndian(ke->resId), ResourceIdentifier(name, type));
        }
    }

    /**
     * Reads the resource table of one blob and adds its entries.
     *
     * @throws Error  The blob cannot be read.
     */
    void readBlob(int blobIndex)
    {
        LOG_AS("Chitin");

        QString const blobName = blobNames.at(blobIndex);
        QString const blobPath = F_ResolveCaseInsensitive(rootPath, blobName, FileEntry);
        if(blobPath.isEmpty())
        {
            throw NotFoundError("Chitin::readBlob", QString("Blob \"%1\" not found").arg(blobName));
        }

        QFile file(blobPath);
        if(!file.open(QFile::ReadOnly))
        {
            throw NotFoundError("Chitin::readBlob", QString("Failed to open \"%1\": %2")
                                    .arg(blobPath).arg(file.errorString()));
        }

        bifheader_t hdr;
        if(file.read((char *)&hdr, sizeof(hdr)) != qint64(sizeof(hdr)) ||
           qstrncmp(hdr.fileType, "BIFF", 4) || qstrncmp(hdr.fileVersion, "V1  ", 4))
        {
            throw FormatError("Chitin::readBlob", QString("File \"%1\" is not a blob file").arg(blobPath));
        }

        duint32 const count  = qFromLittleEndian(hdr.variableResourceCount);
        duint32 const offset = qFromLittleEndian(hdr.offsetToVariableResources);
        QByteArray table = readRange(file, offset, qint64(count) * sizeof(bifvarentry_t));
        if(count && table.isEmpty())
        {
            throw FormatError("Chitin::readBlob", QString("Resource table of \"%1\" is out of bounds").arg(blobPath));
        }

        qint64 const fileSize = file.size();
        bifvarentry_t const *ve = reinterpret_cast<bifvarentry_t const *>(table.constData());
        for(duint32 i = 0; i < count; ++i, ++ve)
        {
            duint32 const id = qFromLittleEndian(ve->id);

            // Some blobs store only the entry index in the id; such an id
            // never names this blob in its upper bits.
            duint32 fullId = id;
            if((id >> 20) != duint32(blobIndex))
            {
                fullId = (duint32(blobIndex) << 20) | ENTRY_INDEX(id);
            }
            QHash<duint32, ResourceIdentifier>::const_iterator found = keys.constFind(fullId);
            if(found == keys.constEnd())
            {
                LOG_DEBUG("Entry #%i of \"%s\" has no key, ignoring.") << i << blobName;
                continue;
            }

            duint32 const resOffset = qFromLittleEndian(ve->offset);
            duint32 const resSize   = qFromLittleEndian(ve->size);
            if(qint64(resOffset) + qint64(resSize) > fileSize)
            {
                LOG_WARNING("Entry \"%s\" of \"%s\" lies outside the file, ignoring.")
                    << found.value().fileName() << blobName;
                continue;
            }

            if(identifiers.contains(found.value()))
            {
                LOG_DEBUG("Duplicate entry \"%s\" in \"%s\", ignoring.") << found.value().fileName() << blobName;
                continue;
            }
            identifiers.insert(found.value());
            resources.append(FileResource(found.value(), blobPath, resOffset, resSize));
        }
    }

    void build()
    {
        LOG_AS("Chitin");

        readKey();

        for(int i = 0; i < blobNames.size(); ++i)
        {
            try
            {
                readBlob(i);
            }
            catch(Error const &er)
            {
                LOG_WARNING("Skipping blob \"%s\": %s") << blobNames.at(i) << er.asText();
            }
        }

        LOG_VERBOSE("Indexed %i resources from %i blobs.") << resources.size() << blobNames.size();
    }
};

Chitin::Chitin(QString const &keyPath, QString const &rootPath)
    : d(new Instance(this, keyPath, rootPath))
{
    d->build();
}

Chitin::~Chitin()
{}

QString Chitin::keyPath() const
{
    return d->keyPath;
}

QStringList Chitin::blobNames() const
{
    return d->blobNames;
}

FileResources const &Chitin::resources() const
{
    return d->resources;
}

int Chitin::size() const
{
    return d->resources.size();
}

bool Chitin::contains(ResourceIdentifier const &id) const
{
    return d->identifiers.contains(id);
}

bool Chitin::recognise(QString const &path)
{
    QFile file(path);
    if(!file.open(QFile::ReadOnly)) return false;

    char sig[8];
    if(file.read(sig, 8) != 8) return false;
    return isKeySignature(sig, sig + 4);
}

} // namespace holocron
