/**
 * @file fixtures.cpp
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

#include "fixtures.h"

#include <QDataStream>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace fixtures {

static int const ERF_HEADER_SIZE = 160;
static int const ERF_KEY_SIZE = 24;
static int const ERF_RESOURCE_SIZE = 8;
static int const RIM_ENTRIES_OFFSET = 120;
static int const RIM_ENTRY_SIZE = 32;
static int const KEY_HEADER_SIZE = 64;
static int const KEY_FILE_ENTRY_SIZE = 12;
static int const KEY_ENTRY_SIZE = 22;
static int const BIF_HEADER_SIZE = 20;
static int const BIF_ENTRY_SIZE = 16;
static int const TLK_HEADER_SIZE = 20;
static int const TLK_ENTRY_SIZE = 40;

/// Little-endian writer over a byte array.
class Writer
{
public:
    Writer(QByteArray &dest) : _stream(&dest, QIODevice::WriteOnly)
    {
        _stream.setByteOrder(QDataStream::LittleEndian);
        _stream.setFloatingPointPrecision(QDataStream::SinglePrecision);
    }

    Writer &u16(int value)   { _stream << quint16(value); return *this; }
    Writer &u32(quint32 value) { _stream << value; return *this; }
    Writer &f32(float value) { _stream << value; return *this; }

    /// Writes @a text as exactly @a length bytes, padded with zeros.
    Writer &fixed(QByteArray const &text, int length)
    {
        QByteArray padded = text.left(length);
        padded.append(QByteArray(length - padded.size(), '\0'));
        _stream.writeRawData(padded.constData(), padded.size());
        return *this;
    }

    Writer &raw(QByteArray const &bytes)
    {
        _stream.writeRawData(bytes.constData(), bytes.size());
        return *this;
    }

    Writer &zeros(int count) { return raw(QByteArray(count, '\0')); }

private:
    QDataStream _stream;
};

QByteArray erfBytes(char const *signature, Members const &members)
{
    int const count = members.size();
    int const keysOffset = ERF_HEADER_SIZE;
    int const resourcesOffset = keysOffset + count * ERF_KEY_SIZE;
    int dataOffset = resourcesOffset + count * ERF_RESOURCE_SIZE;

    QByteArray bytes;
    Writer w(bytes);
    w.fixed(signature, 4).fixed("V1.0", 4)
     .u32(0)                // language count
     .u32(0)                // localized string size
     .u32(count)
     .u32(ERF_HEADER_SIZE)  // localized strings
     .u32(keysOffset)
     .u32(resourcesOffset)
     .zeros(ERF_HEADER_SIZE - 32);

    for(int i = 0; i < count; ++i)
    {
        Member const &m = members.at(i);
        w.fixed(m.name.toLatin1(), 16).u32(i).u16(m.type.id()).u16(0);
    }
    for(int i = 0; i < count; ++i)
    {
        w.u32(dataOffset).u32(members.at(i).data.size());
        dataOffset += members.at(i).data.size();
    }
    foreach(Member const &m, members)
    {
        w.raw(m.data);
    }
    return bytes;
}

QByteArray rimBytes(Members const &members, bool implicitOffset)
{
    int const count = members.size();
    int dataOffset = RIM_ENTRIES_OFFSET + count * RIM_ENTRY_SIZE;

    QByteArray bytes;
    Writer w(bytes);
    w.fixed("RIM ", 4).fixed("V1.0", 4)
     .u32(0)
     .u32(count)
     .u32(implicitOffset? 0 : RIM_ENTRIES_OFFSET)
     .zeros(RIM_ENTRIES_OFFSET - 20);

    for(int i = 0; i < count; ++i)
    {
        Member const &m = members.at(i);
        w.fixed(m.name.toLatin1(), 16).u32(m.type.id()).u32(i)
         .u32(dataOffset).u32(m.data.size());
        dataOffset += m.data.size();
    }
    foreach(Member const &m, members)
    {
        w.raw(m.data);
    }
    return bytes;
}

QByteArray tlkBytes(QStringList const &texts, int language)
{
    int const entriesOffset = TLK_HEADER_SIZE + texts.size() * TLK_ENTRY_SIZE;

    QByteArray bytes;
    Writer w(bytes);
    w.fixed("TLK ", 4).fixed("V3.0", 4)
     .u32(language)
     .u32(texts.size())
     .u32(entriesOffset);

    int textOffset = 0;
    foreach(QString const &text, texts)
    {
        QByteArray const latin = text.toLatin1();
        w.u32(latin.isEmpty()? 0 : 0x1)
         .fixed("", 16)
         .u32(0).u32(0)
         .u32(textOffset)
         .u32(latin.size())
         .f32(0);
        textOffset += latin.size();
    }
    foreach(QString const &text, texts)
    {
        w.raw(text.toLatin1());
    }
    return bytes;
}

void writeFile(QString const &path, QByteArray const &data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if(file.open(QFile::WriteOnly | QFile::Truncate))
    {
        file.write(data);
    }
}

QString makeDir(QString const &root, QString const &relativePath)
{
    QString const path = QDir(root).filePath(relativePath);
    QDir().mkpath(path);
    return path;
}

static QByteArray bifBytes(int blobIndex, Blob const &blob)
{
    Members const &members = blob.members;
    int const count = members.size();
    int dataOffset = BIF_HEADER_SIZE + count * BIF_ENTRY_SIZE;

    QByteArray bytes;
    Writer w(bytes);
    w.fixed("BIFF", 4).fixed("V1  ", 4)
     .u32(count)
     .u32(0)
     .u32(BIF_HEADER_SIZE);

    for(int i = 0; i < count; ++i)
    {
        Member const &m = members.at(i);
        w.u32(blob.indexOnlyIds? quint32(i) : (quint32(blobIndex) << 20) | quint32(i))
         .u32(dataOffset).u32(m.data.size()).u32(m.type.id());
        dataOffset += m.data.size();
    }
    foreach(Member const &m, members)
    {
        w.raw(m.data);
    }
    return bytes;
}

void writeChitin(QString const &root, Blobs const &blobs)
{
    int keyCount = 0;
    QList<QByteArray> names;
    foreach(Blob const &blob, blobs)
    {
        names << QString(blob.name).replace('/', '\\').toLatin1().append('\0');
        keyCount += blob.members.size();
    }

    int const fileTableOffset = KEY_HEADER_SIZE;
    int namesOffset = fileTableOffset + blobs.size() * KEY_FILE_ENTRY_SIZE;
    int keyTableOffset = namesOffset;
    foreach(QByteArray const &name, names) keyTableOffset += name.size();

    QByteArray key;
    Writer w(key);
    w.fixed("KEY ", 4).fixed("V1  ", 4)
     .u32(blobs.size())
     .u32(keyCount)
     .u32(fileTableOffset)
     .u32(keyTableOffset)
     .u32(103)              // build year
     .u32(0)                // build day
     .zeros(32);

    for(int i = 0; i < blobs.size(); ++i)
    {
        w.u32(0).u32(namesOffset).u16(names.at(i).size()).u16(1);
        namesOffset += names.at(i).size();
    }
    foreach(QByteArray const &name, names)
    {
        w.raw(name);
    }
    for(int b = 0; b < blobs.size(); ++b)
    {
        Members const &members = blobs.at(b).members;
        for(int i = 0; i < members.size(); ++i)
        {
            w.fixed(members.at(i).name.toLatin1(), 16)
             .u16(members.at(i).type.id())
             .u32((quint32(b) << 20) | quint32(i));
        }
    }
    Q_ASSERT(key.size() == keyTableOffset + keyCount * KEY_ENTRY_SIZE);

    writeFile(QDir(root).filePath("chitin.key"), key);
    for(int b = 0; b < blobs.size(); ++b)
    {
        writeFile(QDir(root).filePath(blobs.at(b).name), bifBytes(b, blobs.at(b)));
    }
}

void makeK1Installation(QString const &root)
{
    makeDir(root, "modules");
    makeDir(root, "streamwaves");
    writeFile(QDir(root).filePath("swkotor.exe"));
    writeFile(QDir(root).filePath("swkotor.ini"));
}

void makeK2Installation(QString const &root)
{
    makeDir(root, "modules");
    makeDir(root, "streamvoice");
    writeFile(QDir(root).filePath("swkotor2.exe"));
    writeFile(QDir(root).filePath("swkotor2.ini"));
}

} // namespace fixtures
