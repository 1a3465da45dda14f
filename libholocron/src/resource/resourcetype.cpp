/**
 * @file resourcetype.cpp
 * Resource type codes. @ingroup resource
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

#include "holocron/resourcetype.h"

#include <QHash>

namespace holocron {

namespace {

struct TypeInfo
{
    ResourceType::Id id;
    char const *extension;
    ResourceType::Category category;
};

TypeInfo const typeInfo[] = {
    { ResourceType::RES,    "res",  ResourceType::Gff },
    { ResourceType::BMP,    "bmp",  ResourceType::Texture },
    { ResourceType::MVE,    "mve",  ResourceType::Video },
    { ResourceType::TGA,    "tga",  ResourceType::Texture },
    { ResourceType::WAV,    "wav",  ResourceType::Audio },
    { ResourceType::PLT,    "plt",  ResourceType::Texture },
    { ResourceType::INI,    "ini",  ResourceType::Text },
    { ResourceType::MP3,    "mp3",  ResourceType::Audio },
    { ResourceType::MPG,    "mpg",  ResourceType::Video },
    { ResourceType::TXT,    "txt",  ResourceType::Text },
    { ResourceType::WMA,    "wma",  ResourceType::Audio },
    { ResourceType::WMV,    "wmv",  ResourceType::Video },
    { ResourceType::XMV,    "xmv",  ResourceType::Video },
    { ResourceType::PLH,    "plh",  ResourceType::UnknownCategory },
    { ResourceType::TEX,    "tex",  ResourceType::Texture },
    { ResourceType::MDL,    "mdl",  ResourceType::Model },
    { ResourceType::THG,    "thg",  ResourceType::UnknownCategory },
    { ResourceType::FNT,    "fnt",  ResourceType::Texture },
    { ResourceType::LUA,    "lua",  ResourceType::Script },
    { ResourceType::SLT,    "slt",  ResourceType::UnknownCategory },
    { ResourceType::NSS,    "nss",  ResourceType::Script },
    { ResourceType::NCS,    "ncs",  ResourceType::Script },
    { ResourceType::MOD,    "mod",  ResourceType::Archive },
    { ResourceType::ARE,    "are",  ResourceType::Gff },
    { ResourceType::SET,    "set",  ResourceType::Text },
    { ResourceType::IFO,    "ifo",  ResourceType::Gff },
    { ResourceType::BIC,    "bic",  ResourceType::Gff },
    { ResourceType::WOK,    "wok",  ResourceType::Walkmesh },
    { ResourceType::TwoDA,  "2da",  ResourceType::Text },
    { ResourceType::TLK,    "tlk",  ResourceType::Talk },
    { ResourceType::TXI,    "txi",  ResourceType::Texture },
    { ResourceType::GIT,    "git",  ResourceType::Gff },
    { ResourceType::BTI,    "bti",  ResourceType::Gff },
    { ResourceType::UTI,    "uti",  ResourceType::Gff },
    { ResourceType::BTC,    "btc",  ResourceType::Gff },
    { ResourceType::UTC,    "utc",  ResourceType::Gff },
    { ResourceType::DLG,    "dlg",  ResourceType::Gff },
    { ResourceType::ITP,    "itp",  ResourceType::Gff },
    { ResourceType::BTT,    "btt",  ResourceType::Gff },
    { ResourceType::UTT,    "utt",  ResourceType::Gff },
    { ResourceType::DDS,    "dds",  ResourceType::Texture },
    { ResourceType::BTS,    "bts",  ResourceType::Gff },
    { ResourceType::UTS,    "uts",  ResourceType::Gff },
    { ResourceType::LTR,    "ltr",  ResourceType::UnknownCategory },
    { ResourceType::GFF,    "gff",  ResourceType::Gff },
    { ResourceType::FAC,    "fac",  ResourceType::Gff },
    { ResourceType::BTE,    "bte",  ResourceType::Gff },
    { ResourceType::UTE,    "ute",  ResourceType::Gff },
    { ResourceType::BTD,    "btd",  ResourceType::Gff },
    { ResourceType::UTD,    "utd",  ResourceType::Gff },
    { ResourceType::BTP,    "btp",  ResourceType::Gff },
    { ResourceType::UTP,    "utp",  ResourceType::Gff },
    { ResourceType::DFT,    "dft",  ResourceType::Text },
    { ResourceType::GIC,    "gic",  ResourceType::Gff },
    { ResourceType::GUI,    "gui",  ResourceType::Gff },
    { ResourceType::CSS,    "css",  ResourceType::Script },
    { ResourceType::CCS,    "ccs",  ResourceType::Script },
    { ResourceType::BTM,    "btm",  ResourceType::Gff },
    { ResourceType::UTM,    "utm",  ResourceType::Gff },
    { ResourceType::DWK,    "dwk",  ResourceType::Walkmesh },
    { ResourceType::PWK,    "pwk",  ResourceType::Walkmesh },
    { ResourceType::BTG,    "btg",  ResourceType::Gff },
    { ResourceType::UTG,    "utg",  ResourceType::Gff },
    { ResourceType::JRL,    "jrl",  ResourceType::Gff },
    { ResourceType::SAV,    "sav",  ResourceType::Archive },
    { ResourceType::UTW,    "utw",  ResourceType::Gff },
    { ResourceType::FourPC, "4pc",  ResourceType::Texture },
    { ResourceType::SSF,    "ssf",  ResourceType::UnknownCategory },
    { ResourceType::HAK,    "hak",  ResourceType::Archive },
    { ResourceType::NWM,    "nwm",  ResourceType::Archive },
    { ResourceType::BIK,    "bik",  ResourceType::Video },
    { ResourceType::NDB,    "ndb",  ResourceType::Script },
    { ResourceType::PTM,    "ptm",  ResourceType::Gff },
    { ResourceType::PTT,    "ptt",  ResourceType::Gff },
    { ResourceType::LYT,    "lyt",  ResourceType::Text },
    { ResourceType::VIS,    "vis",  ResourceType::Text },
    { ResourceType::RIM,    "rim",  ResourceType::Archive },
    { ResourceType::PTH,    "pth",  ResourceType::Gff },
    { ResourceType::LIP,    "lip",  ResourceType::UnknownCategory },
    { ResourceType::BWM,    "bwm",  ResourceType::Walkmesh },
    { ResourceType::TXB,    "txb",  ResourceType::Texture },
    { ResourceType::TPC,    "tpc",  ResourceType::Texture },
    { ResourceType::MDX,    "mdx",  ResourceType::Model },
    { ResourceType::RSV,    "rsv",  ResourceType::UnknownCategory },
    { ResourceType::SIG,    "sig",  ResourceType::UnknownCategory },
    { ResourceType::MAB,    "mab",  ResourceType::UnknownCategory },
    { ResourceType::QST2,   "qst2", ResourceType::Gff },
    { ResourceType::STO,    "sto",  ResourceType::Gff },
    { ResourceType::HEX,    "hex",  ResourceType::UnknownCategory },
    { ResourceType::MDX2,   "mdx2", ResourceType::Model },
    { ResourceType::TXB2,   "txb2", ResourceType::Texture },
    { ResourceType::FSM,    "fsm",  ResourceType::UnknownCategory },
    { ResourceType::ART,    "art",  ResourceType::UnknownCategory },
    { ResourceType::AMP,    "amp",  ResourceType::UnknownCategory },
    { ResourceType::CWA,    "cwa",  ResourceType::UnknownCategory },
    { ResourceType::BIP,    "bip",  ResourceType::UnknownCategory },
    { ResourceType::ERF,    "erf",  ResourceType::Archive },
    { ResourceType::BIF,    "bif",  ResourceType::Archive },
    { ResourceType::KEY,    "key",  ResourceType::Archive },
    { ResourceType::Invalid, 0,     ResourceType::UnknownCategory }
};

/// Lookup tables built on first use.
struct TypeTables
{
    QHash<int, TypeInfo const *> byId;
    QHash<QString, TypeInfo const *> byExtension;

    TypeTables()
    {
        for(TypeInfo const *info = typeInfo; info->extension; ++info)
        {
            byId.insert(info->id, info);
            byExtension.insert(QString::fromLatin1(info->extension), info);
        }
    }
};

TypeTables const &tables()
{
    static TypeTables tabs;
    return tabs;
}

TypeInfo const *findInfo(ResourceType::Id id)
{
    return tables().byId.value(id, 0);
}

} // namespace

ResourceType::ResourceType(Id id) : _id(id)
{}

QString ResourceType::extension() const
{
    if(TypeInfo const *info = findInfo(_id))
    {
        return QString::fromLatin1(info->extension);
    }
    return "";
}

ResourceType::Category ResourceType::category() const
{
    if(TypeInfo const *info = findInfo(_id))
    {
        return info->category;
    }
    return UnknownCategory;
}

bool ResourceType::isTexturePayload() const
{
    return _id == TPC || _id == TGA || _id == TXI;
}

QString ResourceType::asText() const
{
    if(!isValid()) return "INVALID";
    return extension().toUpper();
}

ResourceType ResourceType::fromId(int code)
{
    if(TypeInfo const *info = tables().byId.value(code, 0))
    {
        return info->id;
    }
    return Invalid;
}

ResourceType ResourceType::fromExtension(QString const &extension)
{
    QString ext = extension.toLower();
    if(ext.startsWith('.')) ext.remove(0, 1);

    if(TypeInfo const *info = tables().byExtension.value(ext, 0))
    {
        return info->id;
    }
    return Invalid;
}

QList<ResourceType> ResourceType::all()
{
    QList<ResourceType> types;
    for(TypeInfo const *info = typeInfo; info->extension; ++info)
    {
        types.append(info->id);
    }
    return types;
}

} // namespace holocron
