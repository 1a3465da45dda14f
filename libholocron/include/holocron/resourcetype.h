/**
 * @file resourcetype.h
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

#ifndef LIBHOLOCRON_RESOURCETYPE_H
#define LIBHOLOCRON_RESOURCETYPE_H

#include "libholocron.h"

#include <QString>
#include <QList>

namespace holocron {

/**
 * Type of a resource. Each type has a fixed numeric code (as stored in the
 * archive tables) and a file name extension (as used for loose files).
 *
 * @ingroup resource
 */
class HOLOCRON_PUBLIC ResourceType
{
public:
    /// Numeric type codes.
    enum Id {
        Invalid = -1,
        RES     = 0,
        BMP     = 1,
        MVE     = 2,
        TGA     = 3,
        WAV     = 4,
        PLT     = 6,
        INI     = 7,
        MP3     = 8,
        MPG     = 9,
        TXT     = 10,
        WMA     = 11,
        WMV     = 12,
        XMV     = 13,
        PLH     = 2000,
        TEX     = 2001,
        MDL     = 2002,
        THG     = 2003,
        FNT     = 2005,
        LUA     = 2007,
        SLT     = 2008,
        NSS     = 2009,
        NCS     = 2010,
        MOD     = 2011,
        ARE     = 2012,
        SET     = 2013,
        IFO     = 2014,
        BIC     = 2015,
        WOK     = 2016,
        TwoDA   = 2017,
        TLK     = 2018,
        TXI     = 2022,
        GIT     = 2023,
        BTI     = 2024,
        UTI     = 2025,
        BTC     = 2026,
        UTC     = 2027,
        DLG     = 2029,
        ITP     = 2030,
        BTT     = 2031,
        UTT     = 2032,
        DDS     = 2033,
        BTS     = 2034,
        UTS     = 2035,
        LTR     = 2036,
        GFF     = 2037,
        FAC     = 2038,
        BTE     = 2039,
        UTE     = 2040,
        BTD     = 2041,
        UTD     = 2042,
        BTP     = 2043,
        UTP     = 2044,
        DFT     = 2045,
        GIC     = 2046,
        GUI     = 2047,
        CSS     = 2048,
        CCS     = 2049,
        BTM     = 2050,
        UTM     = 2051,
        DWK     = 2052,
        PWK     = 2053,
        BTG     = 2054,
        UTG     = 2055,
        JRL     = 2056,
        SAV     = 2057,
        UTW     = 2058,
        FourPC  = 2059,
        SSF     = 2060,
        HAK     = 2061,
        NWM     = 2062,
        BIK     = 2063,
        NDB     = 2064,
        PTM     = 2065,
        PTT     = 2066,
        LYT     = 3000,
        VIS     = 3001,
        RIM     = 3002,
        PTH     = 3003,
        LIP     = 3004,
        BWM     = 3005,
        TXB     = 3006,
        TPC     = 3007,
        MDX     = 3008,
        RSV     = 3009,
        SIG     = 3010,
        MAB     = 3011,
        QST2    = 3012,
        STO     = 3013,
        HEX     = 3015,
        MDX2    = 3016,
        TXB2    = 3017,
        FSM     = 3022,
        ART     = 3023,
        AMP     = 3024,
        CWA     = 3025,
        BIP     = 3028,
        ERF     = 9997,
        BIF     = 9998,
        KEY     = 9999
    };

    /// Broad classification of the content.
    enum Category {
        UnknownCategory,
        Archive,
        Audio,
        Gff,
        Model,
        Script,
        Talk,
        Text,
        Texture,
        Video,
        Walkmesh
    };

public:
    ResourceType(Id id = Invalid);

    Id id() const { return _id; }

    bool isValid() const { return _id != Invalid; }

    /// File name extension without the dot, in lower case (e.g. "utc").
    QString extension() const;

    Category category() const;

    /// @return @c true if this is one of the payload types of textures
    /// (TPC, TGA or the TXI sidecar).
    bool isTexturePayload() const;

    bool operator == (ResourceType const &other) const { return _id == other._id; }
    bool operator != (ResourceType const &other) const { return _id != other._id; }
    bool operator == (Id id) const { return _id == id; }
    bool operator != (Id id) const { return _id != id; }

    /// Textual representation, e.g. "UTC" (or "INVALID").
    QString asText() const;

public:
    /**
     * Looks up a type by its numeric code.
     *
     * @return Type, or an invalid type if the code is not known.
     */
    static ResourceType fromId(int code);

    /**
     * Looks up a type by its file name extension. The leading dot is
     * optional and case is ignored.
     *
     * @return Type, or an invalid type if the extension is not known.
     */
    static ResourceType fromExtension(QString const &extension);

    /// All known (valid) types.
    static QList<ResourceType> all();

private:
    Id _id;
};

inline uint qHash(ResourceType const &type) { return uint(type.id()); }

} // namespace holocron

#endif // LIBHOLOCRON_RESOURCETYPE_H
