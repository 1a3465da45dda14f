/**
 * @file searchlocation.cpp
 * Categories of resource locations in an installation. @ingroup resource
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

#include "holocron/searchlocation.h"

#include <QStringList>

namespace holocron {

static char const *locationNames[SEARCHLOCATION_COUNT] = {
    "override",
    "modules",
    "chitin",
    "textures_tpa",
    "textures_tpb",
    "textures_tpc",
    "textures_gui",
    "music",
    "sound",
    "voice",
    "lips",
    "rims",
    "custom_modules",
    "custom_folders"
};

QString searchLocationName(SearchLocation location)
{
    if(location < 0 || location >= SEARCHLOCATION_COUNT) return "";
    return locationNames[location];
}

SearchLocation searchLocationFromText(QString const &text)
{
    QString const name = text.trimmed();
    for(int i = 0; i < SEARCHLOCATION_COUNT; ++i)
    {
        if(!name.compare(locationNames[i], Qt::CaseInsensitive))
            return SearchLocation(i);
    }
    throw UnknownSearchLocationError("searchLocationFromText",
                                     QString("\"%1\" is not a search location").arg(text));
}

SearchOrder searchOrderFromText(QString const &text)
{
    SearchOrder order;
    foreach(QString item, text.split(',', QString::SkipEmptyParts))
    {
        if(item.trimmed().isEmpty()) continue;
        order << searchLocationFromText(item);
    }
    return order;
}

QString searchOrderToText(SearchOrder const &order)
{
    QStringList names;
    foreach(SearchLocation loc, order)
    {
        names << searchLocationName(loc);
    }
    return names.join(",");
}

QString texturePackFileName(SearchLocation location)
{
    switch(location)
    {
    case SL_TEXTURES_TPA: return "swpc_tex_tpa.erf";
    case SL_TEXTURES_TPB: return "swpc_tex_tpb.erf";
    case SL_TEXTURES_TPC: return "swpc_tex_tpc.erf";
    case SL_TEXTURES_GUI: return "swpc_tex_gui.erf";
    default:              return "";
    }
}

SearchOrder defaultSearchOrder()
{
    return SearchOrder() << SL_CUSTOM_FOLDERS << SL_OVERRIDE << SL_CUSTOM_MODULES << SL_MODULES << SL_CHITIN;
}

SearchOrder defaultTextureSearchOrder()
{
    return SearchOrder() << SL_CUSTOM_FOLDERS << SL_OVERRIDE << SL_CUSTOM_MODULES << SL_TEXTURES_TPA << SL_CHITIN;
}

SearchOrder defaultSoundSearchOrder()
{
    return SearchOrder() << SL_CUSTOM_FOLDERS << SL_OVERRIDE << SL_CUSTOM_MODULES << SL_SOUND << SL_CHITIN;
}

} // namespace holocron
