/**
 * @file searchlocation.h
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

#ifndef LIBHOLOCRON_SEARCHLOCATION_H
#define LIBHOLOCRON_SEARCHLOCATION_H

#include "error.h"

#include <QList>
#include <QString>

namespace holocron {

/**
 * Category of resource location. Each category corresponds to one physical
 * source in an installation, except the two caller-supplied categories
 * SL_CUSTOM_MODULES and SL_CUSTOM_FOLDERS, which are never cached.
 *
 * @ingroup resource
 */
enum SearchLocation {
    SL_OVERRIDE,        ///< Loose files of the override directory and its subdirectories.
    SL_MODULES,         ///< Capsules of the modules directory.
    SL_CHITIN,          ///< Blobs indexed by the key file (plus the core patch capsule).
    SL_TEXTURES_TPA,    ///< Texture pack swpc_tex_tpa.erf.
    SL_TEXTURES_TPB,    ///< Texture pack swpc_tex_tpb.erf.
    SL_TEXTURES_TPC,    ///< Texture pack swpc_tex_tpc.erf.
    SL_TEXTURES_GUI,    ///< Texture pack swpc_tex_gui.erf.
    SL_MUSIC,           ///< Loose files of the music stream directory.
    SL_SOUND,           ///< Loose files of the sound stream directory.
    SL_VOICE,           ///< Loose files of the voice stream directory (recursive).
    SL_LIPS,            ///< Capsules of the lips directory.
    SL_RIMS,            ///< Capsules of the rims directory.
    SL_CUSTOM_MODULES,  ///< Capsules supplied with the query.
    SL_CUSTOM_FOLDERS,  ///< Directories supplied with the query.

    SEARCHLOCATION_COUNT
};

/// Priority order for one query, highest priority first.
typedef QList<SearchLocation> SearchOrder;

/// The text could not be parsed as a search location. @ingroup errors
HOLOCRON_ERROR(UnknownSearchLocationError);

/// Textual name of a location, e.g. "override" or "textures_tpa".
HOLOCRON_PUBLIC QString searchLocationName(SearchLocation location);

/**
 * Parses a location name, ignoring case.
 *
 * @throws UnknownSearchLocationError  @a text is not a location name.
 */
HOLOCRON_PUBLIC SearchLocation searchLocationFromText(QString const &text);

/**
 * Parses a comma-separated list of location names.
 *
 * @throws UnknownSearchLocationError  Some item is not a location name.
 */
HOLOCRON_PUBLIC SearchOrder searchOrderFromText(QString const &text);

HOLOCRON_PUBLIC QString searchOrderToText(SearchOrder const &order);

/**
 * File name of the texture pack capsule of a texture location, or an empty
 * string for other locations.
 */
HOLOCRON_PUBLIC QString texturePackFileName(SearchLocation location);

/// Default order for locating and reading resources: custom folders,
/// override, custom modules, modules, chitin.
HOLOCRON_PUBLIC SearchOrder defaultSearchOrder();

/// Default order for textures: custom folders, override, custom modules,
/// texture pack A, chitin.
HOLOCRON_PUBLIC SearchOrder defaultTextureSearchOrder();

/// Default order for sounds: custom folders, override, custom modules,
/// sound, chitin.
HOLOCRON_PUBLIC SearchOrder defaultSoundSearchOrder();

} // namespace holocron

#endif // LIBHOLOCRON_SEARCHLOCATION_H
