/**
 * @file game.h
 * Game variants and their identification. @ingroup resource
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

#ifndef LIBHOLOCRON_GAME_H
#define LIBHOLOCRON_GAME_H

#include "libholocron.h"

#include <QString>
#include <QStringList>
#include <QMap>

namespace holocron {

/**
 * Product variant of an installation. The first title of the series is
 * "K1" and the second "K2".
 */
enum Game {
    GAME_UNKNOWN,

    GAME_K1,            ///< Desktop release of the first title.
    GAME_K2,            ///< Desktop release of the second title.
    GAME_K1_XBOX,
    GAME_K2_XBOX,
    GAME_K1_IOS,
    GAME_K2_IOS,
    GAME_K1_ANDROID,
    GAME_K2_ANDROID,

    GAME_COUNT
};

/// Name of the variant, e.g. "K1" or "K2_IOS".
HOLOCRON_PUBLIC QString gameName(Game game);

/// @return @c true if @a game is a variant of the first title.
HOLOCRON_PUBLIC bool isK1(Game game);

/// @return @c true if @a game is a variant of the second title.
HOLOCRON_PUBLIC bool isK2(Game game);

/// Score of each variant, as computed by identifyGame().
typedef QMap<Game, int> GameScores;

/**
 * Existence probes of a variant: paths relative to the installation root.
 * A trailing '/' marks a directory probe.
 */
HOLOCRON_PUBLIC QStringList gameChecklist(Game game);

/**
 * Identifies the variant installed at @a rootPath. Every probe of each
 * variant's checklist that exists (case insensitively) adds one to that
 * variant's score. Only existence is checked; no file is read.
 *
 * @param rootPath  Installation root directory.
 * @param scores    If not @c NULL, the scores are written here.
 *
 * @return The variant with the strictly highest score, or GAME_UNKNOWN if
 * the highest score is shared or zero.
 */
HOLOCRON_PUBLIC Game identifyGame(QString const &rootPath, GameScores *scores = 0);

} // namespace holocron

#endif // LIBHOLOCRON_GAME_H
