/**
 * @file installationresolver.h
 * Side-by-side resolution of resources in several installations. @ingroup resource
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

#ifndef LIBHOLOCRON_INSTALLATIONRESOLVER_H
#define LIBHOLOCRON_INSTALLATIONRESOLVER_H

#include "installation.h"

#include <QList>

namespace holocron {

/**
 * Location from which the game itself would load a resource.
 */
struct HOLOCRON_PUBLIC ResolvedLocation
{
    /// Resolution tiers, highest priority first.
    enum Tier {
        NoTier,             ///< Not found.
        OverrideTier,
        ModuleTier,         ///< A .mod capsule.
        CompositeTier,      ///< A .rim, _s.rim or _dlg.erf capsule.
        ChitinTier
    };

    int store;              ///< Index of the installation.
    Tier tier;
    LocationResult location;

    ResolvedLocation(int storeIndex = -1) : store(storeIndex), tier(NoTier) {}

    bool isNull() const { return tier == NoTier; }

    /// Human-readable name of a tier, e.g. "Modules (.mod)".
    static QString tierName(Tier tier);
};

typedef QList<ResolvedLocation> ResolvedLocations;

/**
 * Picks, in each of several installations, the single location a resource
 * is loaded from: override, then .mod capsules, then the other module
 * capsules (after module grouping), then chitin. The stream and texture
 * pack directories do not take part.
 */
class HOLOCRON_PUBLIC InstallationResolver
{
public:
    typedef QList<Installation *> Installations;

public:
    /**
     * @param stores  Installations to compare. Not owned.
     */
    InstallationResolver(Installations const &stores);
    ~InstallationResolver();

    Installations const &installations() const;

    /**
     * @return One entry per installation, in the same order. The entry is
     * null if the installation does not have the resource.
     */
    ResolvedLocations resolve(ResourceIdentifier const &id);

    /// Resolves @a id in one installation only.
    static ResolvedLocation resolveIn(Installation &store, ResourceIdentifier const &id,
                                      int storeIndex = 0);

    /**
     * Determines whether the resolved copies of @a id differ between the
     * installations, either in presence or in content.
     *
     * @throws FileResource::ReadError  A resolved copy could not be read.
     */
    bool differing(ResourceIdentifier const &id);

private:
    HOLOCRON_PRIVATE(d)
};

} // namespace holocron

#endif // LIBHOLOCRON_INSTALLATIONRESOLVER_H
