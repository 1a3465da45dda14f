/**
 * @file installationresolver.cpp
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

#include "holocron/installationresolver.h"
#include "holocron/fs_util.h"
#include "holocron/log.h"
#include "holocron/module.h"

namespace holocron {

QString ResolvedLocation::tierName(Tier tier)
{
    switch(tier)
    {
    case OverrideTier:  return "Override";
    case ModuleTier:    return "Modules (.mod)";
    case CompositeTier: return "Modules (.rim/_s.rim/_dlg.erf)";
    case ChitinTier:    return "Chitin";
    default:
        return "Not found";
    }
}

HOLOCRON_PIMPL_NOREF(InstallationResolver)
{
    Installations stores;

    Instance(Installations const &_stores) : stores(_stores) {}
};

InstallationResolver::InstallationResolver(Installations const &stores)
    : d(new Instance(stores))
{}

InstallationResolver::~InstallationResolver()
{}

InstallationResolver::Installations const &InstallationResolver::installations() const
{
    return d->stores;
}

ResolvedLocation InstallationResolver::resolveIn(Installation &store, ResourceIdentifier const &id,
                                                 int storeIndex)
{
    SearchOrder const order = SearchOrder() << SL_OVERRIDE << SL_MODULES << SL_CHITIN;
    LocationResults const found = store.locations(ResourceIdentifiers() << id, order).value(id);

    ResolvedLocation resolved(storeIndex);

    LocationResult const *composite = 0;
    LocationResult const *chitin = 0;
    for(int i = 0; i < found.size(); ++i)
    {
        LocationResult const &loc = found.at(i);
        switch(loc.location)
        {
        case SL_OVERRIDE:
            // Nothing outranks the override directory.
            resolved.tier = ResolvedLocation::OverrideTier;
            resolved.location = loc;
            return resolved;

        case SL_MODULES:
            if(moduleForm(loc.path()) == ModForm)
            {
                resolved.tier = ResolvedLocation::ModuleTier;
                resolved.location = loc;
                return resolved;
            }
            if(!composite) composite = &loc;
            break;

        case SL_CHITIN:
            if(!chitin) chitin = &loc;
            break;

        default:
            break;
        }
    }

    if(composite)
    {
        resolved.tier = ResolvedLocation::CompositeTier;
        resolved.location = *composite;
    }
    else if(chitin)
    {
        resolved.tier = ResolvedLocation::ChitinTier;
        resolved.location = *chitin;
    }
    return resolved;
}

ResolvedLocations InstallationResolver::resolve(ResourceIdentifier const &id)
{
    LOG_AS("InstallationResolver");

    ResolvedLocations results;
    for(int i = 0; i < d->stores.size(); ++i)
    {
        ResolvedLocation const resolved = resolveIn(*d->stores.at(i), id, i);
        if(resolved.isNull())
        {
            LOG_DEBUG("\"%s\" not found in \"%s\".")
                    << id.fileName() << F_PrettyPath(d->stores.at(i)->path());
        }
        else
        {
            LOG_VERBOSE("\"%s\" resolves to %s: \"%s\".")
                    << id.fileName() << ResolvedLocation::tierName(resolved.tier)
                    << F_RelativePath(d->stores.at(i)->path(), resolved.location.path());
        }
        results << resolved;
    }
    return results;
}

bool InstallationResolver::differing(ResourceIdentifier const &id)
{
    ResolvedLocations const resolved = resolve(id);
    if(resolved.size() < 2) return false;

    bool const firstFound = !resolved.first().isNull();
    QByteArray const firstData = firstFound? resolved.first().location.resource.data() : QByteArray();

    for(int i = 1; i < resolved.size(); ++i)
    {
        ResolvedLocation const &other = resolved.at(i);
        if(other.isNull() != !firstFound) return true;
        if(other.isNull()) continue;

        if(other.location.size() != resolved.first().location.size()) return true;
        if(other.location.resource.data() != firstData) return true;
    }
    return false;
}

} // namespace holocron
