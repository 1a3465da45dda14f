/**
 * @file main.cpp
 * Command line tool that shows where an installation loads a resource from.
 *
 * Usage: holocron-locate <root> <name.ext> [--order a,b,...] [--explain]
 *                        [--compare <root2>]
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

#include <holocron/error.h>
#include <holocron/fs_util.h>
#include <holocron/installation.h>
#include <holocron/installationresolver.h>
#include <holocron/log.h>
#include <holocron/logbuffer.h>
#include <holocron/storesettings.h>

#include <QCoreApplication>
#include <QStringList>
#include <QTextStream>

using namespace holocron;

static void usage(QTextStream &out)
{
    out << "Usage: holocron-locate <root> <name.ext> [--order a,b,...] [--explain] "
           "[--compare <root2>]\n"
        << "Categories: override, modules, chitin, textures_tpa, textures_tpb, textures_tpc,\n"
        << "            textures_gui, music, sound, voice, lips, rims\n";
}

static void printLocations(QTextStream &out, Installation &inst, ResourceIdentifier const &id,
                           SearchOrder const &order, bool explain)
{
    SearchExtras extras;
    extras.explain = explain;

    LocationResults const found = inst.location(id.name(), id.type(), order, extras);

    out << id.fileName() << " in " << F_PrettyPath(inst.path()) << ":\n";
    if(found.isEmpty())
    {
        out << "  not found\n";
        return;
    }
    for(int i = 0; i < found.size(); ++i)
    {
        LocationResult const &loc = found.at(i);
        out << "  " << (i == 0? "* " : "  ")
            << searchLocationName(loc.location) << ": "
            << F_RelativePath(inst.path(), loc.path())
            << " [offset " << loc.offset() << ", size " << loc.size() << "]\n";
    }
}

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("Holocron");
    QCoreApplication::setApplicationName("holocron-locate");

    QTextStream out(stdout);
    QList<Installation *> others;
    int result = 0;

    try
    {
        StoreSettings settings;

        LogBuffer::appBuffer().enable(settings.logLevel());
        LogBuffer::appBuffer().enableStandardOutput();

        SearchOrder order = settings.searchOrder();
        bool explain = settings.explain();
        QStringList compareWith;
        QStringList positional;

        QStringList const args = app.arguments();
        for(int i = 1; i < args.size(); ++i)
        {
            QString const &arg = args.at(i);
            if(arg == "--order" && i + 1 < args.size())
            {
                order = searchOrderFromText(args.at(++i));
            }
            else if(arg == "--explain")
            {
                explain = true;
            }
            else if(arg == "--compare" && i + 1 < args.size())
            {
                compareWith << args.at(++i);
            }
            else if(arg == "-h" || arg == "--help")
            {
                usage(out);
                return 0;
            }
            else
            {
                positional << arg;
            }
        }

        if(positional.size() == 1 && !settings.installationPath().isEmpty())
        {
            positional.prepend(settings.installationPath());
        }
        if(positional.size() != 2)
        {
            usage(out);
            return 1;
        }
        if(compareWith.isEmpty()) compareWith = settings.secondaryPaths();

        ResourceIdentifier const id = ResourceIdentifier::fromPath(positional.at(1));
        if(!id.isValid())
        {
            LOG_ERROR("\"%s\" does not have a known resource type.") << positional.at(1);
            return 1;
        }

        Installation primary(positional.at(0));
        printLocations(out, primary, id, order, explain);

        if(!compareWith.isEmpty())
        {
            foreach(QString const &path, compareWith)
            {
                others << new Installation(path);
            }

            InstallationResolver::Installations stores;
            stores << &primary << others;

            InstallationResolver resolver(stores);
            ResolvedLocations const resolved = resolver.resolve(id);

            out << "Resolved:\n";
            foreach(ResolvedLocation const &loc, resolved)
            {
                Installation const *inst = stores.at(loc.store);
                out << "  " << F_PrettyPath(inst->path()) << ": "
                    << ResolvedLocation::tierName(loc.tier);
                if(!loc.isNull())
                {
                    out << " (" << F_RelativePath(inst->path(), loc.location.path()) << ")";
                }
                out << "\n";
            }
            out << (resolver.differing(id)? "The resolved copies differ.\n"
                                          : "The resolved copies are identical.\n");
        }
    }
    catch(Error const &er)
    {
        out.flush();
        QTextStream(stderr) << er.asText() << "\n";
        result = 1;
    }

    qDeleteAll(others);
    return result;
}
