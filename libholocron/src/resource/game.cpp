/**
 * @file game.cpp
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

#include "holocron/game.h"
#include "holocron/fs_util.h"
#include "holocron/log.h"

namespace holocron {

static char const *gameNames[GAME_COUNT] = {
    "UNKNOWN",
    "K1",
    "K2",
    "K1_XBOX",
    "K2_XBOX",
    "K1_IOS",
    "K2_IOS",
    "K1_ANDROID",
    "K2_ANDROID"
};

static char const *k1Checklist[] = {
    "streamwaves/",
    "swkotor.exe",
    "swkotor.ini",
    "rims/",
    "utils/",
    "32370_install.vdf",
    "miles/mssds3d.m3d",
    "miles/msssoft.m3d",
    "data/party.bif",
    "data/player.bif",
    "modules/global.mod",
    "modules/legal.mod",
    "modules/mainmenu.mod",
    0
};

static char const *k2Checklist[] = {
    "streamvoice/",
    "swkotor2.exe",
    "swkotor2.ini",
    "LocalVault/",
    "LocalVault/test.bic",
    "LocalVault/testold.bic",
    "miles/binkawin.asi",
    "miles/mssds3d.flt",
    "miles/mssdolby.flt",
    "miles/mssogg.asi",
    "data/Dialogs.bif",
    0
};

static char const *k1IosChecklist[] = {
    "override/ios_action_bg.tga",
    "override/ios_action_bg2.tga",
    "override/ios_action_x.tga",
    "override/ios_action_x2.tga",
    "override/ios_button_a.tga",
    "override/ios_button_x.tga",
    "override/ios_button_y.tga",
    "override/ios_edit_box.tga",
    "override/ios_enemy_plus.tga",
    "override/ios_gpad_bg.tga",
    "override/ios_gpad_gen.tga",
    "override/ios_gpad_help.tga",
    "override/ios_gpad_map.tga",
    "override/ios_gpad_save.tga",
    "KOTOR",
    "KOTOR.entitlements",
    "streamwaves/globe/",
    0
};

static char const *k2IosChecklist[] = {
    "override/ios_mfi_deu.tga",
    "override/ios_mfi_eng.tga",
    "override/ios_mfi_esp.tga",
    "override/ios_mfi_fre.tga",
    "override/ios_mfi_ita.tga",
    "override/ios_self_box_r.tga",
    "override/ios_self_expand2.tga",
    "override/ipho_forfeit.tga",
    "override/ipho_forfeit2.tga",
    "override/kotor2logon.tga",
    "override/lbl_miscroll_open_f.tga",
    "override/lbl_miscroll_open_f2.tga",
    "override/ydialog.gui",
    "KOTOR II",
    "KOTOR II.entitlements",
    0
};

static char const *k1AndroidChecklist[] = {
    "lib/arm64-v8a/libkotor.so",
    "lib/armeabi-v7a/libkotor.so",
    "assets/",
    "streamwaves/",
    "override/android_button_a.tga",
    "override/android_gpad_bg.tga",
    0
};

static char const *k2AndroidChecklist[] = {
    "lib/arm64-v8a/libkotor2.so",
    "lib/armeabi-v7a/libkotor2.so",
    "assets/",
    "streamvoice/",
    "override/android_mfi_eng.tga",
    "override/android_self_box_r.tga",
    0
};

static char const *emptyChecklist[] = { 0 };

static char const **checklistFor(Game game)
{
    switch(game)
    {
    case GAME_K1:         return k1Checklist;
    case GAME_K2:         return k2Checklist;
    case GAME_K1_IOS:     return k1IosChecklist;
    case GAME_K2_IOS:     return k2IosChecklist;
    case GAME_K1_ANDROID: return k1AndroidChecklist;
    case GAME_K2_ANDROID: return k2AndroidChecklist;

    // No probes are known for the console releases.
    case GAME_K1_XBOX:
    case GAME_K2_XBOX:
    default:
        return emptyChecklist;
    }
}

QString gameName(Game game)
{
    if(game < 0 || game >= GAME_COUNT) return gameNames[GAME_UNKNOWN];
    return gameNames[game];
}

bool isK1(Game game)
{
    return game == GAME_K1 || game == GAME_K1_XBOX || game == GAME_K1_IOS || game == GAME_K1_ANDROID;
}

bool isK2(Game game)
{
    return game == GAME_K2 || game == GAME_K2_XBOX || game == GAME_K2_IOS || game == GAME_K2_ANDROID;
}

QStringList gameChecklist(Game game)
{
    QStringList list;
    for(char const **probe = checklistFor(game); *probe; ++probe)
    {
        list << QString::fromLatin1(*probe);
    }
    return list;
}

static bool probeExists(QString const &rootPath, QString const &probe)
{
    if(probe.endsWith('/'))
    {
        return !F_ResolveCaseInsensitive(rootPath, probe, DirectoryEntry).isEmpty();
    }
    return !F_ResolveCaseInsensitive(rootPath, probe, AnyEntry).isEmpty();
}

Game identifyGame(QString const &rootPath, GameScores *scores)
{
    LOG_AS("identifyGame");

    Game best = GAME_UNKNOWN;
    int bestScore = 0;
    bool tied = false;

    for(int i = GAME_UNKNOWN + 1; i < GAME_COUNT; ++i)
    {
        Game const game = Game(i);

        int score = 0;
        foreach(QString const &probe, gameChecklist(game))
        {
            if(probeExists(rootPath, probe)) score++;
        }
        if(scores) scores->insert(game, score);

        LOG_TRACE("%s scored %i") << gameName(game) << score;

        if(score > bestScore)
        {
            best = game;
            bestScore = score;
            tied = false;
        }
        else if(score == bestScore && score > 0)
        {
            tied = true;
        }
    }

    if(tied || !bestScore)
    {
        LOG_DEBUG("Could not identify the game at \"%s\".") << F_PrettyPath(rootPath);
        return GAME_UNKNOWN;
    }
    return best;
}

} // namespace holocron
