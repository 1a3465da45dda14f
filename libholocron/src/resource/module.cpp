/**
 * @file module.cpp
 * Module capsule naming conventions. @ingroup resource
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

#include "holocron/module.h"

#include <QFileInfo>

namespace holocron {

QString moduleRoot(QString const &fileName)
{
    QString root = QFileInfo(fileName).fileName().toLower();

    int const dot = root.lastIndexOf('.');
    if(dot >= 0) root.truncate(dot);

    if(root.endsWith("_s"))   root.chop(2);
    if(root.endsWith("_dlg")) root.chop(4);
    return root;
}

ModuleForm moduleForm(QString const &fileName)
{
    QString const name = QFileInfo(fileName).fileName().toLower();

    if(name.endsWith("_s.rim"))   return StaticRimForm;
    if(name.endsWith("_dlg.erf")) return DialogErfForm;
    if(name.endsWith(".mod"))     return ModForm;
    if(name.endsWith(".rim"))     return RimForm;
    return OtherForm;
}

QString moduleFormName(ModuleForm form)
{
    switch(form)
    {
    case ModForm:       return ".mod";
    case RimForm:       return ".rim";
    case StaticRimForm: return "_s.rim";
    case DialogErfForm: return "_dlg.erf";
    default:
        return "other";
    }
}

} // namespace holocron
