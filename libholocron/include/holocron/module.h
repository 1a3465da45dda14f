/**
 * @file module.h
 * Module capsule naming conventions. @ingroup resource
 *
 * A module (one game area) may be shipped as several capsules in the
 * modules directory: a primary container, a static companion and a dialog
 * companion. All of them share the same module root name.
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

#ifndef LIBHOLOCRON_MODULE_H
#define LIBHOLOCRON_MODULE_H

#include "libholocron.h"

#include <QString>

namespace holocron {

/**
 * Physical form of a module capsule. The values are in priority order:
 * when several capsules of the same module claim a resource, the one with
 * the lowest form value answers.
 */
enum ModuleForm {
    ModForm,            ///< "<root>.mod": the primary mutable container.
    RimForm,            ///< "<root>.rim": the primary immutable container.
    StaticRimForm,      ///< "<root>_s.rim"
    DialogErfForm,      ///< "<root>_dlg.erf"
    OtherForm,

    MODULEFORM_COUNT
};

/**
 * Determines the module root of a capsule file name: the lowercase stem with
 * a trailing "_s" and then a trailing "_dlg" removed. For example
 * "M01AA_s.rim" and "m01aa_dlg.erf" both have the root "m01aa".
 *
 * @param fileName  File name or path of the capsule.
 */
HOLOCRON_PUBLIC QString moduleRoot(QString const &fileName);

/// Classifies a capsule file name.
HOLOCRON_PUBLIC ModuleForm moduleForm(QString const &fileName);

/// Textual name of a form, e.g. "_s.rim".
HOLOCRON_PUBLIC QString moduleFormName(ModuleForm form);

} // namespace holocron

#endif // LIBHOLOCRON_MODULE_H
