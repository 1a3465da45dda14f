/*
 * The Holocron Project -- libholocron
 *
 * Copyright (c) 2013 The Holocron Authors
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, see <http://www.gnu.org/licenses/>.
 */

#ifndef LIBHOLOCRON_ERROR_H
#define LIBHOLOCRON_ERROR_H

#include "libholocron.h"

#include <QString>
#include <stdexcept>
#include <string>

/**
 * @defgroup errors Exceptions
 *
 * These are exceptions thrown by libholocron when a fatal error occurs.
 */

namespace holocron {

/**
 * Base class for error exceptions thrown by libholocron.
 */
class HOLOCRON_PUBLIC Error : public std::runtime_error
{
public:
    Error(QString const &where, QString const &message);
    ~Error() throw();

    virtual void raise() const { throw *this; }

    QString name() const;
    virtual QString asText() const;

protected:
    void setName(QString const &name);

private:
    std::string _name;
};

} // namespace holocron

/**
 * Macro for defining an exception class that belongs to a parent group of
 * exceptions.  This should be used so that whoever uses the class
 * that throws an exception is able to choose the level of generality
 * of the caught errors.
 */
#define HOLOCRON_SUB_ERROR(Parent, Name) \
    class Name : public Parent { \
    public: \
        Name(QString const &message) \
            : Parent("-", message) { Parent::setName(#Name); } \
        Name(QString const &where, QString const &message) \
            : Parent(where, message) { Parent::setName(#Name); } \
        virtual void raise() const { throw *this; } \
    } /**< @note One must put a semicolon after the macro invocation. */

/**
 * Define a top-level exception class.
 * @note One must put a semicolon after the macro invocation.
 */
#define HOLOCRON_ERROR(Name) HOLOCRON_SUB_ERROR(holocron::Error, Name)

#endif // LIBHOLOCRON_ERROR_H
