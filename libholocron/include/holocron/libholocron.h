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

#ifndef LIBHOLOCRON_H
#define LIBHOLOCRON_H

/**
 * @file libholocron.h  Common definitions for libholocron.
 */

/**
 * @defgroup core  Core
 *
 * @defgroup fs  File System
 * Readers for the archive formats and the loose-file directories of an
 * installation.
 *
 * @defgroup resource  Resources
 * Resource identifiers and the layered resource store.
 */

#include <QtCore/qglobal.h>

#if (QT_VERSION < QT_VERSION_CHECK(5, 0, 0))
#  error "Unsupported version of Qt"
#endif

/*
 * The HOLOCRON_PUBLIC macro is used for declaring exported symbols. It must
 * be applied in all exported classes and functions.
 */
#if defined(_WIN32) && defined(_MSC_VER)
#  ifdef __HOLOCRON__
// This is defined when compiling the library.
#    define HOLOCRON_PUBLIC __declspec(dllexport)
#  else
#    define HOLOCRON_PUBLIC __declspec(dllimport)
#  endif
#else
#  define HOLOCRON_PUBLIC
#endif

#ifndef NDEBUG
#  define HOLOCRON_DEBUG
#  define HOLOCRON_ASSERT(x) Q_ASSERT(x)
#  define HOLOCRON_DEBUG_ONLY(x) x
#else
#  define HOLOCRON_ASSERT(x)
#  define HOLOCRON_DEBUG_ONLY(x)
#endif

/**
 * Macro for iterating through an STL or Qt container.
 *
 * @param IterClass     Class being iterated.
 * @param Iter          Name/declaration of the iterator variable.
 * @param ContainerRef  Container.
 */
#define HOLOCRON_FOR_EACH_CONST(IterClass, Iter, ContainerRef) \
    for(IterClass::const_iterator Iter = (ContainerRef).begin(); Iter != (ContainerRef).end(); ++Iter)

#define HOLOCRON_NO_ASSIGN(ClassName) \
    private: ClassName &operator = (ClassName const &);

#define HOLOCRON_NO_COPY(ClassName) \
    private: ClassName(ClassName const &);

/**
 * Macro for starting the definition of a private implementation struct. The
 * struct holds a reference to the public instance, which must be specified in
 * the call to the base class constructor. @see holocron::Private
 *
 * Example:
 * <pre>
 *    HOLOCRON_PIMPL(MyClass)
 *    {
 *        Instance(Public *i) : Base(i) {
 *            // constructor
 *        }
 *        // private data and methods
 *    };
 * </pre>
 */
#define HOLOCRON_PIMPL(ClassName) \
    typedef ClassName Public; \
    struct ClassName::Instance : public holocron::Private<ClassName>

/**
 * Macro for starting the definition of a private implementation struct without
 * a reference to the public instance. This is useful for simpler classes where
 * the private implementation mostly holds member variables.
 */
#define HOLOCRON_PIMPL_NOREF(ClassName) \
    struct ClassName::Instance : public holocron::IPrivate

/**
 * Macro for publicly declaring a pointer to the private implementation.
 * holocron::PrivateAutoPtr owns the private instance and will automatically
 * delete it when the PrivateAutoPtr is destroyed.
 */
#define HOLOCRON_PRIVATE(Var) \
    struct Instance; \
    holocron::PrivateAutoPtr<Instance> Var;

namespace holocron {

/**
 * Interface for all private instance implementation structs.
 * In a debug build, also contains a verification code that can be used
 * to assert whether the pointed object really is derived from IPrivate.
 */
struct IPrivate {
    virtual ~IPrivate() {}
#ifdef HOLOCRON_DEBUG
    unsigned int _privateInstVerification;
#define HOLOCRON_IPRIVATE_VERIFICATION 0xdeadbeef
    IPrivate() : _privateInstVerification(HOLOCRON_IPRIVATE_VERIFICATION) {}
    unsigned int privateInstVerification() const { return _privateInstVerification; }
#endif
};

/**
 * Pointer to the private implementation. The pointed/owned instance must be
 * derived from holocron::IPrivate.
 */
template <typename InstType>
class PrivateAutoPtr
{
    HOLOCRON_NO_COPY  (PrivateAutoPtr)
    HOLOCRON_NO_ASSIGN(PrivateAutoPtr)

public:
    PrivateAutoPtr(InstType *p = 0) : ptr(p) {}
    ~PrivateAutoPtr() { reset(); }

    InstType &operator * () const { return *ptr; }
    InstType *operator -> () const { return ptr; }
    void reset(InstType *p = 0) {
        IPrivate *ip = reinterpret_cast<IPrivate *>(ptr);
        if(ip)
        {
            HOLOCRON_ASSERT(ip->privateInstVerification() == HOLOCRON_IPRIVATE_VERIFICATION);
            delete ip;
        }
        ptr = p;
    }
    InstType *get() const {
        return ptr;
    }
    operator InstType *() const {
        return ptr;
    }
    bool isNull() const {
        return !ptr;
    }

private:
    InstType *ptr;
};

/**
 * Utility template for defining private implementation data (pimpl idiom). Use
 * this in source files, not in headers.
 */
template <typename PublicType>
struct Private : public IPrivate {
    PublicType &self;
    PublicType *thisPublic;
    typedef Private<PublicType> Base;

    Private(PublicType &i) : self(i), thisPublic(&i) {}
    Private(PublicType *i) : self(*i), thisPublic(i) {}
};

//@{
/// @ingroup types
typedef quint8  dbyte;
typedef quint16 duint16;
typedef quint32 duint32;
typedef quint64 duint64;
typedef float   dfloat;
//@}

} // namespace holocron

#endif // LIBHOLOCRON_H
