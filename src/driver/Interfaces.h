/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Interfaces.h
 *	DESCRIPTION:	Ownership and version checks of native interfaces.
 *
 *  The contents of this file are subject to the Initial
 *  Developer's Public License Version 1.0 (the "License");
 *  you may not use this file except in compliance with the
 *  License. You may obtain a copy of the License at
 *  http://www.ibphoenix.com/main.nfs?a=ibphoenix&page=ibp_idpl.
 *
 *  Software distributed under the License is distributed AS IS,
 *  WITHOUT WARRANTY OF ANY KIND, either express or implied.
 *  See the License for the specific language governing rights
 *  and limitations under the License.
 *
 *  The Original Code was created by the fbdriver contributors
 *  for the Firebird Open Source RDBMS project.
 *
 *  All Rights Reserved.
 *  Contributor(s): ______________________________________.
 */

#ifndef FBDRIVER_DRIVER_INTERFACES_H
#define FBDRIVER_DRIVER_INTERFACES_H

#include "firebird/Interface.h"
#include "../common/fbd_exception.h"

#include <atomic>
#include <stddef.h>
#include <stdint.h>

namespace FbDriver {

// Oldest vtable version each wrapped interface must report.
// Specializations exist for every native interface the driver touches.

template <typename T>
struct InterfaceTraits;

#define FBDRIVER_INTERFACE_TRAITS(TYPE, VERSION)		\
template <>												\
struct InterfaceTraits<Firebird::TYPE>					\
{														\
	static const char* name()							\
	{													\
		return #TYPE;									\
	}													\
	static const unsigned MIN_VERSION = VERSION;		\
};

FBDRIVER_INTERFACE_TRAITS(IMaster, 2)
FBDRIVER_INTERFACE_TRAITS(IUtil, 2)
FBDRIVER_INTERFACE_TRAITS(IProvider, 4)
FBDRIVER_INTERFACE_TRAITS(IAttachment, 3)
FBDRIVER_INTERFACE_TRAITS(ITransaction, 3)
FBDRIVER_INTERFACE_TRAITS(IStatement, 3)
FBDRIVER_INTERFACE_TRAITS(IResultSet, 3)
FBDRIVER_INTERFACE_TRAITS(IBlob, 3)
FBDRIVER_INTERFACE_TRAITS(IMessageMetadata, 3)
FBDRIVER_INTERFACE_TRAITS(IMetadataBuilder, 3)
FBDRIVER_INTERFACE_TRAITS(IEvents, 3)
FBDRIVER_INTERFACE_TRAITS(IEventBlock, 3)
FBDRIVER_INTERFACE_TRAITS(IXpbBuilder, 3)
FBDRIVER_INTERFACE_TRAITS(IDecFloat16, 2)
FBDRIVER_INTERFACE_TRAITS(IDecFloat34, 2)
FBDRIVER_INTERFACE_TRAITS(IInt128, 2)

#undef FBDRIVER_INTERFACE_TRAITS


// Variant of an interface family available from a given vtable version on
struct InterfaceVariant
{
	unsigned version;
	int tag;
};

// Picks the first variant (table is ordered by descending version) the reported
// version supports. Raises InterfaceError when none fits.
int negotiateVersion(const char* name, unsigned version,
	const InterfaceVariant* variants, size_t count);

template <size_t N>
int negotiateVersion(const char* name, unsigned version, const InterfaceVariant (&variants)[N])
{
	return negotiateVersion(name, version, variants, N);
}

template <typename T>
unsigned interfaceVersion(const T* intf)
{
	return (unsigned) intf->cloopVTable->version;
}

// Validates the interface reported by the client library and passes it through.
// Null stays null.
template <typename T>
T* checkInterface(T* intf)
{
	if (intf && interfaceVersion(intf) < InterfaceTraits<T>::MIN_VERSION)
	{
		const unsigned version = interfaceVersion(intf);
		InterfaceError::raise("Wrong interface version %u, expected %u (%s)",
			version, InterfaceTraits<T>::MIN_VERSION, InterfaceTraits<T>::name());
	}

	return intf;
}


// Releases reference counted interface exactly once, whoever comes first:
// destructor, reset() or the owner forgetting it after a terminating call.

template <typename T>
class AutoRelease
{
public:
	explicit AutoRelease(T* ptr = nullptr)
		: m_ptr(ptr)
	{ }

	AutoRelease(AutoRelease&& other)
		: m_ptr(other.forget())
	{ }

	AutoRelease& operator=(AutoRelease&& other)
	{
		if (this != &other)
			reset(other.forget());

		return *this;
	}

	~AutoRelease()
	{
		reset();
	}

	void reset(T* ptr = nullptr)
	{
		T* const old = m_ptr.exchange(ptr);

		if (old)
			old->release();
	}

	// Terminating calls (commit, free, detach...) release the interface themselves
	T* forget()
	{
		return m_ptr.exchange(nullptr);
	}

	void addRef(T* ptr)
	{
		if (ptr)
			ptr->addRef();

		reset(ptr);
	}

	T* get() const
	{
		return m_ptr.load();
	}

	T* operator->() const
	{
		return m_ptr.load();
	}

	bool hasData() const
	{
		return m_ptr.load() != nullptr;
	}

private:
	AutoRelease(const AutoRelease&);
	AutoRelease& operator=(const AutoRelease&);

	std::atomic<T*> m_ptr;
};


// Same for interfaces which are only disposable

template <typename T>
class AutoDispose
{
public:
	explicit AutoDispose(T* ptr = nullptr)
		: m_ptr(ptr)
	{ }

	AutoDispose(AutoDispose&& other)
		: m_ptr(other.forget())
	{ }

	~AutoDispose()
	{
		reset();
	}

	void reset(T* ptr = nullptr)
	{
		T* const old = m_ptr.exchange(ptr);

		if (old)
			old->dispose();
	}

	T* forget()
	{
		return m_ptr.exchange(nullptr);
	}

	T* get() const
	{
		return m_ptr.load();
	}

	T* operator->() const
	{
		return m_ptr.load();
	}

	bool hasData() const
	{
		return m_ptr.load() != nullptr;
	}

private:
	AutoDispose(const AutoDispose&);
	AutoDispose& operator=(const AutoDispose&);

	std::atomic<T*> m_ptr;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_INTERFACES_H
