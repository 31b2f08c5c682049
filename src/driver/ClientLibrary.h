/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ClientLibrary.h
 *	DESCRIPTION:	Dynamically loaded client library.
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

#ifndef FBDRIVER_DRIVER_CLIENT_LIBRARY_H
#define FBDRIVER_DRIVER_CLIENT_LIBRARY_H

#include "ibase.h"
#include "firebird/Interface.h"
#include "../common/StatusHolder.h"
#include "../common/os/mod_loader.h"

#include <memory>
#include <string>

namespace FbDriver {

class ClientLibrary : public StatusInterpreter
{
public:
	// Library named by configuration or the platform default, loaded on first use
	static ClientLibrary& get();

	// Explicit load, path may be empty. Only the first successful load takes effect.
	static ClientLibrary& load(const std::string& path);

	static bool isLoaded();

	Firebird::IMaster* getMaster() const
	{
		return m_master;
	}

	Firebird::IUtil* getUtil() const
	{
		return m_util;
	}

	unsigned getUtilVersion() const;

	// Caller owns the returned reference
	Firebird::IProvider* getDispatcher();

	// Status object of the calling thread, created on first use and disposed at thread exit
	StatusWrapper* getStatus();

	const std::string& getFileName() const
	{
		return m_module->getFileName();
	}

	// StatusInterpreter implementation
	std::string formatMessage(const ISC_STATUS* vector) override;
	std::string getSqlState(const ISC_STATUS* vector) override;
	int getSqlCode(const ISC_STATUS* vector) override;

	// Legacy API still needed for arrays, raising on error
	isc_db_handle getDatabaseHandle(Firebird::IAttachment* attachment);
	isc_tr_handle getTransactionHandle(Firebird::ITransaction* transaction);
	void arrayLookupBounds(isc_db_handle* db, isc_tr_handle* tra,
		const std::string& relation, const std::string& field, ISC_ARRAY_DESC* desc);
	void arrayPutSlice(isc_db_handle* db, isc_tr_handle* tra, ISC_QUAD* arrayId,
		const ISC_ARRAY_DESC* desc, void* buffer, ISC_LONG* length);
	void arrayGetSlice(isc_db_handle* db, isc_tr_handle* tra, ISC_QUAD* arrayId,
		const ISC_ARRAY_DESC* desc, void* buffer, ISC_LONG* length);

private:
	explicit ClientLibrary(std::unique_ptr<ModuleLoader::Module> module);

	template <typename T>
	void resolve(T& entry, const char* name);

	std::unique_ptr<ModuleLoader::Module> m_module;
	Firebird::IMaster* m_master;
	Firebird::IUtil* m_util;

	decltype(&::fb_interpret) m_interpret;
	decltype(&::fb_sqlstate) m_sqlState;
	decltype(&::isc_sqlcode) m_sqlCode;
	decltype(&::fb_get_database_handle) m_getDatabaseHandle;
	decltype(&::fb_get_transaction_handle) m_getTransactionHandle;
	decltype(&::isc_array_lookup_bounds) m_arrayLookupBounds;
	decltype(&::isc_array_put_slice) m_arrayPutSlice;
	decltype(&::isc_array_get_slice) m_arrayGetSlice;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_CLIENT_LIBRARY_H
