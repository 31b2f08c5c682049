/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			ClientLibrary.cpp
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

#include "../driver/ClientLibrary.h"
#include "../driver/Interfaces.h"
#include "../common/config/DriverConfig.h"
#include "../common/log/LogWriter.h"
#include "../common/common.h"

#include <mutex>
#include <vector>

using namespace Firebird;

namespace
{
	using namespace FbDriver;

	typedef IMaster* (ISC_EXPORT *MasterEntry)();

	const char* const DEFAULT_CLIENT_LIBRARIES[] = {
#ifdef FBDRIVER_DEFAULT_CLIENT
		FBDRIVER_DEFAULT_CLIENT,
#endif
		"libfbclient.so.2",
		"libfbclient.so"
	};

	std::mutex g_loadMutex;
	std::unique_ptr<ClientLibrary> g_library;

	// One status object per calling thread
	class ThreadStatus
	{
	public:
		ThreadStatus()
			: m_status(nullptr)
		{ }

		~ThreadStatus()
		{
			m_wrapper.reset();

			if (m_status)
				m_status->dispose();
		}

		StatusWrapper* get(IMaster* master)
		{
			if (!m_wrapper)
			{
				m_status = master->getStatus();
				m_wrapper.reset(new StatusWrapper(m_status));
			}

			return m_wrapper.get();
		}

	private:
		IStatus* m_status;
		std::unique_ptr<StatusWrapper> m_wrapper;
	};

	thread_local ThreadStatus t_status;
}

namespace FbDriver {

ClientLibrary& ClientLibrary::get()
{
	{
		std::lock_guard<std::mutex> guard(g_loadMutex);

		if (g_library)
			return *g_library;
	}

	return load(DriverConfig::get()->clientLibrary);
}

ClientLibrary& ClientLibrary::load(const std::string& path)
{
	std::lock_guard<std::mutex> guard(g_loadMutex);

	if (g_library)
		return *g_library;

	std::vector<std::string> candidates;

	if (path.empty())
	{
		for (const char* name : DEFAULT_CLIENT_LIBRARIES)
			candidates.push_back(name);
	}
	else
	{
		std::string name = path;
		if (name.find('/') == std::string::npos && name.find(".so") == std::string::npos)
			ModuleLoader::doctorModuleExtension(name);
		candidates.push_back(name);
	}

	std::unique_ptr<ModuleLoader::Module> module;
	std::string lastError;

	for (const auto& candidate : candidates)
	{
		try
		{
			module = ModuleLoader::loadModule(candidate);
			break;
		}
		catch (const InterfaceError& ex)
		{
			logDebug(ex.getMessage());
			lastError = ex.getMessage();
		}
	}

	if (!module)
		throw InterfaceError(lastError);

	g_library.reset(new ClientLibrary(std::move(module)));
	StatusTranslator::setInterpreter(g_library.get());

	logVerbose(printfString("Client library %s loaded, utility interface version %u",
		g_library->getFileName().c_str(), g_library->getUtilVersion()));

	return *g_library;
}

bool ClientLibrary::isLoaded()
{
	std::lock_guard<std::mutex> guard(g_loadMutex);
	return g_library != nullptr;
}

template <typename T>
void ClientLibrary::resolve(T& entry, const char* name)
{
	entry = m_module->findSymbol<T>(name);

	if (!entry)
	{
		InterfaceError::raise("Entry point %s not found in %s",
			name, m_module->getFileName().c_str());
	}
}

ClientLibrary::ClientLibrary(std::unique_ptr<ModuleLoader::Module> module)
	: m_module(std::move(module)),
	  m_master(nullptr),
	  m_util(nullptr)
{
	MasterEntry masterEntry = nullptr;
	resolve(masterEntry, "fb_get_master_interface");

	resolve(m_interpret, "fb_interpret");
	resolve(m_sqlState, "fb_sqlstate");
	resolve(m_sqlCode, "isc_sqlcode");
	resolve(m_getDatabaseHandle, "fb_get_database_handle");
	resolve(m_getTransactionHandle, "fb_get_transaction_handle");
	resolve(m_arrayLookupBounds, "isc_array_lookup_bounds");
	resolve(m_arrayPutSlice, "isc_array_put_slice");
	resolve(m_arrayGetSlice, "isc_array_get_slice");

	m_master = checkInterface(masterEntry());
	if (!m_master)
		InterfaceError::raise("Client library %s returned no master interface", getFileName().c_str());

	m_util = checkInterface(m_master->getUtilInterface());
}

unsigned ClientLibrary::getUtilVersion() const
{
	return interfaceVersion(m_util);
}

IProvider* ClientLibrary::getDispatcher()
{
	return checkInterface(m_master->getDispatcher());
}

StatusWrapper* ClientLibrary::getStatus()
{
	return t_status.get(m_master);
}

std::string ClientLibrary::formatMessage(const ISC_STATUS* vector)
{
	std::string message;
	char temp[BUFFER_LARGE];
	const ISC_STATUS* p = vector;

	while (m_interpret(temp, sizeof(temp), &p))
	{
		if (!message.empty())
			message += "\n-";

		message += temp;
	}

	return message;
}

std::string ClientLibrary::getSqlState(const ISC_STATUS* vector)
{
	char sqlState[FB_SQLSTATE_SIZE];
	m_sqlState(sqlState, vector);
	sqlState[FB_SQLSTATE_SIZE - 1] = 0;

	return sqlState;
}

int ClientLibrary::getSqlCode(const ISC_STATUS* vector)
{
	return (int) m_sqlCode(vector);
}

isc_db_handle ClientLibrary::getDatabaseHandle(IAttachment* attachment)
{
	ISC_STATUS_ARRAY status = {0};
	isc_db_handle handle = 0;

	m_getDatabaseHandle(status, &handle, attachment);
	StatusTranslator::check(status);

	return handle;
}

isc_tr_handle ClientLibrary::getTransactionHandle(ITransaction* transaction)
{
	ISC_STATUS_ARRAY status = {0};
	isc_tr_handle handle = 0;

	m_getTransactionHandle(status, &handle, transaction);
	StatusTranslator::check(status);

	return handle;
}

void ClientLibrary::arrayLookupBounds(isc_db_handle* db, isc_tr_handle* tra,
	const std::string& relation, const std::string& field, ISC_ARRAY_DESC* desc)
{
	ISC_STATUS_ARRAY status = {0};

	m_arrayLookupBounds(status, db, tra, relation.c_str(), field.c_str(), desc);
	StatusTranslator::check(status);
}

void ClientLibrary::arrayPutSlice(isc_db_handle* db, isc_tr_handle* tra, ISC_QUAD* arrayId,
	const ISC_ARRAY_DESC* desc, void* buffer, ISC_LONG* length)
{
	ISC_STATUS_ARRAY status = {0};

	m_arrayPutSlice(status, db, tra, arrayId, desc, buffer, length);
	StatusTranslator::check(status);
}

void ClientLibrary::arrayGetSlice(isc_db_handle* db, isc_tr_handle* tra, ISC_QUAD* arrayId,
	const ISC_ARRAY_DESC* desc, void* buffer, ISC_LONG* length)
{
	ISC_STATUS_ARRAY status = {0};

	m_arrayGetSlice(status, db, tra, arrayId, desc, buffer, length);
	StatusTranslator::check(status);
}

} // namespace FbDriver
