/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Info.cpp
 *	DESCRIPTION:	Database and transaction information.
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

#include "ibase.h"
#include "../driver/Info.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Connection.h"
#include "../driver/Transaction.h"
#include "../common/fbd_exception.h"

#include <stdio.h>
#include <algorithm>

using namespace Firebird;

namespace FbDriver {

namespace
{
	unsigned clumpLength(const Bytes& buffer, size_t pos)
	{
		return unsigned(buffer[pos + 1]) | (unsigned(buffer[pos + 2]) << 8);
	}

	// Position of isc_info_end or isc_info_truncated closing the response
	size_t findTerminator(const Bytes& buffer)
	{
		size_t pos = 0;

		while (pos < buffer.size())
		{
			const UCHAR tag = buffer[pos];

			if (tag == isc_info_end || tag == isc_info_truncated)
				return pos;

			if (pos + 3 > buffer.size())
				break;

			pos += 3 + clumpLength(buffer, pos);
		}

		InterfaceError::raise("Invalid response format");
	}

	SINT64 toInteger(const UCHAR* data, unsigned length, bool isSigned)
	{
		if (length == 0 || length > 8)
			InterfaceError::raise("Wrong size %u of integer information item", length);

		SINT64 value = vaxInteger(data, length);

		if (!isSigned && length < 8)
			value &= (SINT64(1) << (8 * length)) - 1;

		return value;
	}
}


Bytes InfoProvider::getResponse(const Bytes& items)
{
	Bytes buffer;

	for (;;)
	{
		buffer.assign(m_bufferSize, 0);
		acquire(items, buffer);

		if (buffer[findTerminator(buffer)] == isc_info_end)
			break;

		if (m_bufferSize >= MAX_RESPONSE)
			InterfaceError::raise("Response too large");

		m_bufferSize = std::min(m_bufferSize * 2, unsigned(MAX_RESPONSE));
	}

	return buffer;
}

Bytes InfoProvider::getBytes(UCHAR item)
{
	const Bytes items = {item, isc_info_end};
	const Bytes response = getResponse(items);
	const UCHAR tag = response[0];

	if (tag != item)
	{
		if (tag == isc_info_error)
			InterfaceError::raise("An error response was received");

		InterfaceError::raise("Result code does not match request code");
	}

	const unsigned length = clumpLength(response, 0);
	return Bytes(response.begin() + 3, response.begin() + 3 + length);
}

SINT64 InfoProvider::getInteger(UCHAR item, bool isSigned)
{
	const Bytes data = getBytes(item);
	return toInteger(data.data(), (unsigned) data.size(), isSigned);
}

std::vector<std::string> InfoProvider::getStrings(UCHAR item)
{
	const Bytes data = getBytes(item);
	std::vector<std::string> result;

	if (data.empty())
		InterfaceError::raise("Invalid response format");

	size_t pos = 1;

	for (unsigned count = data[0]; count; --count)
	{
		if (pos >= data.size() || pos + 1 + data[pos] > data.size())
			InterfaceError::raise("Invalid response format");

		const unsigned length = data[pos++];
		result.push_back(std::string(data.begin() + pos, data.begin() + pos + length));
		pos += length;
	}

	return result;
}

std::vector<SINT64> InfoProvider::getIntegerList(UCHAR item)
{
	const Bytes items = {item, isc_info_end};
	const Bytes response = getResponse(items);
	std::vector<SINT64> result;

	for (size_t pos = 0; response[pos] != isc_info_end; )
	{
		const UCHAR tag = response[pos];
		const unsigned length = clumpLength(response, pos);

		if (tag == isc_info_error)
			InterfaceError::raise("An error response was received");

		if (tag != item)
			InterfaceError::raise("Result code does not match request code");

		if (length != 4 && length != 8)
			InterfaceError::raise("Wrong transaction ID size %u", length);

		result.push_back(toInteger(&response[pos + 3], length, false));
		pos += 3 + length;
	}

	return result;
}


void DatabaseInfo::acquire(const Bytes& items, Bytes& buffer)
{
	m_connection.getAttachment()->getInfo(ClientLibrary::get().getStatus(),
		(unsigned) items.size(), items.data(), (unsigned) buffer.size(), buffer.data());
}

unsigned DatabaseInfo::pageSize()
{
	return (unsigned) getInteger(isc_info_page_size);
}

SINT64 DatabaseInfo::attachmentId()
{
	return getInteger(isc_info_attachment_id);
}

unsigned DatabaseInfo::sqlDialect()
{
	return (unsigned) getInteger(isc_info_db_sql_dialect);
}

unsigned DatabaseInfo::odsVersion()
{
	return (unsigned) getInteger(isc_info_ods_version);
}

unsigned DatabaseInfo::odsMinorVersion()
{
	return (unsigned) getInteger(isc_info_ods_minor_version);
}

SINT64 DatabaseInfo::pagesAllocated()
{
	return getInteger(isc_info_allocation);
}

SINT64 DatabaseInfo::sweepInterval()
{
	return getInteger(isc_info_sweep_interval);
}

bool DatabaseInfo::forcedWrites()
{
	return getInteger(isc_info_forced_writes) != 0;
}

bool DatabaseInfo::readOnly()
{
	return getInteger(isc_info_db_read_only) != 0;
}

SINT64 DatabaseInfo::reads()
{
	return getInteger(isc_info_reads);
}

SINT64 DatabaseInfo::writes()
{
	return getInteger(isc_info_writes);
}

SINT64 DatabaseInfo::fetches()
{
	return getInteger(isc_info_fetches);
}

SINT64 DatabaseInfo::marks()
{
	return getInteger(isc_info_marks);
}

SINT64 DatabaseInfo::currentMemory()
{
	return getInteger(isc_info_current_memory);
}

SINT64 DatabaseInfo::maxMemory()
{
	return getInteger(isc_info_max_memory);
}

std::string DatabaseInfo::firebirdVersion()
{
	const std::vector<std::string> strings = getStrings(isc_info_firebird_version);

	if (strings.empty())
		InterfaceError::raise("Invalid response format");

	return strings.front();
}

double DatabaseInfo::engineVersion()
{
	// platform prefix, then V (release) or T (test build) and the version numbers
	const std::string version = firebirdVersion();
	const size_t pos = version.find_first_of("VT", 1);
	unsigned major = 0, minor = 0;

	if (pos == std::string::npos ||
		sscanf(version.c_str() + pos + 1, "%u.%u", &major, &minor) != 2)
	{
		return 0.0;
	}

	return major + minor / 10.0;
}

std::string DatabaseInfo::databaseName()
{
	const std::vector<std::string> strings = getStrings(isc_info_db_id);
	return strings.empty() ? std::string() : strings[0];
}

std::string DatabaseInfo::siteName()
{
	const std::vector<std::string> strings = getStrings(isc_info_db_id);
	return strings.size() < 2 ? std::string() : strings[1];
}

SINT64 DatabaseInfo::oldestTransaction()
{
	return getInteger(isc_info_oldest_transaction);
}

SINT64 DatabaseInfo::oldestActive()
{
	return getInteger(isc_info_oldest_active);
}

SINT64 DatabaseInfo::oldestSnapshot()
{
	return getInteger(isc_info_oldest_snapshot);
}

SINT64 DatabaseInfo::nextTransaction()
{
	return getInteger(isc_info_next_transaction);
}

SINT64 DatabaseInfo::activeTransactionCount()
{
	return getInteger(isc_info_active_tran_count);
}

std::vector<SINT64> DatabaseInfo::activeTransactions()
{
	return getIntegerList(isc_info_active_transactions);
}


void TransactionInfo::acquire(const Bytes& items, Bytes& buffer)
{
	m_transaction.getInterface()->getInfo(ClientLibrary::get().getStatus(),
		(unsigned) items.size(), items.data(), (unsigned) buffer.size(), buffer.data());
}

SINT64 TransactionInfo::id()
{
	return getInteger(isc_info_tra_id);
}

SINT64 TransactionInfo::oldestInteresting()
{
	return getInteger(isc_info_tra_oldest_interesting);
}

SINT64 TransactionInfo::oldestActive()
{
	return getInteger(isc_info_tra_oldest_active);
}

SINT64 TransactionInfo::oldestSnapshot()
{
	return getInteger(isc_info_tra_oldest_snapshot);
}

TransactionIsolation TransactionInfo::isolation()
{
	const Bytes data = getBytes(isc_info_tra_isolation);

	if (data.empty())
		InterfaceError::raise("Invalid response format");

	TransactionIsolation result;
	result.level = data[0];
	result.readCommitted = data.size() > 1 ? data[1] : 0;

	return result;
}

bool TransactionInfo::readOnly()
{
	return getInteger(isc_info_tra_access) == isc_info_tra_readonly;
}

int TransactionInfo::lockTimeout()
{
	return (int) getInteger(isc_info_tra_lock_timeout, true);
}

} // namespace FbDriver
