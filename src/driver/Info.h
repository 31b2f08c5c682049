/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Info.h
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

#ifndef FBDRIVER_DRIVER_INFO_H
#define FBDRIVER_DRIVER_INFO_H

#include "../common/common.h"

#include <string>
#include <vector>

namespace FbDriver {

class Connection;
class TransactionManager;

// Items requested through getInfo() of a native interface.
// The response buffer is doubled while the reply comes back truncated.

class InfoProvider
{
public:
	// Largest response buffer tried
	static constexpr unsigned MAX_RESPONSE = 32767;

	virtual ~InfoProvider()
	{ }

	// Complete reply to the items, ends with isc_info_end
	Bytes getResponse(const Bytes& items);

	// Data of a single item, without its tag and length
	Bytes getBytes(UCHAR item);

	SINT64 getInteger(UCHAR item, bool isSigned = false);

	// Count byte followed by that many counted strings
	std::vector<std::string> getStrings(UCHAR item);

	// Item repeated once per value. Empty reply is an empty list.
	std::vector<SINT64> getIntegerList(UCHAR item);

	unsigned getBufferSize() const
	{
		return m_bufferSize;
	}

protected:
	InfoProvider()
		: m_bufferSize(BUFFER_SMALL)
	{ }

	// Native getInfo() of the information source
	virtual void acquire(const Bytes& items, Bytes& buffer) = 0;

private:
	InfoProvider(const InfoProvider&);
	InfoProvider& operator=(const InfoProvider&);

	unsigned m_bufferSize;
};


// Information about the attached database

class DatabaseInfo : public InfoProvider
{
public:
	explicit DatabaseInfo(Connection& connection)
		: m_connection(connection)
	{ }

	unsigned pageSize();
	SINT64 attachmentId();
	unsigned sqlDialect();
	unsigned odsVersion();
	unsigned odsMinorVersion();
	SINT64 pagesAllocated();
	SINT64 sweepInterval();
	bool forcedWrites();
	bool readOnly();

	// Page counters of the attachment
	SINT64 reads();
	SINT64 writes();
	SINT64 fetches();
	SINT64 marks();

	SINT64 currentMemory();
	SINT64 maxMemory();

	// Implementation string, e.g. "LI-V4.0.2.2816 Firebird 4.0"
	std::string firebirdVersion();
	// Major.minor engine version parsed from firebirdVersion(), 0.0 when not recognized
	double engineVersion();

	// Database file and site names
	std::string databaseName();
	std::string siteName();

	SINT64 oldestTransaction();
	SINT64 oldestActive();
	SINT64 oldestSnapshot();
	SINT64 nextTransaction();
	SINT64 activeTransactionCount();
	std::vector<SINT64> activeTransactions();

protected:
	void acquire(const Bytes& items, Bytes& buffer) override;

private:
	Connection& m_connection;
};


// Reply to isc_info_tra_isolation

struct TransactionIsolation
{
	UCHAR level;			// isc_info_tra_consistency, _concurrency or _read_committed
	UCHAR readCommitted;	// record version mode of read committed level
};

// Information about the active transaction of a manager

class TransactionInfo : public InfoProvider
{
public:
	explicit TransactionInfo(TransactionManager& transaction)
		: m_transaction(transaction)
	{ }

	SINT64 id();
	SINT64 oldestInteresting();
	SINT64 oldestActive();
	SINT64 oldestSnapshot();
	TransactionIsolation isolation();
	bool readOnly();

	// -1 wait forever, 0 no wait, seconds otherwise
	int lockTimeout();

protected:
	void acquire(const Bytes& items, Bytes& buffer) override;

private:
	TransactionManager& m_transaction;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_INFO_H
