/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Connection.h
 *	DESCRIPTION:	Database connection.
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

#ifndef FBDRIVER_DRIVER_CONNECTION_H
#define FBDRIVER_DRIVER_CONNECTION_H

#include "firebird/Interface.h"
#include "../common/common.h"
#include "../common/config/DriverConfig.h"
#include "../driver/Interfaces.h"
#include "../driver/Transaction.h"
#include "../driver/TypeConverter.h"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace FbDriver {

class Cursor;
class EventCollector;
class Statement;

// Transaction parameters

struct TpbOptions
{
	enum Isolation
	{
		SNAPSHOT,
		SERIALIZABLE,
		READ_COMMITTED_RECORD_VERSION,
		READ_COMMITTED_NO_RECORD_VERSION
	};

	enum TableShare
	{
		SHARED,
		PROTECTED,
		EXCLUSIVE
	};

	struct TableReservation
	{
		std::string table;
		TableShare share;
		bool write;
	};

	TpbOptions()
		: isolation(SNAPSHOT),
		  readOnly(false),
		  lockTimeout(-1)
	{ }

	explicit TpbOptions(Isolation aIsolation, bool aReadOnly = false, int aLockTimeout = -1)
		: isolation(aIsolation),
		  readOnly(aReadOnly),
		  lockTimeout(aLockTimeout)
	{ }

	Bytes build() const;

	Isolation isolation;
	bool readOnly;
	int lockTimeout;		// -1 wait forever, 0 no wait, seconds otherwise
	std::vector<TableReservation> reservations;
};

// Attachment parameters

struct ConnectOptions
{
	ConnectOptions();

	static ConnectOptions fromConfig(const DatabaseConfig& config);

	// Options used to create database get page size, forced writes and default charset
	Bytes buildDpb(bool create) const;

	std::string user;
	std::string password;
	std::string role;
	std::string charset;
	unsigned sqlDialect;
	unsigned timeout;
	std::string sessionTimeZone;
	unsigned pageSize;
	int forcedWrites;		// -1 leaves the server default
	Bytes extraDpb;			// raw items appended as is
};


class Connection
{
public:
	// Database may be a name registered in configuration, its options are used then
	static std::unique_ptr<Connection> connect(const std::string& database);
	static std::unique_ptr<Connection> connect(const std::string& database, const ConnectOptions& options);

	static std::unique_ptr<Connection> createDatabase(const std::string& database);
	static std::unique_ptr<Connection> createDatabase(const std::string& database,
		const ConnectOptions& options);

	~Connection();

	// Rolls back every transaction and detaches
	void close();
	void dropDatabase();

	void executeImmediate(const std::string& sql);

	// Main transaction shortcuts
	void begin();
	void begin(const Bytes& tpb);
	void commit(bool retaining = false);
	void rollback(bool retaining = false, const std::string& savepoint = "");
	void savepoint(const std::string& name);

	std::unique_ptr<Cursor> cursor();

	std::unique_ptr<TransactionManager> transactionManager(const Bytes& defaultTpb = Bytes(),
		DefaultAction action = ACTION_COMMIT);
	std::unique_ptr<TransactionManager> transactionManager(const TpbOptions& options,
		DefaultAction action = ACTION_COMMIT);

	// Collection starts with begin() of the returned collector
	std::unique_ptr<EventCollector> eventCollector(const std::vector<std::string>& names);

	// Statement is prepared in context of the transaction (main one by default), the
	// transaction is started for it when needed and committed afterwards.
	std::shared_ptr<Statement> prepare(const std::string& sql, TransactionManager* transaction = nullptr);

	void ping();

	// Information about the attached database
	DatabaseInfo& info()
	{
		return m_info;
	}

	bool isActive() const;

	bool isClosed() const
	{
		return !m_attachment.hasData();
	}

	const std::string& getCharset() const
	{
		return m_charset;
	}

	unsigned getSqlDialect() const
	{
		return m_sqlDialect;
	}

	const Bytes& getDefaultTpb() const
	{
		return m_defaultTpb;
	}

	TransactionManager& mainTransaction();
	TransactionManager& queryTransaction();

	// Main, query and every open transaction manager
	std::vector<TransactionManager*> transactions();

	Firebird::IAttachment* getAttachment() const;

	TypeConverter& getConverter()
	{
		return m_converter;
	}

	SINT64 getStreamBlobThreshold() const
	{
		return m_streamBlobThreshold;
	}

	void setStreamBlobThreshold(SINT64 threshold)
	{
		m_streamBlobThreshold = threshold;
	}

	// Declared precision of NUMERIC/DECIMAL column or procedure output, 0 if unknown
	int determineFieldPrecision(const std::string& relation, const std::string& field);

	// Subtype of the array column element
	int getArraySubType(const std::string& relation, const std::string& field);

	void clearCaches();

	// Registries of dependent objects
	void registerStatement(Statement* statement);
	void unregisterStatement(Statement* statement);
	void registerTransaction(TransactionManager* transaction);
	void unregisterTransaction(TransactionManager* transaction);
	void unregisterCollector(EventCollector* collector);

private:
	Connection(Firebird::IAttachment* attachment, const ConnectOptions& options);
	Connection(const Connection&);
	Connection& operator=(const Connection&);

	static void resolveDatabase(const std::string& name, std::string& path, ConnectOptions& options);
	static std::unique_ptr<Connection> attach(const std::string& database, const ConnectOptions& options,
		bool create);

	void checkOpen() const;
	void closeDependents();
	Cursor& internalCursor();

	typedef std::pair<std::string, std::string> FieldKey;

	AutoRelease<Firebird::IAttachment> m_attachment;
	std::string m_charset;
	unsigned m_sqlDialect;
	UtilTypeConverter m_converter;
	SINT64 m_streamBlobThreshold;
	Bytes m_defaultTpb;
	DatabaseInfo m_info;

	std::unique_ptr<TransactionManager> m_main;
	std::unique_ptr<TransactionManager> m_query;
	std::unique_ptr<Cursor> m_internalCursor;

	std::vector<TransactionManager*> m_transactions;
	std::vector<Statement*> m_statements;
	std::vector<EventCollector*> m_collectors;

	std::map<FieldKey, int> m_precisionCache;
	std::map<FieldKey, int> m_subTypeCache;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_CONNECTION_H
