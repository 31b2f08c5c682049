/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Cursor.h
 *	DESCRIPTION:	Statement execution and row fetching.
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

#ifndef FBDRIVER_DRIVER_CURSOR_H
#define FBDRIVER_DRIVER_CURSOR_H

#include "firebird/Interface.h"
#include "../driver/Interfaces.h"
#include "../driver/LobAccess.h"
#include "../driver/Statement.h"
#include "../driver/Value.h"
#include "../driver/ValueCodec.h"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace FbDriver {

class BlobReader;
class Connection;
class TransactionManager;

// Executes statements in context of a transaction manager and fetches their rows.
// A closed cursor may execute further statements.

class Cursor : public LobAccess
{
public:
	explicit Cursor(TransactionManager& transaction);
	// Cursor of a distributed transaction works with one of its connections
	Cursor(TransactionManager& transaction, Connection& connection);
	~Cursor();

	// SQL text equal to the last executed one reuses its statement
	Cursor& execute(const std::string& sql, const ValueList& params = ValueList());
	Cursor& execute(const std::shared_ptr<Statement>& statement, const ValueList& params = ValueList());

	// Same as execute() with a scrollable result set
	Cursor& open(const std::string& sql, const ValueList& params = ValueList());
	Cursor& open(const std::shared_ptr<Statement>& statement, const ValueList& params = ValueList());

	void executemany(const std::string& sql, const std::vector<ValueList>& paramSets);
	void executemany(const std::shared_ptr<Statement>& statement, const std::vector<ValueList>& paramSets);

	// EXECUTE PROCEDURE, returns output of the procedure if it has any
	std::optional<Row> callproc(const std::string& procName, const ValueList& params = ValueList());

	std::shared_ptr<Statement> prepare(const std::string& sql);

	std::optional<Row> fetchone();
	std::vector<Row> fetchmany(int size = -1);
	std::vector<Row> fetchall();

	// Result set navigation, scrolling requires open()
	std::optional<Row> fetchNext();
	std::optional<Row> fetchPrior();
	std::optional<Row> fetchFirst();
	std::optional<Row> fetchLast();
	std::optional<Row> fetchAbsolute(int position);
	std::optional<Row> fetchRelative(int offset);

	bool isEof();
	bool isBof();

	void setCursorName(const std::string& name);

	// Empty when nothing was executed
	std::vector<ColumnDescription> description();

	// Rows selected or affected by the last statement, -1 if unknown
	SINT64 affectedRows();

	// Releases the result set and BLOB readers, frees internally prepared statement
	void close();

	int getArraySize() const
	{
		return m_arraySize;
	}

	void setArraySize(int size)
	{
		m_arraySize = size;
	}

	void setStreamBlobs(const std::set<std::string>& names)
	{
		m_codec.setStreamBlobs(names);
	}

	const std::set<std::string>& getStreamBlobs() const
	{
		return m_codec.getStreamBlobs();
	}

	void setStreamBlobThreshold(SINT64 threshold)
	{
		m_codec.setStreamBlobThreshold(threshold);
	}

	SINT64 getStreamBlobThreshold() const
	{
		return m_codec.getStreamBlobThreshold();
	}

	std::shared_ptr<Statement> getStatement() const
	{
		return m_statement;
	}

	TransactionManager& getTransaction() const;
	Connection& getConnection() const;

	// Called by the transaction manager going away
	void detachTransaction();

	// LobAccess implementation
	std::unique_ptr<BlobHandle> createBlob(ISC_QUAD& blobId, bool stream) override;
	std::unique_ptr<BlobHandle> openBlob(const ISC_QUAD& blobId) override;
	ArrayDescriptor lookupArray(const std::string& relation, const std::string& field) override;
	void putSlice(ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data) override;
	void getSlice(const ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data) override;
	void trackReader(std::shared_ptr<BlobReader> reader) override;

private:
	Cursor(const Cursor&);
	Cursor& operator=(const Cursor&);

	enum FetchOperation
	{
		FETCH_NEXT,
		FETCH_PRIOR,
		FETCH_FIRST,
		FETCH_LAST,
		FETCH_ABSOLUTE,
		FETCH_RELATIVE
	};

	void executeStatement(const std::string* sql, const std::shared_ptr<Statement>* statement,
		const ValueList& params, unsigned flags);
	void clear();
	std::optional<Row> fetch(FetchOperation operation, int position = 0);
	Firebird::IResultSet* checkResultSet() const;

	TransactionManager* m_transaction;
	Connection* const m_connection;
	ValueCodec m_codec;
	std::shared_ptr<Statement> m_statement;
	bool m_internal;
	AutoRelease<Firebird::IResultSet> m_resultSet;
	std::optional<Row> m_cachedRow;
	bool m_executed;
	bool m_noData;
	std::string m_name;
	std::vector<std::shared_ptr<BlobReader> > m_readers;
	int m_arraySize;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_CURSOR_H
