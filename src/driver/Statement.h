/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Statement.h
 *	DESCRIPTION:	Prepared statement.
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

#ifndef FBDRIVER_DRIVER_STATEMENT_H
#define FBDRIVER_DRIVER_STATEMENT_H

#include "firebird/Interface.h"
#include "../driver/Interfaces.h"
#include "../driver/Message.h"
#include "../driver/ValueCodec.h"

#include <string>
#include <vector>

namespace FbDriver {

class Connection;

// Statement prepared by a connection. Owned by the caller (or by a cursor for
// statements prepared internally), registered with the connection until freed.

class Statement
{
public:
	Statement(Connection& connection, Firebird::IStatement* statement, const std::string& sql,
		unsigned dialect);
	~Statement();

	// Releases the engine statement, safe to call again
	void free();

	bool isFreed() const
	{
		return !m_statement.hasData();
	}

	const std::string& getSql() const
	{
		return m_sql;
	}

	// isc_info_sql_stmt_xxx
	unsigned getType() const
	{
		return m_type;
	}

	unsigned getFlags() const
	{
		return m_flags;
	}

	bool hasCursor() const
	{
		return m_flags & Firebird::IStatement::FLAG_HAS_CURSOR;
	}

	bool canRepeat() const
	{
		return m_flags & Firebird::IStatement::FLAG_REPEAT_EXECUTE;
	}

	unsigned getDialect() const
	{
		return m_dialect;
	}

	std::string getPlan(bool detailed = false);

	// Null once the statement is freed or its connection closed
	Connection* getConnection() const
	{
		return m_connection;
	}

	Firebird::IStatement* getInterface() const;

	// Null when the statement has no parameters or no output columns
	Firebird::IMessageMetadata* getInputMetadata() const
	{
		return m_inMeta.get();
	}

	Firebird::IMessageMetadata* getOutputMetadata() const
	{
		return m_outMeta.get();
	}

	const MessageLayout& getInputLayout() const
	{
		return m_inLayout;
	}

	const MessageLayout& getOutputLayout() const
	{
		return m_outLayout;
	}

	Bytes& getOutputBuffer()
	{
		return m_outBuffer;
	}

	const std::vector<ColumnDescription>& getDescription();

private:
	Statement(const Statement&);
	Statement& operator=(const Statement&);

	Connection* m_connection;
	AutoRelease<Firebird::IStatement> m_statement;
	const std::string m_sql;
	const unsigned m_dialect;
	unsigned m_type;
	unsigned m_flags;

	AutoRelease<Firebird::IMessageMetadata> m_inMeta;
	AutoRelease<Firebird::IMessageMetadata> m_outMeta;
	MessageLayout m_inLayout;
	MessageLayout m_outLayout;
	Bytes m_outBuffer;

	std::vector<ColumnDescription> m_description;
	bool m_described;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_STATEMENT_H
