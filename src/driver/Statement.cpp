/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Statement.cpp
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

#include "../driver/Statement.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Connection.h"
#include "../common/log/LogWriter.h"

#include "boost/algorithm/string/trim.hpp"

using namespace Firebird;

namespace FbDriver {

namespace
{
	// Metadata without items is of no use for marshalling
	IMessageMetadata* nonEmpty(IMessageMetadata* meta)
	{
		checkInterface(meta);

		if (meta && meta->getCount(ClientLibrary::get().getStatus()) == 0)
		{
			meta->release();
			return nullptr;
		}

		return meta;
	}
}

Statement::Statement(Connection& connection, IStatement* statement, const std::string& sql,
		unsigned dialect)
	: m_connection(&connection),
	  m_statement(checkInterface(statement)),
	  m_sql(sql),
	  m_dialect(dialect),
	  m_type(0),
	  m_flags(0),
	  m_described(false)
{
	StatusWrapper* const status = ClientLibrary::get().getStatus();

	m_type = m_statement->getType(status);
	m_flags = m_statement->getFlags(status);

	m_inMeta.reset(nonEmpty(m_statement->getInputMetadata(status)));
	m_outMeta.reset(nonEmpty(m_statement->getOutputMetadata(status)));

	m_inLayout = MessageLayout::read(m_inMeta.get());
	m_outLayout = MessageLayout::read(m_outMeta.get());
	m_outBuffer.assign(m_outLayout.getLength(), 0);

	m_connection->registerStatement(this);
}

Statement::~Statement()
{
	try
	{
		free();
	}
	catch (const Error& ex)
	{
		logError("Error freeing statement: " + ex.getMessage());
	}
}

void Statement::free()
{
	if (m_connection)
	{
		Connection* const connection = m_connection;
		m_connection = nullptr;
		connection->unregisterStatement(this);
	}

	m_inMeta.reset();
	m_outMeta.reset();

	if (m_statement.hasData())
	{
		try
		{
			m_statement->free(ClientLibrary::get().getStatus());
			m_statement.forget();
		}
		catch (const Error&)
		{
			m_statement.reset();
			throw;
		}
	}
}

IStatement* Statement::getInterface() const
{
	if (!m_statement.hasData())
		InterfaceError::raise("Statement is already freed");

	return m_statement.get();
}

std::string Statement::getPlan(bool detailed)
{
	const char* const plan = getInterface()->getPlan(ClientLibrary::get().getStatus(), detailed);

	if (!plan)
		return "";

	return boost::algorithm::trim_copy(std::string(plan));
}

const std::vector<ColumnDescription>& Statement::getDescription()
{
	if (m_described)
		return m_description;

	if (!m_connection)
		InterfaceError::raise("Statement is already freed");

	m_description.clear();

	for (const auto& field : m_outLayout.getFields())
	{
		int precision = 0;

		if (ValueCodec::isFixedPoint(m_dialect, field.type, field.subType, field.scale))
			precision = m_connection->determineFieldPrecision(field.relation, field.field);

		m_description.push_back(ValueCodec::describeColumn(field, m_dialect, precision));
	}

	m_described = true;
	return m_description;
}

} // namespace FbDriver
