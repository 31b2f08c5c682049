/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Cursor.cpp
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

#include "../driver/Cursor.h"
#include "../driver/BlobReader.h"
#include "../driver/BlobWrapper.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Connection.h"
#include "../driver/Transaction.h"
#include "../common/fbd_exception.h"
#include "../common/log/LogWriter.h"

#include <string.h>

using namespace Firebird;

namespace FbDriver {

namespace
{
	const char* const NOT_EXECUTED = "Cannot fetch from cursor that did not executed a statement.";
}

Cursor::Cursor(TransactionManager& transaction)
	: Cursor(transaction, transaction.getConnection())
{
}

Cursor::Cursor(TransactionManager& transaction, Connection& connection)
	: m_transaction(&transaction),
	  m_connection(&connection),
	  m_codec(connection.getConverter(), this, connection.getSqlDialect()),
	  m_internal(false),
	  m_executed(false),
	  m_noData(false),
	  m_arraySize(1)
{
	m_codec.setStreamBlobThreshold(connection.getStreamBlobThreshold());
	m_transaction->registerCursor(this);
}

Cursor::~Cursor()
{
	try
	{
		close();
	}
	catch (const Error& ex)
	{
		logError("Error closing cursor: " + ex.getMessage());
	}

	if (m_transaction)
		m_transaction->unregisterCursor(this);
}

TransactionManager& Cursor::getTransaction() const
{
	if (!m_transaction)
		InterfaceError::raise("Cursor is not bound to a transaction");

	return *m_transaction;
}

Connection& Cursor::getConnection() const
{
	// closing a connection closes every transaction manager bound to it
	if (getTransaction().isClosed())
		InterfaceError::raise("TransactionManager is closed");

	return *m_connection;
}

void Cursor::detachTransaction()
{
	try
	{
		close();
	}
	catch (const Error& ex)
	{
		logError("Error closing cursor: " + ex.getMessage());
	}

	m_transaction = nullptr;
}

Cursor& Cursor::execute(const std::string& sql, const ValueList& params)
{
	executeStatement(&sql, nullptr, params, 0);
	return *this;
}

Cursor& Cursor::execute(const std::shared_ptr<Statement>& statement, const ValueList& params)
{
	executeStatement(nullptr, &statement, params, 0);
	return *this;
}

Cursor& Cursor::open(const std::string& sql, const ValueList& params)
{
	executeStatement(&sql, nullptr, params, IStatement::CURSOR_TYPE_SCROLLABLE);
	return *this;
}

Cursor& Cursor::open(const std::shared_ptr<Statement>& statement, const ValueList& params)
{
	executeStatement(nullptr, &statement, params, IStatement::CURSOR_TYPE_SCROLLABLE);
	return *this;
}

void Cursor::executemany(const std::string& sql, const std::vector<ValueList>& paramSets)
{
	for (const auto& params : paramSets)
		execute(sql, params);
}

void Cursor::executemany(const std::shared_ptr<Statement>& statement,
	const std::vector<ValueList>& paramSets)
{
	for (const auto& params : paramSets)
		execute(statement, params);
}

std::optional<Row> Cursor::callproc(const std::string& procName, const ValueList& params)
{
	std::string sql = "EXECUTE PROCEDURE " + procName + " ";

	for (size_t i = 0; i < params.size(); ++i)
		sql += i ? ",?" : "?";

	execute(sql, params);

	if (m_statement->getOutputLayout().getCount() == 0)
		return std::nullopt;

	return fetchone();
}

std::shared_ptr<Statement> Cursor::prepare(const std::string& sql)
{
	return getConnection().prepare(sql, &getTransaction());
}

void Cursor::executeStatement(const std::string* sql, const std::shared_ptr<Statement>* statement,
	const ValueList& params, unsigned flags)
{
	TransactionManager& transaction = getTransaction();
	Connection& connection = getConnection();

	if (!transaction.isActive())
		transaction.begin();

	if (statement)
	{
		if (!*statement || (*statement)->getConnection() != &connection)
			InterfaceError::raise("Cannot execute Statement that was created by different Connection.");

		close();
		m_statement = *statement;
		m_internal = false;
	}
	else if (m_statement && !m_statement->isFreed() && m_statement->getSql() == *sql)
	{
		// same SQL again
		clear();
	}
	else
	{
		close();
		m_statement = connection.prepare(*sql, &transaction);
		m_internal = true;
	}

	Statement& stmt = *m_statement;
	StatusWrapper* const status = ClientLibrary::get().getStatus();

	ValueCodec::checkParameterCount(stmt.getInputLayout(), params);

	AutoRelease<IMessageMetadata> inMeta;
	Bytes inBuffer;

	if (stmt.getInputLayout().getCount() > 0)
	{
		inMeta = adjustInputMetadata(stmt.getInputMetadata(),
			ValueCodec::textOverrides(stmt.getInputLayout(), params));

		const MessageLayout inLayout = MessageLayout::read(inMeta.get());
		m_codec.encode(inLayout, params, inBuffer);
	}

	UCHAR* const inData = inBuffer.empty() ? nullptr : inBuffer.data();

	if (stmt.hasCursor())
	{
		m_resultSet.reset(checkInterface(stmt.getInterface()->openCursor(status,
			transaction.getInterface(), inMeta.get(), inData, stmt.getOutputMetadata(), flags)));
	}
	else
	{
		Bytes& outBuffer = stmt.getOutputBuffer();

		stmt.getInterface()->execute(status, transaction.getInterface(), inMeta.get(), inData,
			stmt.getOutputMetadata(), outBuffer.empty() ? nullptr : outBuffer.data());

		if (stmt.getOutputLayout().getCount() > 0)
			m_cachedRow = m_codec.decode(stmt.getOutputLayout(), outBuffer);
	}

	m_executed = true;
	m_noData = false;
}

void Cursor::clear()
{
	m_name.clear();
	m_executed = false;
	m_noData = false;
	m_cachedRow.reset();

	std::vector<std::shared_ptr<BlobReader> > readers;
	readers.swap(m_readers);

	if (m_resultSet.hasData())
	{
		try
		{
			m_resultSet->close(ClientLibrary::get().getStatus());
			m_resultSet.forget();
		}
		catch (const Error&)
		{
			m_resultSet.reset();
			throw;
		}
	}

	for (auto& reader : readers)
		reader->close();
}

void Cursor::close()
{
	clear();

	if (m_statement)
	{
		std::shared_ptr<Statement> statement;
		statement.swap(m_statement);

		if (m_internal)
			statement->free();
	}
}

std::optional<Row> Cursor::fetchone()
{
	if (!m_statement || !m_executed)
		InterfaceError::raise("%s", NOT_EXECUTED);

	if (m_statement->getOutputLayout().getCount() == 0 || m_noData)
		return std::nullopt;

	if (m_cachedRow)
	{
		std::optional<Row> result;
		result.swap(m_cachedRow);
		m_noData = true;
		return result;
	}

	if (!m_resultSet.hasData())
		return std::nullopt;

	return fetch(FETCH_NEXT);
}

std::vector<Row> Cursor::fetchmany(int size)
{
	if (size < 0)
		size = m_arraySize;

	std::vector<Row> result;

	for (int i = 0; i < size; ++i)
	{
		std::optional<Row> row = fetchone();

		if (!row)
			break;

		result.push_back(std::move(*row));
	}

	return result;
}

std::vector<Row> Cursor::fetchall()
{
	std::vector<Row> result;

	while (std::optional<Row> row = fetchone())
		result.push_back(std::move(*row));

	return result;
}

IResultSet* Cursor::checkResultSet() const
{
	if (!m_statement || !m_executed)
		InterfaceError::raise("%s", NOT_EXECUTED);

	if (!m_resultSet.hasData())
		InterfaceError::raise("Statement has no open result set");

	return m_resultSet.get();
}

std::optional<Row> Cursor::fetch(FetchOperation operation, int position)
{
	IResultSet* const resultSet = checkResultSet();
	StatusWrapper* const status = ClientLibrary::get().getStatus();
	Bytes& buffer = m_statement->getOutputBuffer();
	void* const data = buffer.data();

	int rc = IStatus::RESULT_NO_DATA;

	switch (operation)
	{
	case FETCH_NEXT:
		rc = resultSet->fetchNext(status, data);
		break;

	case FETCH_PRIOR:
		rc = resultSet->fetchPrior(status, data);
		break;

	case FETCH_FIRST:
		rc = resultSet->fetchFirst(status, data);
		break;

	case FETCH_LAST:
		rc = resultSet->fetchLast(status, data);
		break;

	case FETCH_ABSOLUTE:
		rc = resultSet->fetchAbsolute(status, position, data);
		break;

	case FETCH_RELATIVE:
		rc = resultSet->fetchRelative(status, position, data);
		break;
	}

	if (rc != IStatus::RESULT_OK)
	{
		m_noData = true;
		return std::nullopt;
	}

	m_noData = false;
	return m_codec.decode(m_statement->getOutputLayout(), buffer);
}

std::optional<Row> Cursor::fetchNext()
{
	return fetch(FETCH_NEXT);
}

std::optional<Row> Cursor::fetchPrior()
{
	return fetch(FETCH_PRIOR);
}

std::optional<Row> Cursor::fetchFirst()
{
	return fetch(FETCH_FIRST);
}

std::optional<Row> Cursor::fetchLast()
{
	return fetch(FETCH_LAST);
}

std::optional<Row> Cursor::fetchAbsolute(int position)
{
	return fetch(FETCH_ABSOLUTE, position);
}

std::optional<Row> Cursor::fetchRelative(int offset)
{
	return fetch(FETCH_RELATIVE, offset);
}

bool Cursor::isEof()
{
	return checkResultSet()->isEof(ClientLibrary::get().getStatus());
}

bool Cursor::isBof()
{
	return checkResultSet()->isBof(ClientLibrary::get().getStatus());
}

void Cursor::setCursorName(const std::string& name)
{
	if (!m_executed)
		InterfaceError::raise("Cannot set name for cursor has not yet executed a statement");

	if (!m_name.empty())
	{
		InterfaceError::raise("Cursor's name has already been declared in context of "
			"currently executed statement");
	}

	m_statement->getInterface()->setCursorName(ClientLibrary::get().getStatus(), name.c_str());
	m_name = name;
}

std::vector<ColumnDescription> Cursor::description()
{
	if (!m_statement)
		return std::vector<ColumnDescription>();

	return m_statement->getDescription();
}

SINT64 Cursor::affectedRows()
{
	if (!m_statement || !m_executed)
		return -1;

	const unsigned type = m_statement->getType();

	if (type != isc_info_sql_stmt_select && type != isc_info_sql_stmt_insert &&
		type != isc_info_sql_stmt_update && type != isc_info_sql_stmt_delete)
	{
		return -1;
	}

	const UCHAR items[] = {isc_info_sql_records, isc_info_end};
	UCHAR buffer[BUFFER_TINY / 2];
	memset(buffer, 0, sizeof(buffer));

	m_statement->getInterface()->getInfo(ClientLibrary::get().getStatus(), sizeof(items), items,
		sizeof(buffer), buffer);

	if (buffer[0] != isc_info_sql_records)
		InterfaceError::raise("Cursor.affectedRows: first byte must be 'isc_info_sql_records'");

	SINT64 result = -1;
	const UCHAR* p = buffer + 3;
	const UCHAR* const end = buffer + sizeof(buffer);

	while (p + 3 <= end && *p != isc_info_end)
	{
		const UCHAR counter = *p++;
		const unsigned length = (unsigned) vaxInteger(p, 2);
		p += 2;

		if (p + length > end)
			break;

		const SINT64 count = vaxInteger(p, length);
		p += length;

		if ((counter == isc_info_req_select_count && type == isc_info_sql_stmt_select) ||
			(counter == isc_info_req_insert_count && type == isc_info_sql_stmt_insert) ||
			(counter == isc_info_req_update_count && type == isc_info_sql_stmt_update) ||
			(counter == isc_info_req_delete_count && type == isc_info_sql_stmt_delete))
		{
			result = count;
		}
	}

	return result;
}

std::unique_ptr<BlobHandle> Cursor::createBlob(ISC_QUAD& blobId, bool stream)
{
	TransactionManager& transaction = getTransaction();

	return BlobWrapper::create(getConnection().getAttachment(),
		transaction.getInterface(), blobId, stream);
}

std::unique_ptr<BlobHandle> Cursor::openBlob(const ISC_QUAD& blobId)
{
	TransactionManager& transaction = getTransaction();

	return BlobWrapper::open(getConnection().getAttachment(),
		transaction.getInterface(), blobId);
}

ArrayDescriptor Cursor::lookupArray(const std::string& relation, const std::string& field)
{
	TransactionManager& transaction = getTransaction();
	Connection& connection = getConnection();
	ClientLibrary& client = ClientLibrary::get();

	ArrayDescriptor result;
	memset(&result.desc, 0, sizeof(result.desc));
	result.subType = connection.getArraySubType(relation, field);

	isc_db_handle db = client.getDatabaseHandle(connection.getAttachment());
	isc_tr_handle tra = client.getTransactionHandle(transaction.getInterface());

	client.arrayLookupBounds(&db, &tra, relation, field, &result.desc);
	return result;
}

void Cursor::putSlice(ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data)
{
	TransactionManager& transaction = getTransaction();
	ClientLibrary& client = ClientLibrary::get();

	isc_db_handle db = client.getDatabaseHandle(getConnection().getAttachment());
	isc_tr_handle tra = client.getTransactionHandle(transaction.getInterface());
	ISC_LONG length = (ISC_LONG) data.size();

	client.arrayPutSlice(&db, &tra, &arrayId, &desc.desc, data.data(), &length);
}

void Cursor::getSlice(const ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data)
{
	TransactionManager& transaction = getTransaction();
	ClientLibrary& client = ClientLibrary::get();

	isc_db_handle db = client.getDatabaseHandle(getConnection().getAttachment());
	isc_tr_handle tra = client.getTransactionHandle(transaction.getInterface());
	ISC_QUAD id = arrayId;
	ISC_LONG length = (ISC_LONG) data.size();

	client.arrayGetSlice(&db, &tra, &id, &desc.desc, data.data(), &length);
}

void Cursor::trackReader(std::shared_ptr<BlobReader> reader)
{
	m_readers.push_back(reader);
}

} // namespace FbDriver
