/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Connection.cpp
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

#include "../driver/Connection.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Cursor.h"
#include "../driver/EventCollector.h"
#include "../driver/Statement.h"
#include "../common/fbd_exception.h"
#include "../common/log/LogWriter.h"

#include <algorithm>
#include <exception>

using namespace Firebird;

namespace FbDriver {

namespace
{
	Bytes getBuffer(IXpbBuilder* builder)
	{
		StatusWrapper* const status = ClientLibrary::get().getStatus();

		const unsigned char* const buffer = builder->getBuffer(status);
		const unsigned length = builder->getBufferLength(status);

		return Bytes(buffer, buffer + length);
	}

	IXpbBuilder* newBuilder(unsigned kind)
	{
		ClientLibrary& client = ClientLibrary::get();
		return checkInterface(client.getUtil()->getXpbBuilder(client.getStatus(), kind, nullptr, 0));
	}

	// Remembers the first error and lets the caller go on with the remaining dependents
	template <typename Action>
	void closeDependent(std::exception_ptr& firstError, Action action)
	{
		try
		{
			action();
		}
		catch (const Error& ex)
		{
			logError("Error closing connection dependent: " + ex.getMessage());

			if (!firstError)
				firstError = std::current_exception();
		}
	}

	template <typename T>
	void unregister(std::vector<T*>& registry, T* item)
	{
		registry.erase(std::remove(registry.begin(), registry.end(), item), registry.end());
	}

	const char* const RELATION_FIELD_PRECISION =
		"SELECT FIELD_SPEC.RDB$FIELD_PRECISION"
		" FROM RDB$FIELDS FIELD_SPEC, RDB$RELATION_FIELDS REL_FIELDS"
		" WHERE FIELD_SPEC.RDB$FIELD_NAME = REL_FIELDS.RDB$FIELD_SOURCE"
		" AND REL_FIELDS.RDB$RELATION_NAME = ?"
		" AND REL_FIELDS.RDB$FIELD_NAME = ?";

	const char* const PROCEDURE_PARAMETER_PRECISION =
		"SELECT FIELD_SPEC.RDB$FIELD_PRECISION"
		" FROM RDB$FIELDS FIELD_SPEC, RDB$PROCEDURE_PARAMETERS REL_FIELDS"
		" WHERE FIELD_SPEC.RDB$FIELD_NAME = REL_FIELDS.RDB$FIELD_SOURCE"
		" AND RDB$PROCEDURE_NAME = ?"
		" AND RDB$PARAMETER_NAME = ?"
		" AND RDB$PARAMETER_TYPE = 1";

	const char* const ARRAY_SUB_TYPE =
		"SELECT FIELD_SPEC.RDB$FIELD_SUB_TYPE"
		" FROM RDB$FIELDS FIELD_SPEC, RDB$RELATION_FIELDS REL_FIELDS"
		" WHERE FIELD_SPEC.RDB$FIELD_NAME = REL_FIELDS.RDB$FIELD_SOURCE"
		" AND REL_FIELDS.RDB$RELATION_NAME = ?"
		" AND REL_FIELDS.RDB$FIELD_NAME = ?";

	int firstInteger(const std::optional<Row>& row)
	{
		if (!row || row->empty() || (*row)[0].isNull())
			return 0;

		return int((*row)[0].asInteger());
	}
}


// FbDriver::TpbOptions class

Bytes TpbOptions::build() const
{
	StatusWrapper* const status = ClientLibrary::get().getStatus();
	AutoDispose<IXpbBuilder> tpb(newBuilder(IXpbBuilder::TPB));

	switch (isolation)
	{
	case SNAPSHOT:
		tpb->insertTag(status, isc_tpb_concurrency);
		break;

	case SERIALIZABLE:
		tpb->insertTag(status, isc_tpb_consistency);
		break;

	case READ_COMMITTED_RECORD_VERSION:
		tpb->insertTag(status, isc_tpb_read_committed);
		tpb->insertTag(status, isc_tpb_rec_version);
		break;

	case READ_COMMITTED_NO_RECORD_VERSION:
		tpb->insertTag(status, isc_tpb_read_committed);
		tpb->insertTag(status, isc_tpb_no_rec_version);
		break;
	}

	tpb->insertTag(status, readOnly ? isc_tpb_read : isc_tpb_write);

	if (lockTimeout < 0)
		tpb->insertTag(status, isc_tpb_wait);
	else if (lockTimeout == 0)
		tpb->insertTag(status, isc_tpb_nowait);
	else
	{
		tpb->insertTag(status, isc_tpb_wait);
		tpb->insertInt(status, isc_tpb_lock_timeout, lockTimeout);
	}

	for (const auto& reservation : reservations)
	{
		tpb->insertString(status, reservation.write ? isc_tpb_lock_write : isc_tpb_lock_read,
			reservation.table.c_str());

		switch (reservation.share)
		{
		case SHARED:
			tpb->insertTag(status, isc_tpb_shared);
			break;

		case PROTECTED:
			tpb->insertTag(status, isc_tpb_protected);
			break;

		case EXCLUSIVE:
			tpb->insertTag(status, isc_tpb_exclusive);
			break;
		}
	}

	return getBuffer(tpb.get());
}


// FbDriver::ConnectOptions class

ConnectOptions::ConnectOptions()
	: sqlDialect(3),
	  timeout(0),
	  pageSize(0),
	  forcedWrites(-1)
{
}

ConnectOptions ConnectOptions::fromConfig(const DatabaseConfig& config)
{
	ConnectOptions options;

	options.user = config.user;
	options.password = config.password;
	options.role = config.role;
	options.charset = config.charset;
	options.sqlDialect = config.sqlDialect;
	options.timeout = config.timeout;
	options.sessionTimeZone = config.sessionTimeZone;
	options.pageSize = config.pageSize;
	options.forcedWrites = config.forcedWrites;

	return options;
}

Bytes ConnectOptions::buildDpb(bool create) const
{
	StatusWrapper* const status = ClientLibrary::get().getStatus();
	AutoDispose<IXpbBuilder> dpb(newBuilder(IXpbBuilder::DPB));

	if (!user.empty())
		dpb->insertString(status, isc_dpb_user_name, user.c_str());

	if (!password.empty())
		dpb->insertString(status, isc_dpb_password, password.c_str());

	if (!role.empty())
		dpb->insertString(status, isc_dpb_sql_role_name, role.c_str());

	if (!charset.empty())
		dpb->insertString(status, isc_dpb_lc_ctype, charset.c_str());

	dpb->insertInt(status, isc_dpb_sql_dialect, (int) sqlDialect);

	if (timeout)
		dpb->insertInt(status, isc_dpb_connect_timeout, (int) timeout);

	if (!sessionTimeZone.empty())
		dpb->insertString(status, isc_dpb_session_time_zone, sessionTimeZone.c_str());

	if (forcedWrites >= 0)
		dpb->insertInt(status, isc_dpb_force_write, forcedWrites ? 1 : 0);

	if (create)
	{
		if (pageSize)
			dpb->insertInt(status, isc_dpb_page_size, (int) pageSize);

		if (!charset.empty())
			dpb->insertString(status, isc_dpb_set_db_charset, charset.c_str());
	}

	Bytes result = getBuffer(dpb.get());
	result.insert(result.end(), extraDpb.begin(), extraDpb.end());

	return result;
}


// FbDriver::Connection class

std::unique_ptr<Connection> Connection::connect(const std::string& database)
{
	std::string path;
	ConnectOptions options = ConnectOptions::fromConfig(DriverConfig::get()->defaults);
	resolveDatabase(database, path, options);

	return attach(path, options, false);
}

std::unique_ptr<Connection> Connection::connect(const std::string& database,
	const ConnectOptions& options)
{
	std::string path;
	ConnectOptions unused;
	resolveDatabase(database, path, unused);

	return attach(path, options, false);
}

std::unique_ptr<Connection> Connection::createDatabase(const std::string& database)
{
	std::string path;
	ConnectOptions options = ConnectOptions::fromConfig(DriverConfig::get()->defaults);
	resolveDatabase(database, path, options);

	return attach(path, options, true);
}

std::unique_ptr<Connection> Connection::createDatabase(const std::string& database,
	const ConnectOptions& options)
{
	std::string path;
	ConnectOptions unused;
	resolveDatabase(database, path, unused);

	return attach(path, options, true);
}

void Connection::resolveDatabase(const std::string& name, std::string& path, ConnectOptions& options)
{
	const DatabaseConfig* const config = DriverConfig::get()->findDatabase(name);

	if (config)
	{
		path = config->database.empty() ? name : config->database;
		options = ConnectOptions::fromConfig(*config);
	}
	else
		path = name;
}

std::unique_ptr<Connection> Connection::attach(const std::string& database,
	const ConnectOptions& options, bool create)
{
	ClientLibrary& client = ClientLibrary::get();
	StatusWrapper* const status = client.getStatus();

	AutoRelease<IProvider> provider(checkInterface(client.getDispatcher()));
	const Bytes dpb = options.buildDpb(create);

	IAttachment* const attachment = create ?
		provider->createDatabase(status, database.c_str(), (unsigned) dpb.size(), dpb.data()) :
		provider->attachDatabase(status, database.c_str(), (unsigned) dpb.size(), dpb.data());

	logVerbose(std::string(create ? "Created database " : "Attached to database ") + database);

	return std::unique_ptr<Connection>(new Connection(attachment, options));
}

Connection::Connection(IAttachment* attachment, const ConnectOptions& options)
	: m_attachment(attachment),
	  m_charset(options.charset),
	  m_sqlDialect(options.sqlDialect),
	  m_streamBlobThreshold(DriverConfig::get()->streamBlobThreshold),
	  m_info(*this)
{
	checkInterface(attachment);

	m_defaultTpb = TpbOptions().build();

	m_main.reset(new TransactionManager(*this, m_defaultTpb, ACTION_COMMIT));
	m_query.reset(new TransactionManager(*this,
		TpbOptions(TpbOptions::READ_COMMITTED_RECORD_VERSION, true).build(), ACTION_COMMIT));
}

Connection::~Connection()
{
	try
	{
		close();
	}
	catch (const Error& ex)
	{
		logError("Error closing connection: " + ex.getMessage());
	}
}

void Connection::checkOpen() const
{
	if (isClosed())
		InterfaceError::raise("Connection is closed");
}

IAttachment* Connection::getAttachment() const
{
	checkOpen();
	return m_attachment.get();
}

void Connection::closeDependents()
{
	std::exception_ptr firstError;

	closeDependent(firstError, [this] { m_internalCursor.reset(); });

	const std::vector<EventCollector*> collectors(m_collectors);

	for (auto collector : collectors)
		closeDependent(firstError, [collector] { collector->close(); });

	closeDependent(firstError, [this] { m_main->finish(ACTION_ROLLBACK); });
	closeDependent(firstError, [this] { m_query->finish(ACTION_ROLLBACK); });

	const std::vector<TransactionManager*> transactions(m_transactions);

	for (auto transaction : transactions)
	{
		closeDependent(firstError, [transaction]
		{
			transaction->setDefaultAction(ACTION_ROLLBACK);
			transaction->close();
		});
	}

	const std::vector<Statement*> statements(m_statements);

	for (auto statement : statements)
		closeDependent(firstError, [statement] { statement->free(); });

	closeDependent(firstError, [this] { m_main->close(); });
	closeDependent(firstError, [this] { m_query->close(); });

	if (firstError)
		std::rethrow_exception(firstError);
}

void Connection::close()
{
	if (isClosed())
		return;

	try
	{
		closeDependents();
		m_attachment->detach(ClientLibrary::get().getStatus());
		m_attachment.forget();
	}
	catch (const Error&)
	{
		m_attachment.reset();
		throw;
	}

	logVerbose("Detached from database");
}

void Connection::dropDatabase()
{
	checkOpen();

	try
	{
		closeDependents();
		m_attachment->dropDatabase(ClientLibrary::get().getStatus());
		m_attachment.forget();
	}
	catch (const Error&)
	{
		m_attachment.reset();
		throw;
	}

	logVerbose("Database dropped");
}

void Connection::executeImmediate(const std::string& sql)
{
	checkOpen();
	m_main->executeImmediate(sql);
}

void Connection::begin()
{
	checkOpen();
	m_main->begin();
}

void Connection::begin(const Bytes& tpb)
{
	checkOpen();
	m_main->begin(tpb);
}

void Connection::commit(bool retaining)
{
	checkOpen();
	m_main->commit(retaining);
}

void Connection::rollback(bool retaining, const std::string& savepoint)
{
	checkOpen();
	m_main->rollback(retaining, savepoint);
}

void Connection::savepoint(const std::string& name)
{
	checkOpen();
	m_main->savepoint(name);
}

std::unique_ptr<Cursor> Connection::cursor()
{
	checkOpen();
	return m_main->cursor();
}

std::unique_ptr<TransactionManager> Connection::transactionManager(const Bytes& defaultTpb,
	DefaultAction action)
{
	checkOpen();

	std::unique_ptr<TransactionManager> transaction(new TransactionManager(*this,
		defaultTpb.empty() ? m_defaultTpb : defaultTpb, action));
	registerTransaction(transaction.get());

	return transaction;
}

std::unique_ptr<TransactionManager> Connection::transactionManager(const TpbOptions& options,
	DefaultAction action)
{
	return transactionManager(options.build(), action);
}

std::unique_ptr<EventCollector> Connection::eventCollector(const std::vector<std::string>& names)
{
	std::unique_ptr<EventCollector> collector(new EventCollector(names,
		createNativeBlockFactory(getAttachment())));

	collector->setConnection(this);
	m_collectors.push_back(collector.get());

	return collector;
}

std::shared_ptr<Statement> Connection::prepare(const std::string& sql, TransactionManager* transaction)
{
	checkOpen();

	TransactionManager& tra = transaction ? *transaction : *m_main;
	const bool started = !tra.isActive();

	if (started)
		tra.begin();

	logVerbose("Prepare: " + sql);

	IStatement* const statement = m_attachment->prepare(ClientLibrary::get().getStatus(),
		tra.getInterface(), 0, sql.c_str(), m_sqlDialect, IStatement::PREPARE_PREFETCH_METADATA);

	std::shared_ptr<Statement> result(new Statement(*this, statement, sql, m_sqlDialect));

	if (started)
		tra.commit();

	return result;
}

void Connection::ping()
{
	getAttachment()->ping(ClientLibrary::get().getStatus());
}

bool Connection::isActive() const
{
	return m_main && m_main->isActive();
}

TransactionManager& Connection::mainTransaction()
{
	return *m_main;
}

TransactionManager& Connection::queryTransaction()
{
	return *m_query;
}

std::vector<TransactionManager*> Connection::transactions()
{
	std::vector<TransactionManager*> result;

	result.push_back(m_main.get());
	result.push_back(m_query.get());
	result.insert(result.end(), m_transactions.begin(), m_transactions.end());

	return result;
}

Cursor& Connection::internalCursor()
{
	if (!m_internalCursor)
		m_internalCursor = m_query->cursor();

	return *m_internalCursor;
}

int Connection::determineFieldPrecision(const std::string& relation, const std::string& field)
{
	// computed columns and DB_KEY have no declaration
	if (relation.empty() || field.empty() || field == "DB_KEY" || field == "RDB$DB_KEY")
		return 0;

	const FieldKey key(relation, field);
	const auto cached = m_precisionCache.find(key);

	if (cached != m_precisionCache.end())
		return cached->second;

	checkOpen();

	const ValueList params = {Value(relation), Value(field)};
	std::optional<Row> row;

	{	// scope
		TransactionGuard guard(*m_query, true);
		Cursor& cursor = internalCursor();

		row = cursor.execute(RELATION_FIELD_PRECISION, params).fetchone();

		if (!row)
			row = cursor.execute(PROCEDURE_PARAMETER_PRECISION, params).fetchone();

		guard.commit();
	}

	if (!row)
		return 0;

	const int precision = firstInteger(row);
	m_precisionCache[key] = precision;

	return precision;
}

int Connection::getArraySubType(const std::string& relation, const std::string& field)
{
	const FieldKey key(relation, field);
	const auto cached = m_subTypeCache.find(key);

	if (cached != m_subTypeCache.end())
		return cached->second;

	checkOpen();

	const ValueList params = {Value(relation), Value(field)};
	std::optional<Row> row;

	{	// scope
		TransactionGuard guard(*m_query, true);
		row = internalCursor().execute(ARRAY_SUB_TYPE, params).fetchone();
		guard.commit();
	}

	if (!row)
		return 0;

	const int subType = firstInteger(row);
	m_subTypeCache[key] = subType;

	return subType;
}

void Connection::clearCaches()
{
	m_precisionCache.clear();
	m_subTypeCache.clear();
}

void Connection::registerStatement(Statement* statement)
{
	m_statements.push_back(statement);
}

void Connection::unregisterStatement(Statement* statement)
{
	unregister(m_statements, statement);
}

void Connection::registerTransaction(TransactionManager* transaction)
{
	m_transactions.push_back(transaction);
}

void Connection::unregisterTransaction(TransactionManager* transaction)
{
	unregister(m_transactions, transaction);
}

void Connection::unregisterCollector(EventCollector* collector)
{
	unregister(m_collectors, collector);
}

} // namespace FbDriver
