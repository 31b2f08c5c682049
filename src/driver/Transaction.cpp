/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Transaction.cpp
 *	DESCRIPTION:	Transaction management.
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

#include "../driver/Transaction.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Connection.h"
#include "../driver/Cursor.h"
#include "../common/fbd_exception.h"
#include "../common/log/LogWriter.h"

#include <algorithm>

using namespace Firebird;

namespace FbDriver {

namespace
{
	const std::vector<Connection*>& checkConnections(const std::vector<Connection*>& connections)
	{
		if (connections.empty())
			InterfaceError::raise("Distributed transaction needs at least one connection");

		for (size_t i = 0; i < connections.size(); ++i)
		{
			if (!connections[i] || connections[i]->isClosed())
				InterfaceError::raise("Connection %u of distributed transaction is not open", unsigned(i));

			if (std::find(connections.begin(), connections.begin() + i, connections[i]) !=
				connections.begin() + i)
			{
				InterfaceError::raise("Connection %u appears twice in distributed transaction",
					unsigned(i));
			}
		}

		return connections;
	}
}

TransactionManager::TransactionManager(Connection& connection, const Bytes& defaultTpb,
		DefaultAction action)
	: m_connections(1, &connection),
	  m_defaultTpb(defaultTpb),
	  m_defaultAction(action),
	  m_info(*this),
	  m_closed(false)
{
}

TransactionManager::TransactionManager(const std::vector<Connection*>& connections,
		const Bytes& defaultTpb, DefaultAction action)
	: m_connections(connections),
	  m_defaultTpb(defaultTpb),
	  m_defaultAction(action),
	  m_info(*this),
	  m_closed(false)
{
}

TransactionManager::~TransactionManager()
{
	try
	{
		close();
	}
	catch (const Error& ex)
	{
		logError("Error closing transaction: " + ex.getMessage());
	}

	// Cursors outliving the manager become unusable
	const std::vector<Cursor*> cursors(m_cursors);
	m_cursors.clear();

	for (auto cursor : cursors)
		cursor->detachTransaction();
}

void TransactionManager::checkOpen() const
{
	if (m_closed)
		InterfaceError::raise("TransactionManager is closed");
}

void TransactionManager::checkActive() const
{
	checkOpen();

	if (!isActive())
		InterfaceError::raise("Transaction is not active");
}

ITransaction* TransactionManager::getInterface() const
{
	checkActive();
	return m_transaction.get();
}

Connection& TransactionManager::getConnection() const
{
	checkOpen();

	if (m_connections.size() != 1)
		InterfaceError::raise("Distributed transaction is not bound to a single connection");

	return *m_connections.front();
}

void TransactionManager::begin()
{
	begin(m_defaultTpb);
}

void TransactionManager::begin(const Bytes& tpb)
{
	checkOpen();

	// previous transaction (if any) must be ended
	finish(m_defaultAction);

	ITransaction* const transaction = m_connections.size() == 1 ?
		m_connections.front()->getAttachment()->startTransaction(
			ClientLibrary::get().getStatus(), (unsigned) tpb.size(), tpb.data()) :
		startDistributed(tpb);

	m_transaction.reset(checkInterface(transaction));
}

ITransaction* TransactionManager::startDistributed(const Bytes& tpb)
{
	StatusWrapper* const status = ClientLibrary::get().getStatus();
	AutoDispose<IDtcStart> builder(ClientLibrary::get().getMaster()->getDtc()->startBuilder(status));

	for (auto connection : m_connections)
	{
		builder->addWithTpb(status, connection->getAttachment(), (unsigned) tpb.size(),
			tpb.data());
	}

	// start() disposes the builder when it succeeds
	ITransaction* const transaction = builder->start(status);
	builder.forget();

	return transaction;
}

void TransactionManager::commit(bool retaining)
{
	checkActive();
	StatusWrapper* const status = ClientLibrary::get().getStatus();

	if (retaining)
		m_transaction->commitRetaining(status);
	else
	{
		closeCursors();
		m_transaction->commit(status);
		m_transaction.forget();
	}
}

void TransactionManager::rollback(bool retaining, const std::string& savepoint)
{
	checkActive();

	if (retaining && !savepoint.empty())
		InterfaceError::raise("Can't rollback to savepoint while retaining context");

	if (!savepoint.empty())
	{
		executeImmediate("rollback to " + savepoint);
		return;
	}

	StatusWrapper* const status = ClientLibrary::get().getStatus();

	if (retaining)
		m_transaction->rollbackRetaining(status);
	else
	{
		closeCursors();
		m_transaction->rollback(status);
		m_transaction.forget();
	}
}

void TransactionManager::savepoint(const std::string& name)
{
	executeImmediate("SAVEPOINT " + name);
}

void TransactionManager::executeImmediate(const std::string& sql)
{
	checkOpen();

	if (!isActive())
		begin();

	for (auto connection : m_connections)
	{
		connection->getAttachment()->execute(ClientLibrary::get().getStatus(), m_transaction.get(),
			(unsigned) sql.length(), sql.c_str(), connection->getSqlDialect(),
			nullptr, nullptr, nullptr, nullptr);
	}
}

std::unique_ptr<Cursor> TransactionManager::cursor()
{
	checkOpen();
	return std::unique_ptr<Cursor>(new Cursor(*this));
}

void TransactionManager::close()
{
	if (m_closed)
		return;

	try
	{
		finish(m_defaultAction);
	}
	catch (const Error&)
	{
		unregister();
		throw;
	}

	unregister();
}

void TransactionManager::unregister()
{
	m_closed = true;

	for (auto connection : m_connections)
		connection->unregisterTransaction(this);
}

void TransactionManager::finish(DefaultAction action)
{
	if (!isActive())
		return;

	try
	{
		if (action == ACTION_COMMIT)
			commit();
		else
			rollback();
	}
	catch (const Error&)
	{
		m_transaction.reset();
		throw;
	}
}

SINT64 TransactionManager::transactionId()
{
	checkActive();

	const UCHAR items[] = {isc_info_tra_id, isc_info_end};
	UCHAR buffer[BUFFER_TINY];

	m_transaction->getInfo(ClientLibrary::get().getStatus(), sizeof(items), items,
		sizeof(buffer), buffer);

	if (buffer[0] != isc_info_tra_id)
		InterfaceError::raise("Unexpected transaction information item %d", int(buffer[0]));

	const unsigned length = (unsigned) vaxInteger(buffer + 1, 2);
	return vaxInteger(buffer + 3, length);
}

void TransactionManager::registerCursor(Cursor* cursor)
{
	m_cursors.push_back(cursor);
}

void TransactionManager::unregisterCursor(Cursor* cursor)
{
	m_cursors.erase(std::remove(m_cursors.begin(), m_cursors.end(), cursor), m_cursors.end());
}

void TransactionManager::closeCursors()
{
	const std::vector<Cursor*> cursors(m_cursors);

	for (auto cursor : cursors)
		cursor->close();
}


DistributedTransactionManager::DistributedTransactionManager(
		const std::vector<Connection*>& connections, const Bytes& defaultTpb, DefaultAction action)
	: TransactionManager(checkConnections(connections),
		defaultTpb.empty() ? TpbOptions().build() : defaultTpb, action)
{
	for (auto connection : connections)
		connection->registerTransaction(this);
}

void DistributedTransactionManager::prepare()
{
	getInterface()->prepare(ClientLibrary::get().getStatus(), 0, nullptr);
}

std::unique_ptr<Cursor> DistributedTransactionManager::cursor(Connection& connection)
{
	checkOpen();

	const std::vector<Connection*>& connections = getConnections();

	if (std::find(connections.begin(), connections.end(), &connection) == connections.end())
	{
		InterfaceError::raise("Cannot create cursor for connection that does not belong "
			"to this distributed transaction");
	}

	return std::unique_ptr<Cursor>(new Cursor(*this, connection));
}


TransactionGuard::TransactionGuard(TransactionManager& transaction, bool bypass)
	: m_transaction(transaction),
	  m_owner(!(bypass && transaction.isActive())),
	  m_done(false)
{
	if (m_owner)
		m_transaction.begin();
}

TransactionGuard::~TransactionGuard()
{
	if (!m_owner || m_done || !m_transaction.isActive())
		return;

	try
	{
		m_transaction.rollback();
	}
	catch (const Error& ex)
	{
		logError("Error rolling back transaction: " + ex.getMessage());
	}
}

void TransactionGuard::commit()
{
	if (m_owner && !m_done)
		m_transaction.commit();

	m_done = true;
}

} // namespace FbDriver
