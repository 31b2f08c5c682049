/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Transaction.h
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

#ifndef FBDRIVER_DRIVER_TRANSACTION_H
#define FBDRIVER_DRIVER_TRANSACTION_H

#include "firebird/Interface.h"
#include "../common/common.h"
#include "../driver/Info.h"
#include "../driver/Interfaces.h"

#include <memory>
#include <string>
#include <vector>

namespace FbDriver {

class Connection;
class Cursor;

enum DefaultAction
{
	ACTION_COMMIT,
	ACTION_ROLLBACK
};

// Sequence of transactions started with the same parameters on its connection(s).
// The default action ends an active transaction on close().

class TransactionManager
{
public:
	TransactionManager(Connection& connection, const Bytes& defaultTpb, DefaultAction action);
	virtual ~TransactionManager();

	// Ends the active transaction (default action) and starts a new one
	void begin();
	void begin(const Bytes& tpb);

	void commit(bool retaining = false);
	void rollback(bool retaining = false, const std::string& savepoint = "");
	void savepoint(const std::string& name);

	// Starts a transaction when none is active. Runs on every connection of the manager.
	void executeImmediate(const std::string& sql);

	std::unique_ptr<Cursor> cursor();

	void close();

	// Engine id of the active transaction
	SINT64 transactionId();

	// Information about the active transaction
	TransactionInfo& info()
	{
		return m_info;
	}

	bool isActive() const
	{
		return m_transaction.hasData();
	}

	bool isClosed() const
	{
		return m_closed;
	}

	DefaultAction getDefaultAction() const
	{
		return m_defaultAction;
	}

	void setDefaultAction(DefaultAction action)
	{
		m_defaultAction = action;
	}

	const Bytes& getDefaultTpb() const
	{
		return m_defaultTpb;
	}

	// Active transaction, raises when there is none
	Firebird::ITransaction* getInterface() const;

	// The only connection, raises for a distributed transaction
	Connection& getConnection() const;

	const std::vector<Connection*>& getConnections() const
	{
		return m_connections;
	}

	// Cursors are closed when the transaction ends
	void registerCursor(Cursor* cursor);
	void unregisterCursor(Cursor* cursor);

	// Ends active transaction with given action. Used by connection teardown.
	void finish(DefaultAction action);

protected:
	TransactionManager(const std::vector<Connection*>& connections, const Bytes& defaultTpb,
		DefaultAction action);

	void checkOpen() const;
	void checkActive() const;

private:
	TransactionManager(const TransactionManager&);
	TransactionManager& operator=(const TransactionManager&);

	Firebird::ITransaction* startDistributed(const Bytes& tpb);
	void closeCursors();
	void unregister();

	std::vector<Connection*> m_connections;
	const Bytes m_defaultTpb;
	DefaultAction m_defaultAction;
	AutoRelease<Firebird::ITransaction> m_transaction;
	std::vector<Cursor*> m_cursors;
	TransactionInfo m_info;
	bool m_closed;
};


// Transaction spanning several connections, committed in two phases.
// Closing any of the connections closes the manager.

class DistributedTransactionManager : public TransactionManager
{
public:
	// Empty TPB stands for SNAPSHOT with WAIT
	explicit DistributedTransactionManager(const std::vector<Connection*>& connections,
		const Bytes& defaultTpb = Bytes(), DefaultAction action = ACTION_COMMIT);

	// First phase of two-phase commit, commit() does it implicitly
	void prepare();

	// Cursor working with one of the connections
	std::unique_ptr<Cursor> cursor(Connection& connection);
};


// Runs a block inside a transaction. Begins on construction unless bypass is set and
// the manager already has an active transaction; rolls back on scope exit unless committed.

class TransactionGuard
{
public:
	explicit TransactionGuard(TransactionManager& transaction, bool bypass = false);
	~TransactionGuard();

	void commit();

private:
	TransactionManager& m_transaction;
	bool m_owner;
	bool m_done;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_TRANSACTION_H
