#include "boost/test/unit_test.hpp"
#include "../include/fbdriver.h"

#include <stdlib.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace FbDriver;

// Runs against a scratch database created at $FBDRIVER_TEST_DATABASE,
// for example localhost:/tmp/fbdriver_test.fdb. Skipped when it is not set.

namespace
{
	const char* testDatabase()
	{
		return getenv("FBDRIVER_TEST_DATABASE");
	}

	struct DatabaseAvailable
	{
		boost::test_tools::assertion_result operator()(boost::unit_test::test_unit_id)
		{
			const char* const database = testDatabase();
			boost::test_tools::assertion_result result(database && *database);

			if (!result)
				result.message() << "FBDRIVER_TEST_DATABASE is not set";

			return result;
		}
	};

	class DatabaseFixture
	{
	public:
		DatabaseFixture()
		{
			connection = Connection::createDatabase(testDatabase(), options());

			connection->executeImmediate(
				"create table goods (id integer not null primary key, name varchar(20), "
				"price numeric(9, 2), memo blob sub_type text, code varchar(5) character set none)");
			connection->executeImmediate(
				"create procedure add_numbers (a integer, b integer) returns (c integer) as "
				"begin c = a + b; suspend; end");
			connection->commit();
		}

		~DatabaseFixture()
		{
			try
			{
				if (connection && !connection->isClosed())
					connection->dropDatabase();
			}
			catch (const Error& ex)
			{
				BOOST_TEST_MESSAGE("Cannot drop test database: " << ex.getMessage());
			}
		}

		void insertGoods()
		{
			std::vector<ValueList> rows;
			rows.push_back({1, "apple", Decimal::fromString("1.25"), "red"});
			rows.push_back({2, "pear", Decimal::fromString("0.5"), Value()});
			rows.push_back({3, "plum", Value(), "blue"});

			connection->cursor()->executemany(
				"insert into goods (id, name, price, memo) values (?, ?, ?, ?)", rows);
			connection->commit();
		}

		static ConnectOptions options()
		{
			ConnectOptions result;
			result.user = getenv("ISC_USER") ? getenv("ISC_USER") : "SYSDBA";
			result.password = getenv("ISC_PASSWORD") ? getenv("ISC_PASSWORD") : "masterkey";
			result.charset = "UTF8";
			return result;
		}

		// Closed connection is replaced, drop needs a fresh attachment
		void reconnect()
		{
			connection = Connection::connect(testDatabase(), options());
		}

		SINT64 countGoods()
		{
			std::unique_ptr<Cursor> cursor = connection->cursor();
			const std::optional<Row> row = cursor->execute("select count(*) from goods").fetchone();
			return row ? (*row)[0].asInteger() : -1;
		}

		std::unique_ptr<Connection> connection;
	};
}

BOOST_AUTO_TEST_SUITE(DriverSuite)
BOOST_FIXTURE_TEST_SUITE(DatabaseSuite, DatabaseFixture,
	* boost::unit_test::precondition(DatabaseAvailable()))


BOOST_AUTO_TEST_CASE(ExecuteAndFetchTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	const std::vector<Row> rows =
		cursor->execute("select id, name, price, memo from goods order by id").fetchall();

	BOOST_TEST(rows.size() == 3u);
	BOOST_TEST(rows[0][0].asInteger() == 1);
	BOOST_TEST(rows[0][1].asText() == "apple");
	BOOST_TEST(rows[0][2].asDecimal().toString() == "1.25");
	BOOST_TEST(rows[0][3].asText() == "red");
	BOOST_TEST(rows[1][2].asDecimal().toString() == "0.50");
	BOOST_TEST(rows[1][3].isNull());
	BOOST_TEST(rows[2][2].isNull());

	BOOST_TEST(!cursor->fetchone().has_value());
}

BOOST_AUTO_TEST_CASE(FetchBeforeExecuteTest)
{
	std::unique_ptr<Cursor> cursor = connection->cursor();

	try
	{
		cursor->fetchone();
		BOOST_FAIL("InterfaceError expected");
	}
	catch (const InterfaceError& ex)
	{
		BOOST_TEST(ex.getMessage() == "Cannot fetch from cursor that did not executed a statement.");
	}

	cursor->execute("update goods set name = name");
	BOOST_TEST(!cursor->fetchone().has_value());
	BOOST_TEST(cursor->fetchall().empty());
}

BOOST_AUTO_TEST_CASE(FetchManyTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	cursor->execute("select id from goods order by id");

	BOOST_TEST(cursor->fetchmany().size() == 1u);

	cursor->setArraySize(5);
	const std::vector<Row> rest = cursor->fetchmany();

	BOOST_TEST(rest.size() == 2u);
	BOOST_TEST(rest[1][0].asInteger() == 3);
}

BOOST_AUTO_TEST_CASE(StatementReuseTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	const std::string sql = "select name from goods where id = ?";

	cursor->execute(sql, {1});
	const std::shared_ptr<Statement> first = cursor->getStatement();
	BOOST_TEST((*cursor->fetchone())[0].asText() == "apple");

	cursor->execute(sql, {2});
	BOOST_TEST(cursor->getStatement().get() == first.get());
	BOOST_TEST((*cursor->fetchone())[0].asText() == "pear");

	cursor->execute("select count(*) from goods");
	BOOST_TEST(first->isFreed());
}

BOOST_AUTO_TEST_CASE(PreparedStatementTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	const std::shared_ptr<Statement> statement = cursor->prepare("select price from goods where id = ?");

	BOOST_TEST(statement->getType() == unsigned(isc_info_sql_stmt_select));
	BOOST_TEST(statement->hasCursor());
	BOOST_TEST(statement->getInputLayout().getCount() == 1u);

	cursor->execute(statement, {1});
	BOOST_TEST((*cursor->fetchone())[0].asDecimal().toString() == "1.25");

	cursor->close();
	BOOST_TEST(!statement->isFreed());

	cursor->execute(statement, {3});
	BOOST_TEST((*cursor->fetchone())[0].isNull());

	BOOST_CHECK_THROW(cursor->execute(statement, {1, 2}), ProgrammingError);
}

BOOST_AUTO_TEST_CASE(DescriptionTest)
{
	std::unique_ptr<Cursor> cursor = connection->cursor();
	BOOST_TEST(cursor->description().empty());

	cursor->execute("select id, name, price as cost from goods");
	const std::vector<ColumnDescription> desc = cursor->description();

	BOOST_TEST(desc.size() == 3u);
	BOOST_TEST(desc[0].name == "ID");
	BOOST_TEST(desc[0].typeCode == Value::INTEGER);
	BOOST_TEST(!desc[0].nullable);
	BOOST_TEST(desc[1].name == "NAME");
	BOOST_TEST(desc[1].typeCode == Value::TEXT);
	BOOST_TEST(desc[1].displaySize == 20);
	BOOST_TEST(desc[2].name == "COST");
	BOOST_TEST(desc[2].typeCode == Value::DECIMAL);
	BOOST_TEST(desc[2].precision == 9);
	BOOST_TEST(desc[2].scale == -2);
}

BOOST_AUTO_TEST_CASE(AffectedRowsTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	BOOST_TEST(cursor->affectedRows() == -1);

	cursor->execute("update goods set price = 1 where id < 3");
	BOOST_TEST(cursor->affectedRows() == 2);

	cursor->execute("delete from goods");
	BOOST_TEST(cursor->affectedRows() == 3);
}

BOOST_AUTO_TEST_CASE(CallProcedureTest)
{
	std::unique_ptr<Cursor> cursor = connection->cursor();
	const std::optional<Row> row = cursor->callproc("add_numbers", {2, 3});

	BOOST_REQUIRE(row.has_value());
	BOOST_TEST((*row)[0].asInteger() == 5);
}

BOOST_AUTO_TEST_CASE(TextParameterTest)
{
	std::unique_ptr<Cursor> cursor = connection->cursor();

	// strings are passed as text and converted by the engine
	cursor->execute("insert into goods (id, name, price) values (?, ?, ?)", {"10", 42, "3.5"});

	const std::optional<Row> row = cursor->execute("select name, price from goods where id = 10").fetchone();

	BOOST_REQUIRE(row.has_value());
	BOOST_TEST((*row)[0].asText() == "42");
	BOOST_TEST((*row)[1].asDecimal().toString() == "3.50");

	BOOST_CHECK_THROW(cursor->execute("insert into goods (id, name) values (11, ?)",
		{"a name much longer than twenty characters"}), DatabaseError);
}

BOOST_AUTO_TEST_CASE(BlobReaderTest)
{
	const std::string memo(100, 'm');

	{
		std::unique_ptr<Cursor> cursor = connection->cursor();
		cursor->execute("insert into goods (id, memo) values (1, ?)", {memo});
		connection->commit();
	}

	std::unique_ptr<Cursor> cursor = connection->cursor();
	cursor->setStreamBlobThreshold(10);

	const std::optional<Row> row = cursor->execute("select memo from goods").fetchone();
	BOOST_REQUIRE(row.has_value());
	BOOST_REQUIRE((*row)[0].getKind() == Value::BLOB_READER);

	const std::shared_ptr<BlobReader> reader = (*row)[0].asReader();
	BOOST_TEST(reader->length() == 100);
	BOOST_TEST(reader->read(10) == std::string(10, 'm'));
	BOOST_TEST(reader->read().length() == 90u);

	cursor->close();
	BOOST_TEST(reader->isClosed());
}

BOOST_AUTO_TEST_CASE(TransactionManagerTest)
{
	std::unique_ptr<TransactionManager> transaction =
		connection->transactionManager(TpbOptions(), ACTION_ROLLBACK);

	BOOST_TEST(!transaction->isActive());

	{
		std::unique_ptr<Cursor> cursor = transaction->cursor();
		cursor->execute("insert into goods (id) values (1)");
		BOOST_TEST(transaction->isActive());
		BOOST_TEST(transaction->transactionId() > 0);
	}

	transaction->close();
	BOOST_TEST(transaction->isClosed());
	BOOST_TEST(countGoods() == 0);

	BOOST_CHECK_THROW(transaction->begin(), InterfaceError);
}

BOOST_AUTO_TEST_CASE(SavepointTest)
{
	connection->begin();
	connection->executeImmediate("insert into goods (id) values (1)");
	connection->savepoint("S1");
	connection->executeImmediate("insert into goods (id) values (2)");

	BOOST_CHECK_THROW(connection->rollback(true, "S1"), InterfaceError);

	connection->rollback(false, "S1");
	BOOST_TEST(connection->isActive());
	connection->commit();

	BOOST_TEST(!connection->isActive());
	BOOST_TEST(countGoods() == 1);
}

BOOST_AUTO_TEST_CASE(TransactionGuardTest)
{
	TransactionManager& main = connection->mainTransaction();

	{
		TransactionGuard guard(main);
		main.executeImmediate("insert into goods (id) values (1)");
	}

	BOOST_TEST(!main.isActive());
	BOOST_TEST(countGoods() == 0);

	{
		TransactionGuard guard(main);
		main.executeImmediate("insert into goods (id) values (2)");
		guard.commit();
	}

	connection->commit();
	BOOST_TEST(countGoods() == 1);
}

BOOST_AUTO_TEST_CASE(IntegrityErrorTest)
{
	insertGoods();

	std::unique_ptr<Cursor> cursor = connection->cursor();

	try
	{
		cursor->execute("insert into goods (id) values (1)");
		BOOST_FAIL("IntegrityError expected");
	}
	catch (const IntegrityError& ex)
	{
		BOOST_TEST(ex.getSqlState().substr(0, 2) == "23");
		BOOST_TEST(!ex.getGdsCodes().empty());
	}

	BOOST_CHECK_THROW(cursor->execute("select * from no_such_table"), ProgrammingError);
}

BOOST_AUTO_TEST_CASE(EventsTest)
{
	std::unique_ptr<EventCollector> collector = connection->eventCollector({"GOODS_CHANGED"});
	collector->begin();

	connection->executeImmediate(
		"execute block as begin post_event 'GOODS_CHANGED'; post_event 'GOODS_CHANGED'; end");
	connection->commit();

	const EventCounts counts = collector->wait(10000);
	BOOST_TEST(counts.at("GOODS_CHANGED") == 2);

	collector->close();
}

BOOST_AUTO_TEST_CASE(CloseConnectionTest)
{
	std::unique_ptr<Cursor> cursor = connection->cursor();
	cursor->execute("select id from goods");

	std::unique_ptr<TransactionManager> transaction = connection->transactionManager();
	transaction->begin();

	connection->close();

	BOOST_TEST(connection->isClosed());
	BOOST_TEST(transaction->isClosed());
	BOOST_CHECK_THROW(cursor->execute("select id from goods"), InterfaceError);
	BOOST_CHECK_THROW(connection->ping(), InterfaceError);

	cursor.reset();
	transaction.reset();

	reconnect();
	connection->ping();
}

BOOST_AUTO_TEST_CASE(CloseRollsBackTest)
{
	// default action of the manager is commit, closing the connection still rolls back
	std::unique_ptr<TransactionManager> transaction = connection->transactionManager();

	{
		std::unique_ptr<Cursor> cursor = transaction->cursor();
		cursor->execute("insert into goods (id, name) values (1, 'secondary')");
	}

	connection->executeImmediate("insert into goods (id, name) values (2, 'main')");

	BOOST_TEST(transaction->isActive());
	BOOST_TEST(connection->isActive());

	connection->close();

	BOOST_TEST(transaction->isClosed());
	BOOST_TEST(!transaction->isActive());
	BOOST_CHECK_THROW(transaction->begin(), InterfaceError);

	reconnect();
	BOOST_TEST(countGoods() == 0);
}

BOOST_AUTO_TEST_CASE(DependentsOutliveConnectionTest)
{
	std::unique_ptr<TransactionManager> transaction = connection->transactionManager();
	std::unique_ptr<Cursor> cursor = transaction->cursor();
	const std::shared_ptr<Statement> statement = cursor->prepare("select id from goods");
	std::unique_ptr<EventCollector> collector = connection->eventCollector({"GOODS_CHANGED"});
	collector->begin();

	connection.reset();

	// everything is detached, using or destroying it does not touch the connection
	BOOST_TEST(transaction->isClosed());
	BOOST_TEST(statement->isFreed());
	BOOST_TEST(collector->isClosed());
	BOOST_CHECK_THROW(cursor->execute(statement), InterfaceError);
	BOOST_CHECK_THROW(transaction->cursor(), InterfaceError);

	cursor.reset();
	collector.reset();
	transaction.reset();

	reconnect();
	connection->ping();
}

BOOST_AUTO_TEST_CASE(FullWidthVarcharTest)
{
	connection->executeImmediate("insert into goods (id, code) values (1, 'hello')");
	connection->executeImmediate("insert into goods (id, code) values (2, 'ab')");
	connection->commit();

	std::unique_ptr<Cursor> cursor = connection->cursor();
	const std::vector<Row> rows = cursor->execute("select code from goods order by id").fetchall();

	BOOST_REQUIRE(rows.size() == 2u);
	BOOST_TEST(rows[0][0].asText() == "hello");
	BOOST_TEST(rows[1][0].asText() == "ab");

	cursor->execute("update goods set code = ? where id = 2", {"world"});
	BOOST_CHECK_THROW(cursor->execute("update goods set code = ? where id = 2", {"worlds"}), DataError);
}


BOOST_AUTO_TEST_CASE(DatabaseInfoTest)
{
	DatabaseInfo& info = connection->info();

	BOOST_TEST(info.pageSize() >= 4096u);
	BOOST_TEST(info.sqlDialect() == 3u);
	BOOST_TEST(info.odsVersion() >= 12u);
	BOOST_TEST(info.attachmentId() > 0);
	BOOST_TEST(!info.readOnly());
	BOOST_TEST(!info.firebirdVersion().empty());
	BOOST_TEST(info.engineVersion() >= 3.0);
	BOOST_TEST(!info.databaseName().empty());

	connection->begin();
	const SINT64 id = connection->mainTransaction().transactionId();
	const std::vector<SINT64> active = info.activeTransactions();

	BOOST_TEST((std::find(active.begin(), active.end(), id) != active.end()));
	BOOST_TEST(info.activeTransactionCount() >= 1);
	BOOST_TEST(info.nextTransaction() >= id);
	BOOST_TEST(info.oldestActive() <= id);

	connection->commit();
}

BOOST_AUTO_TEST_CASE(TransactionInfoTest)
{
	TransactionInfo& info = connection->mainTransaction().info();
	BOOST_CHECK_THROW(info.id(), InterfaceError);

	connection->begin();

	BOOST_TEST(info.id() == connection->mainTransaction().transactionId());
	BOOST_TEST(!info.readOnly());
	BOOST_TEST(info.lockTimeout() == -1);
	BOOST_TEST(info.isolation().level == isc_info_tra_concurrency);
	BOOST_TEST(info.oldestActive() <= info.id());

	connection->commit();

	std::unique_ptr<TransactionManager> transaction = connection->transactionManager(
		TpbOptions(TpbOptions::READ_COMMITTED_RECORD_VERSION, true, 0));
	transaction->begin();

	BOOST_TEST(transaction->info().readOnly());
	BOOST_TEST(transaction->info().lockTimeout() == 0);
	BOOST_TEST(transaction->info().isolation().level == isc_info_tra_read_committed);
}

BOOST_AUTO_TEST_CASE(DistributedTransactionTest)
{
	const std::string otherDatabase = std::string(testDatabase()) + ".2pc";
	std::unique_ptr<Connection> other = Connection::createDatabase(otherDatabase, options());
	other->executeImmediate("create table goods (id integer not null primary key, name varchar(20))");
	other->commit();

	{
		DistributedTransactionManager transaction({connection.get(), other.get()});
		BOOST_TEST(connection->transactions().size() == 3u);

		transaction.cursor(*connection)->execute("insert into goods (id, name) values (1, 'local')");
		transaction.cursor(*other)->execute("insert into goods (id, name) values (1, 'remote')");
		transaction.prepare();
		transaction.commit();
		BOOST_TEST(!transaction.isActive());

		// statement runs in both databases
		transaction.executeImmediate("insert into goods (id) values (2)");
		transaction.rollback();

		BOOST_CHECK_THROW(static_cast<TransactionManager&>(transaction).cursor(), InterfaceError);

		std::unique_ptr<Connection> stranger = Connection::connect(testDatabase(), options());
		BOOST_CHECK_THROW(transaction.cursor(*stranger), InterfaceError);
	}

	BOOST_TEST(countGoods() == 1);
	{
		std::unique_ptr<Cursor> cursor = other->cursor();
		const std::optional<Row> row = cursor->execute("select name from goods").fetchone();
		BOOST_REQUIRE(row);
		BOOST_TEST((*row)[0].asText() == "remote");
	}
	other->commit();

	// closing one of the connections rolls the whole transaction back
	std::unique_ptr<DistributedTransactionManager> transaction(
		new DistributedTransactionManager({connection.get(), other.get()}));
	transaction->executeImmediate("insert into goods (id) values (3)");

	other->close();

	BOOST_TEST(transaction->isClosed());
	BOOST_TEST(connection->transactions().size() == 2u);
	BOOST_TEST(countGoods() == 1);

	transaction.reset();

	BOOST_CHECK_THROW(DistributedTransactionManager({connection.get(), other.get()}), InterfaceError);
	BOOST_CHECK_THROW(DistributedTransactionManager({connection.get(), connection.get()}),
		InterfaceError);

	other = Connection::connect(otherDatabase, options());
	other->dropDatabase();
}


BOOST_AUTO_TEST_SUITE_END()	// DatabaseSuite
BOOST_AUTO_TEST_SUITE_END()	// DriverSuite
