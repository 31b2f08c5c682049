/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			EventCollector.h
 *	DESCRIPTION:	Collection of database events.
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

#ifndef FBDRIVER_DRIVER_EVENT_COLLECTOR_H
#define FBDRIVER_DRIVER_EVENT_COLLECTOR_H

#include "firebird/Interface.h"
#include "../common/common.h"

#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace FbDriver {

class Connection;
class EventBlock;

typedef std::map<std::string, int> EventCounts;

// Receives notifications from the thread of the client library.
// Implementations must only record the fact and return.

class EventSink
{
public:
	virtual ~EventSink()
	{ }

	virtual void notify(EventBlock* block) = 0;
};

// Interest in up to MAX_EVENT_NAMES events

class EventBlock
{
public:
	virtual ~EventBlock()
	{ }

	virtual const std::vector<std::string>& getNames() const = 0;

	// Registers interest, the sink is notified once per registration
	virtual void queue() = 0;

	// Counts since the previous notification, in order of names
	virtual void getCounts(std::vector<ULONG>& counts) = 0;

	// After return the sink is not notified anymore
	virtual void cancel() = 0;
};

class EventBlockFactory
{
public:
	virtual ~EventBlockFactory()
	{ }

	virtual std::unique_ptr<EventBlock> create(const std::vector<std::string>& names, EventSink& sink) = 0;
};

// Blocks registered through IAttachment::queEvents()
std::unique_ptr<EventBlockFactory> createNativeBlockFactory(Firebird::IAttachment* attachment);


class EventCollector : private EventSink
{
public:
	EventCollector(const std::vector<std::string>& names, std::unique_ptr<EventBlockFactory> factory);
	~EventCollector();

	// Starts the dispatch thread and registers all blocks
	void begin();

	// Waits until some event arrives or timeout (milliseconds, negative waits forever)
	// elapses and returns copy of counts accumulated since flush().
	EventCounts wait(int timeout = -1);

	// Resets counts, registration stays
	void flush();

	void close();

	bool isClosed() const
	{
		return m_closed;
	}

	const std::vector<std::string>& getNames() const
	{
		return m_names;
	}

	// Called by the connection owning the collector
	void setConnection(Connection* connection)
	{
		m_connection = connection;
	}

private:
	enum Operation
	{
		OP_RECORD_AND_REREGISTER,
		OP_DIE
	};

	struct Message
	{
		Operation operation;
		EventBlock* block;
	};

	void notify(EventBlock* block) override;
	void put(Operation operation, EventBlock* block);
	void dispatch();
	void countAndReregister(EventBlock* block);

	const std::vector<std::string> m_names;
	std::unique_ptr<EventBlockFactory> m_factory;
	std::vector<std::unique_ptr<EventBlock> > m_blocks;
	std::map<EventBlock*, bool> m_firstCall;

	std::mutex m_queueMutex;
	std::condition_variable m_queueCond;
	std::deque<Message> m_queue;

	std::mutex m_eventsMutex;
	std::condition_variable m_eventsCond;
	EventCounts m_events;
	bool m_ready;
	std::exception_ptr m_error;

	std::thread m_thread;
	bool m_initialized;
	bool m_closed;
	Connection* m_connection;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_EVENT_COLLECTOR_H
