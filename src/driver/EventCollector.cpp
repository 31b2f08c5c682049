/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			EventCollector.cpp
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

#include "../driver/EventCollector.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Connection.h"
#include "../driver/Interfaces.h"
#include "../common/fbd_exception.h"
#include "../common/log/LogWriter.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string.h>

using namespace Firebird;

namespace FbDriver {

namespace
{
	// Callback registered with the engine. It may outlive the block when the
	// engine still holds a reference, hence separate reference counting.

	class EventCallback : public IEventCallbackImpl<EventCallback, StatusWrapper>
	{
	public:
		EventCallback(IEventBlock* eventBlock, EventSink& sink, EventBlock* owner)
			: m_refCounter(0),
			  m_eventBlock(eventBlock),
			  m_sink(&sink),
			  m_owner(owner)
		{ }

		// refCounted implementation
		void addRef()
		{
			++m_refCounter;
		}

		int release()
		{
			if (--m_refCounter == 0)
			{
				delete this;
				return 0;
			}

			return 1;
		}

		// IEventCallback implementation
		void eventCallbackFunction(unsigned int length, const ISC_UCHAR* events)
		{
			std::lock_guard<std::mutex> guard(m_mutex);

			if (!m_sink)
				return;

			memcpy(m_eventBlock->getBuffer(), events, length);
			m_sink->notify(m_owner);
		}

		void detach()
		{
			std::lock_guard<std::mutex> guard(m_mutex);
			m_sink = nullptr;
		}

	private:
		~EventCallback()
		{ }

		std::atomic<int> m_refCounter;
		std::mutex m_mutex;
		IEventBlock* const m_eventBlock;
		EventSink* m_sink;
		EventBlock* const m_owner;
	};


	class NativeEventBlock : public EventBlock
	{
	public:
		NativeEventBlock(IAttachment* attachment, const std::vector<std::string>& names,
				EventSink& sink)
			: m_attachment(attachment),
			  m_names(names),
			  m_callback(nullptr)
		{
			std::vector<const char*> pointers;

			for (const auto& name : names)
				pointers.push_back(name.c_str());

			pointers.push_back(nullptr);

			ClientLibrary& client = ClientLibrary::get();
			m_eventBlock.reset(client.getUtil()->createEventBlock(client.getStatus(), pointers.data()));

			m_callback = new EventCallback(m_eventBlock.get(), sink, this);
			m_callback->addRef();
		}

		~NativeEventBlock()
		{
			m_callback->detach();
			m_events.reset();
			m_callback->release();
		}

		const std::vector<std::string>& getNames() const override
		{
			return m_names;
		}

		void queue() override
		{
			m_events.reset();
			m_events.reset(checkInterface(m_attachment->queEvents(ClientLibrary::get().getStatus(),
				m_callback, m_eventBlock->getLength(), m_eventBlock->getValues())));
		}

		void getCounts(std::vector<ULONG>& counts) override
		{
			m_eventBlock->counts();
			const ISC_ULONG* const counters = m_eventBlock->getCounters();

			counts.assign(counters, counters + m_names.size());
		}

		void cancel() override
		{
			if (m_events.hasData())
			{
				m_events->cancel(ClientLibrary::get().getStatus());
				m_events.forget();
			}

			m_callback->detach();
		}

	private:
		IAttachment* const m_attachment;
		const std::vector<std::string> m_names;
		AutoDispose<IEventBlock> m_eventBlock;
		AutoRelease<IEvents> m_events;
		EventCallback* m_callback;
	};


	class NativeBlockFactory : public EventBlockFactory
	{
	public:
		explicit NativeBlockFactory(IAttachment* attachment)
			: m_attachment(attachment)
		{ }

		std::unique_ptr<EventBlock> create(const std::vector<std::string>& names, EventSink& sink) override
		{
			return std::unique_ptr<EventBlock>(new NativeEventBlock(m_attachment, names, sink));
		}

	private:
		IAttachment* const m_attachment;
	};

	const unsigned EVENT_BLOCK_UTIL_VERSION = 4;
}

std::unique_ptr<EventBlockFactory> createNativeBlockFactory(IAttachment* attachment)
{
	if (ClientLibrary::get().getUtilVersion() < EVENT_BLOCK_UTIL_VERSION)
	{
		throw NotSupportedError(printfString("Event collection requires client library version %u or later",
			EVENT_BLOCK_UTIL_VERSION), "0A000");
	}

	return std::unique_ptr<EventBlockFactory>(new NativeBlockFactory(attachment));
}


EventCollector::EventCollector(const std::vector<std::string>& names,
		std::unique_ptr<EventBlockFactory> factory)
	: m_names(names),
	  m_factory(std::move(factory)),
	  m_ready(false),
	  m_initialized(false),
	  m_closed(false),
	  m_connection(nullptr)
{
	if (m_names.empty())
		InterfaceError::raise("Event collector requires at least one event name");

	for (const auto& name : m_names)
		m_events[name] = 0;
}

EventCollector::~EventCollector()
{
	try
	{
		close();
	}
	catch (const Error& ex)
	{
		logError("Error closing event collector: " + ex.getMessage());
	}
}

void EventCollector::begin()
{
	if (m_closed)
		InterfaceError::raise("Event collector is closed");

	if (m_initialized)
		InterfaceError::raise("Event collection already started");

	m_thread = std::thread(&EventCollector::dispatch, this);
	m_initialized = true;

	for (size_t start = 0; start < m_names.size(); start += MAX_EVENT_NAMES)
	{
		const size_t end = std::min(m_names.size(), start + MAX_EVENT_NAMES);
		const std::vector<std::string> chunk(m_names.begin() + start, m_names.begin() + end);

		std::unique_ptr<EventBlock> block(m_factory->create(chunk, *this));
		m_firstCall[block.get()] = true;
		m_blocks.push_back(std::move(block));
	}

	for (auto& block : m_blocks)
		block->queue();
}

EventCounts EventCollector::wait(int timeout)
{
	if (!m_initialized)
		InterfaceError::raise("Event collection not initialized (begin() not called).");

	if (m_closed)
		InterfaceError::raise("Event collector is closed");

	std::unique_lock<std::mutex> guard(m_eventsMutex);
	const auto pred = [this] { return m_ready || m_error; };

	if (timeout < 0)
		m_eventsCond.wait(guard, pred);
	else
		m_eventsCond.wait_for(guard, std::chrono::milliseconds(timeout), pred);

	if (m_error)
		std::rethrow_exception(m_error);

	return m_events;
}

void EventCollector::flush()
{
	std::lock_guard<std::mutex> guard(m_eventsMutex);

	for (auto& event : m_events)
		event.second = 0;

	m_ready = false;
}

void EventCollector::close()
{
	if (m_closed)
		return;

	m_closed = true;

	if (m_connection)
	{
		Connection* const connection = m_connection;
		m_connection = nullptr;
		connection->unregisterCollector(this);
	}

	if (m_initialized)
	{
		put(OP_DIE, nullptr);

		if (m_thread.joinable())
			m_thread.join();

		for (auto& block : m_blocks)
			block->cancel();
	}

	m_blocks.clear();
}

void EventCollector::notify(EventBlock* block)
{
	put(OP_RECORD_AND_REREGISTER, block);
}

void EventCollector::put(Operation operation, EventBlock* block)
{
	std::lock_guard<std::mutex> guard(m_queueMutex);

	Message message;
	message.operation = operation;
	message.block = block;
	m_queue.push_back(message);

	m_queueCond.notify_one();
}

void EventCollector::dispatch()
{
	logDebug("Event dispatch thread started");

	try
	{
		while (true)
		{
			Message message;

			{	// scope
				std::unique_lock<std::mutex> guard(m_queueMutex);
				m_queueCond.wait(guard, [this] { return !m_queue.empty(); });

				message = m_queue.front();
				m_queue.pop_front();
			}

			if (message.operation == OP_DIE)
				break;

			countAndReregister(message.block);
		}
	}
	catch (const std::exception& ex)
	{
		logError(std::string("Event dispatch failed: ") + ex.what());

		std::lock_guard<std::mutex> guard(m_eventsMutex);
		m_error = std::current_exception();
		m_eventsCond.notify_all();
	}

	logDebug("Event dispatch thread finished");
}

void EventCollector::countAndReregister(EventBlock* block)
{
	std::vector<ULONG> counts;
	block->getCounts(counts);

	auto first = m_firstCall.find(block);

	if (first != m_firstCall.end() && first->second)
	{
		// baseline only
		first->second = false;
	}
	else
	{
		const std::vector<std::string>& names = block->getNames();
		std::lock_guard<std::mutex> guard(m_eventsMutex);

		for (size_t i = 0; i < names.size() && i < counts.size(); ++i)
			m_events[names[i]] += int(counts[i]);

		m_ready = true;
		m_eventsCond.notify_all();
	}

	block->queue();
}

} // namespace FbDriver
