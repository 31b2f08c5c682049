/*
 *	PROGRAM:	Firebird client driver samples.
 *	MODULE:		events.cpp
 *	DESCRIPTION:	A sample of collecting database events.
 *
 *					Example for the following classes:
 *					Connection - event collector creation, execute immediate
 *					EventCollector - begin, wait and close
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

#include "../../src/include/fbdriver.h"

#include <stdio.h>
#include <stdlib.h>
#include <memory>

using namespace FbDriver;

int main(int argc, char** argv)
{
	int rc = 0;

	// set default password if none specified in environment
	setenv("ISC_USER", "sysdba", 0);
	setenv("ISC_PASSWORD", "masterkey", 0);

	const char* const database = argc > 1 ? argv[1] : "employee";

	try
	{
		std::unique_ptr<Connection> connection(Connection::connect(database));

		// register an event
		std::unique_ptr<EventCollector> collector(connection->eventCollector({"EVENT1"}));
		collector->begin();

		const char cmdBlock[] = "execute block as begin post_event 'EVENT1'; end";

		for (int pass = 0; pass < 3; ++pass)
		{
			connection->executeImmediate(cmdBlock);
			connection->commit();

			const EventCounts counts = collector->wait(1000);
			printf("Event count on pass %d is %d\n", pass, counts.at("EVENT1"));

			collector->flush();
		}

		// cleanup
		collector->close();
		connection->close();
	}
	catch (const DatabaseError& error)
	{
		// handle error
		rc = 1;
		fprintf(stderr, "%s (SQLSTATE %s)\n", error.what(), error.getSqlState().c_str());
	}
	catch (const Error& error)
	{
		rc = 1;
		fprintf(stderr, "%s\n", error.what());
	}

	return rc;
}
