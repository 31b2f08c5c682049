/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Interfaces.cpp
 *	DESCRIPTION:	Ownership and version checks of native interfaces.
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

#include "../driver/Interfaces.h"

namespace FbDriver {

int negotiateVersion(const char* name, unsigned version,
	const InterfaceVariant* variants, size_t count)
{
	if (!count)
		InterfaceError::raise("No known variants of interface %s", name);

	for (size_t i = 0; i < count; ++i)
	{
		if (version >= variants[i].version)
			return variants[i].tag;
	}

	InterfaceError::raise("Wrong interface version %u, expected %u (%s)",
		version, variants[count - 1].version, name);
}

} // namespace FbDriver
