/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			fbdriver.h
 *	DESCRIPTION:	Public interface of the driver.
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

#ifndef FBDRIVER_INCLUDE_FBDRIVER_H
#define FBDRIVER_INCLUDE_FBDRIVER_H

#include "../common/fbd_exception.h"
#include "../common/StatusHolder.h"
#include "../common/config/DriverConfig.h"
#include "../common/log/LogWriter.h"
#include "../driver/ClientLibrary.h"
#include "../driver/Value.h"
#include "../driver/Info.h"
#include "../driver/BlobReader.h"
#include "../driver/Statement.h"
#include "../driver/Cursor.h"
#include "../driver/Transaction.h"
#include "../driver/Connection.h"
#include "../driver/EventCollector.h"

#endif // FBDRIVER_INCLUDE_FBDRIVER_H
