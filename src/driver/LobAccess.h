/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			LobAccess.h
 *	DESCRIPTION:	Access to BLOBs and arrays of the current transaction.
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

#ifndef FBDRIVER_DRIVER_LOB_ACCESS_H
#define FBDRIVER_DRIVER_LOB_ACCESS_H

#include "ibase.h"
#include "../common/common.h"

#include <memory>
#include <string>

namespace FbDriver {

class BlobReader;

struct BlobInfo
{
	SINT64 totalLength;
	unsigned maxSegment;
	unsigned numSegments;
	bool stream;
};

// Open BLOB of the engine. Implementations release the native handle in the destructor.

class BlobHandle
{
public:
	virtual ~BlobHandle()
	{ }

	// Returns false at end of BLOB
	virtual bool getSegment(unsigned length, void* buffer, unsigned& realLength) = 0;
	virtual void putSegment(unsigned length, const void* buffer) = 0;

	// Mode is blb_seek_relative, blb_seek_from_head or blb_seek_from_tail.
	// Returns the new absolute position.
	virtual int seek(int mode, int offset) = 0;

	virtual BlobInfo getInfo() = 0;
	virtual void close() = 0;
};

struct ArrayDescriptor
{
	ISC_ARRAY_DESC desc;
	int subType;
};

// What the value codec needs from the connection for BLOB and ARRAY fields

class LobAccess
{
public:
	virtual ~LobAccess()
	{ }

	// New BLOB, the identifier is returned in blobId
	virtual std::unique_ptr<BlobHandle> createBlob(ISC_QUAD& blobId, bool stream) = 0;
	virtual std::unique_ptr<BlobHandle> openBlob(const ISC_QUAD& blobId) = 0;

	// Bounds and element type of an array column
	virtual ArrayDescriptor lookupArray(const std::string& relation, const std::string& field) = 0;

	virtual void putSlice(ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data) = 0;

	// Buffer has the size of the whole slice on input
	virtual void getSlice(const ISC_QUAD& arrayId, const ArrayDescriptor& desc, Bytes& data) = 0;

	// Streamed BLOB reader returned to the caller, closed with the cursor
	virtual void trackReader(std::shared_ptr<BlobReader> reader) = 0;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_LOB_ACCESS_H
