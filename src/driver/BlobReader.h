/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			BlobReader.h
 *	DESCRIPTION:	Buffered reader of BLOB values.
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

#ifndef FBDRIVER_DRIVER_BLOB_READER_H
#define FBDRIVER_DRIVER_BLOB_READER_H

#include "../driver/LobAccess.h"

#include <memory>
#include <stdio.h>
#include <string>
#include <vector>

namespace FbDriver {

// File-like access to a BLOB returned by a cursor. Data is returned as raw bytes
// in the connection character set. Seeking works for stream BLOBs only.
// Valid until closed explicitly or by the cursor which produced it.

class BlobReader
{
public:
	BlobReader(std::unique_ptr<BlobHandle> blob, const ISC_QUAD& blobId, int subType,
		const BlobInfo& info);
	~BlobReader();

	// At most size bytes, everything up to the end when size is negative
	std::string read(int size = -1);

	// Line including its terminating newline, empty string at the end. Text BLOBs only.
	std::string readline(int size = -1);

	// Remaining lines, no more than hint lines when hint is not negative
	std::vector<std::string> readlines(int hint = -1);

	// Iteration over lines, false at the end
	bool nextLine(std::string& line);

	// whence is SEEK_SET, SEEK_CUR or SEEK_END
	void seek(SINT64 offset, int whence = SEEK_SET);

	SINT64 tell() const
	{
		return m_pos;
	}

	void close();

	bool isClosed() const
	{
		return !m_blob;
	}

	bool isText() const;

	SINT64 length() const
	{
		return m_info.totalLength;
	}

	const char* mode() const
	{
		return isText() ? "r" : "rb";
	}

	const ISC_QUAD& getBlobId() const
	{
		return m_blobId;
	}

	int getSubType() const
	{
		return m_subType;
	}

	// Storage kind reported by the engine
	bool isStream() const
	{
		return m_info.stream;
	}

private:
	BlobHandle* checkOpen() const;
	void resetBuffer();
	bool fillBuffer();

	std::unique_ptr<BlobHandle> m_blob;
	const ISC_QUAD m_blobId;
	const int m_subType;
	const BlobInfo m_info;

	SINT64 m_pos;
	std::vector<char> m_buffer;
	unsigned m_bufferPos;
	unsigned m_bufferData;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_BLOB_READER_H
