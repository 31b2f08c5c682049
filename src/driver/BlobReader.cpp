/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			BlobReader.cpp
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

#include "../driver/BlobReader.h"
#include "../common/fbd_exception.h"
#include "../common/log/LogWriter.h"
#include "ibase.h"

#include <limits.h>
#include <algorithm>

namespace FbDriver {

BlobReader::BlobReader(std::unique_ptr<BlobHandle> blob, const ISC_QUAD& blobId, int subType,
		const BlobInfo& info)
	: m_blob(std::move(blob)),
	  m_blobId(blobId),
	  m_subType(subType),
	  m_info(info),
	  m_pos(0),
	  m_buffer(info.maxSegment ? info.maxSegment : MAX_BLOB_SEGMENT_SIZE),
	  m_bufferPos(0),
	  m_bufferData(0)
{ }

BlobReader::~BlobReader()
{
	// handle is released without the close call
	if (m_blob)
		logDebug("BlobReader destroyed without prior close()");
}

bool BlobReader::isText() const
{
	return m_subType == isc_blob_text;
}

BlobHandle* BlobReader::checkOpen() const
{
	if (!m_blob)
		InterfaceError::raise("BlobReader is closed");

	return m_blob.get();
}

void BlobReader::resetBuffer()
{
	m_bufferPos = 0;
	m_bufferData = 0;
}

bool BlobReader::fillBuffer()
{
	resetBuffer();

	unsigned length = 0;

	if (!checkOpen()->getSegment(unsigned(m_buffer.size()), m_buffer.data(), length))
		return false;

	m_bufferData = length;
	return length > 0;
}

std::string BlobReader::read(int size)
{
	checkOpen();

	SINT64 toRead = m_info.totalLength - m_pos;

	if (size >= 0)
		toRead = std::min<SINT64>(size, toRead);

	std::string result;

	while (toRead > 0)
	{
		if (m_bufferPos >= m_bufferData && !fillBuffer())
			break;

		const unsigned toCopy = unsigned(std::min<SINT64>(toRead, m_bufferData - m_bufferPos));
		result.append(m_buffer.data() + m_bufferPos, toCopy);

		m_bufferPos += toCopy;
		m_pos += toCopy;
		toRead -= toCopy;
	}

	return result;
}

std::string BlobReader::readline(int size)
{
	checkOpen();

	if (!isText())
		InterfaceError::raise("Can't read line from binary BLOB");

	SINT64 toRead = m_info.totalLength - m_pos;

	if (size >= 0)
		toRead = std::min<SINT64>(size, toRead);

	std::string line;
	bool found = false;

	while (toRead > 0 && !found)
	{
		if (m_bufferPos >= m_bufferData && !fillBuffer())
			break;

		const unsigned toScan = unsigned(std::min<SINT64>(toRead, m_bufferData - m_bufferPos));
		const char* const start = m_buffer.data() + m_bufferPos;
		const char* const end = start + toScan;
		const char* const newLine = std::find(start, end, '\n');

		found = (newLine != end);

		const unsigned count = unsigned((found ? newLine + 1 : end) - start);
		line.append(start, count);

		m_bufferPos += count;
		m_pos += count;
		toRead -= count;
	}

	return line;
}

std::vector<std::string> BlobReader::readlines(int hint)
{
	std::vector<std::string> result;
	std::string line;

	while ((hint < 0 || result.size() < size_t(hint)) && nextLine(line))
		result.push_back(line);

	return result;
}

bool BlobReader::nextLine(std::string& line)
{
	line = readline();
	return !line.empty();
}

void BlobReader::seek(SINT64 offset, int whence)
{
	BlobHandle* const blob = checkOpen();

	// engine position is ahead of ours by the buffered data
	if (whence == SEEK_CUR)
	{
		offset += m_pos;
		whence = SEEK_SET;
	}

	// native seek takes a 32-bit offset
	if (offset < INT_MIN || offset > INT_MAX)
		InterfaceError::raise("Seek offset %lld is out of range", (long long) offset);

	int mode;

	switch (whence)
	{
	case SEEK_SET:
		mode = 0;
		break;

	case SEEK_END:
		mode = blb_seek_from_tail;
		break;

	default:
		InterfaceError::raise("Invalid seek mode %d", whence);
	}

	m_pos = blob->seek(mode, int(offset));
	resetBuffer();
}

void BlobReader::close()
{
	if (m_blob)
	{
		std::unique_ptr<BlobHandle> blob(std::move(m_blob));
		blob->close();
	}
}

} // namespace FbDriver
