/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			BlobWrapper.cpp
 *	DESCRIPTION:	BLOB handle over the native interface.
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

#include "../driver/BlobWrapper.h"
#include "../driver/ClientLibrary.h"
#include "ibase.h"

using namespace Firebird;

namespace
{
	const unsigned SEGMENT_LIMIT = FbDriver::MAX_BLOB_SEGMENT_SIZE;

	const UCHAR STREAM_BPB[] = {isc_bpb_version1, isc_bpb_type, 1, isc_bpb_type_stream};
	const UCHAR SEGMENTED_BPB[] = {isc_bpb_version1, isc_bpb_type, 1, isc_bpb_type_segmented};
}

namespace FbDriver {

BlobWrapper::BlobWrapper(IBlob* blob)
	: m_blob(checkInterface(blob))
{ }

BlobWrapper::~BlobWrapper()
{ }

std::unique_ptr<BlobWrapper> BlobWrapper::open(IAttachment* att, ITransaction* tra,
	const ISC_QUAD& blobId, bool stream)
{
	ISC_QUAD id = blobId;
	const UCHAR* const bpb = stream ? STREAM_BPB : SEGMENTED_BPB;

	IBlob* const blob = att->openBlob(ClientLibrary::get().getStatus(), tra, &id,
		sizeof(STREAM_BPB), bpb);

	return std::unique_ptr<BlobWrapper>(new BlobWrapper(blob));
}

std::unique_ptr<BlobWrapper> BlobWrapper::create(IAttachment* att, ITransaction* tra,
	ISC_QUAD& blobId, bool stream)
{
	const UCHAR* const bpb = stream ? STREAM_BPB : SEGMENTED_BPB;

	blobId.gds_quad_high = blobId.gds_quad_low = 0;
	IBlob* const blob = att->createBlob(ClientLibrary::get().getStatus(), tra, &blobId,
		sizeof(STREAM_BPB), bpb);

	return std::unique_ptr<BlobWrapper>(new BlobWrapper(blob));
}

IBlob* BlobWrapper::checkOpen() const
{
	IBlob* const blob = m_blob.get();

	if (!blob)
		InterfaceError::raise("BLOB is already closed");

	return blob;
}

bool BlobWrapper::getSegment(unsigned length, void* buffer, unsigned& realLength)
{
	IBlob* const blob = checkOpen();

	realLength = 0;
	const unsigned ilen = length > SEGMENT_LIMIT ? SEGMENT_LIMIT : length;

	// RESULT_SEGMENT means the segment did not fit, the rest comes with the next call
	const int rc = blob->getSegment(ClientLibrary::get().getStatus(), ilen, buffer, &realLength);

	return rc != IStatus::RESULT_NO_DATA;
}

void BlobWrapper::putSegment(unsigned length, const void* buffer)
{
	IBlob* const blob = checkOpen();
	const UCHAR* p = static_cast<const UCHAR*>(buffer);

	while (length)
	{
		const unsigned ilen = length > SEGMENT_LIMIT ? SEGMENT_LIMIT : length;
		blob->putSegment(ClientLibrary::get().getStatus(), ilen, p);

		p += ilen;
		length -= ilen;
	}
}

int BlobWrapper::seek(int mode, int offset)
{
	return checkOpen()->seek(ClientLibrary::get().getStatus(), mode, offset);
}

BlobInfo BlobWrapper::getInfo()
{
	static const UCHAR blob_items[] =
	{
		isc_info_blob_max_segment,
		isc_info_blob_num_segments,
		isc_info_blob_total_length,
		isc_info_blob_type
	};

	UCHAR buffer[64];
	checkOpen()->getInfo(ClientLibrary::get().getStatus(),
		sizeof(blob_items), blob_items, sizeof(buffer), buffer);

	BlobInfo info = {0, 0, 0, false};

	const UCHAR* p = buffer;
	const UCHAR* const end = buffer + sizeof(buffer);

	while (p < end && *p != isc_info_end)
	{
		const UCHAR item = *p++;

		if (item == isc_info_truncated || p + 2 > end)
			InterfaceError::raise("BLOB information buffer is truncated");

		const unsigned l = (unsigned) vaxInteger(p, 2);
		p += 2;

		if (p + l > end)
			InterfaceError::raise("BLOB information buffer is truncated");

		const SINT64 n = vaxInteger(p, l);
		p += l;

		switch (item)
		{
		case isc_info_blob_max_segment:
			info.maxSegment = unsigned(n);
			break;

		case isc_info_blob_num_segments:
			info.numSegments = unsigned(n);
			break;

		case isc_info_blob_total_length:
			info.totalLength = n;
			break;

		case isc_info_blob_type:
			info.stream = (n == isc_bpb_type_stream);
			break;

		default:
			InterfaceError::raise("Unexpected BLOB information item %u", unsigned(item));
		}
	}

	return info;
}

void BlobWrapper::close()
{
	if (m_blob.hasData())
	{
		m_blob->close(ClientLibrary::get().getStatus());
		m_blob.forget();
	}
}

} // namespace FbDriver
