/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			BlobWrapper.h
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

#ifndef FBDRIVER_DRIVER_BLOB_WRAPPER_H
#define FBDRIVER_DRIVER_BLOB_WRAPPER_H

#include "firebird/Interface.h"
#include "../driver/Interfaces.h"
#include "../driver/LobAccess.h"

#include <memory>

namespace FbDriver {

class BlobWrapper : public BlobHandle
{
public:
	// Takes ownership of the interface
	explicit BlobWrapper(Firebird::IBlob* blob);

	// Not closed blob is released, for a new blob this cancels it
	~BlobWrapper();

	static std::unique_ptr<BlobWrapper> open(Firebird::IAttachment* att, Firebird::ITransaction* tra,
		const ISC_QUAD& blobId, bool stream = true);
	static std::unique_ptr<BlobWrapper> create(Firebird::IAttachment* att, Firebird::ITransaction* tra,
		ISC_QUAD& blobId, bool stream);

	bool getSegment(unsigned length, void* buffer, unsigned& realLength) override;
	void putSegment(unsigned length, const void* buffer) override;
	int seek(int mode, int offset) override;
	BlobInfo getInfo() override;
	void close() override;

	bool isOpen() const
	{
		return m_blob.hasData();
	}

	static bool blobIsNull(const ISC_QUAD& blobId)
	{
		return blobId.gds_quad_high == 0 && blobId.gds_quad_low == 0;
	}

private:
	Firebird::IBlob* checkOpen() const;

	AutoRelease<Firebird::IBlob> m_blob;
};

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_BLOB_WRAPPER_H
