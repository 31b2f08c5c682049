/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Message.cpp
 *	DESCRIPTION:	Layout of input and output messages.
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

#include "../driver/Message.h"
#include "../driver/ClientLibrary.h"
#include "../common/log/LogWriter.h"
#include "ibase.h"

using namespace Firebird;

namespace
{
	using namespace FbDriver;

	enum MetadataVariant
	{
		METADATA_ALIGNED,	// getAlignedLength() is available
		METADATA_PLAIN
	};

	const InterfaceVariant METADATA_VARIANTS[] = {
		{4, METADATA_ALIGNED},
		{3, METADATA_PLAIN}
	};
}

namespace FbDriver {

MessageLayout MessageLayout::read(IMessageMetadata* meta)
{
	MessageLayout layout;

	if (!meta)
		return layout;

	checkInterface(meta);
	StatusWrapper* const status = ClientLibrary::get().getStatus();

	const unsigned count = meta->getCount(status);

	for (unsigned i = 0; i < count; ++i)
	{
		MessageField item;

		item.field = meta->getField(status, i);
		item.relation = meta->getRelation(status, i);
		item.owner = meta->getOwner(status, i);
		item.alias = meta->getAlias(status, i);
		item.type = meta->getType(status, i) & ~1u;
		item.nullable = meta->isNullable(status, i);
		item.subType = meta->getSubType(status, i);
		item.length = meta->getLength(status, i);
		item.scale = meta->getScale(status, i);
		item.charSet = meta->getCharSet(status, i);
		item.offset = meta->getOffset(status, i);
		item.nullOffset = meta->getNullOffset(status, i);

		layout.addField(item);
	}

	switch (negotiateVersion("IMessageMetadata", interfaceVersion(meta), METADATA_VARIANTS))
	{
	case METADATA_ALIGNED:
		layout.setLength(meta->getAlignedLength(status));
		break;

	default:
		layout.setLength(meta->getMessageLength(status));
		break;
	}

	return layout;
}

AutoRelease<IMessageMetadata> adjustInputMetadata(IMessageMetadata* meta,
	const std::vector<TextOverride>& overrides)
{
	AutoRelease<IMessageMetadata> result;

	if (overrides.empty())
	{
		result.addRef(meta);
		return result;
	}

	StatusWrapper* const status = ClientLibrary::get().getStatus();

	try
	{
		AutoRelease<IMetadataBuilder> builder(checkInterface(meta->getBuilder(status)));

		for (const auto& item : overrides)
		{
			builder->setType(status, item.index, SQL_TEXT);
			builder->setLength(status, item.index, item.length);
		}

		result.reset(checkInterface(builder->getMetadata(status)));
	}
	catch (const DatabaseError& ex)
	{
		logDebug("Input metadata not adjusted, using original layout: " + ex.getMessage());
		result.addRef(meta);
	}

	return result;
}

} // namespace FbDriver
