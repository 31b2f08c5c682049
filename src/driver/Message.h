/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			Message.h
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

#ifndef FBDRIVER_DRIVER_MESSAGE_H
#define FBDRIVER_DRIVER_MESSAGE_H

#include "firebird/Interface.h"
#include "../driver/Interfaces.h"

#include <string>
#include <vector>

namespace FbDriver {

// Description of a single message item. Offsets come from the engine.

struct MessageField
{
	MessageField()
		: type(0), nullable(true), subType(0), length(0), scale(0), charSet(0),
		  offset(0), nullOffset(0)
	{ }

	std::string field;
	std::string relation;
	std::string owner;
	std::string alias;
	unsigned type;			// SQL_xxx without the null flag
	bool nullable;
	int subType;
	unsigned length;
	int scale;
	unsigned charSet;
	unsigned offset;
	unsigned nullOffset;

	// Column name as seen by the caller
	const std::string& name() const
	{
		return (alias.empty() || alias == field) ? field : alias;
	}
};

class MessageLayout
{
public:
	MessageLayout()
		: m_length(0)
	{ }

	// Snapshot of the metadata, null metadata gives empty layout
	static MessageLayout read(Firebird::IMessageMetadata* meta);

	unsigned getCount() const
	{
		return (unsigned) m_fields.size();
	}

	const MessageField& operator[](unsigned index) const
	{
		return m_fields[index];
	}

	const std::vector<MessageField>& getFields() const
	{
		return m_fields;
	}

	// Size of the buffer for the message
	unsigned getLength() const
	{
		return m_length;
	}

	void addField(const MessageField& field)
	{
		m_fields.push_back(field);
	}

	void setLength(unsigned length)
	{
		m_length = length;
	}

private:
	std::vector<MessageField> m_fields;
	unsigned m_length;
};

// Parameter sent as text of the given byte length
struct TextOverride
{
	unsigned index;
	unsigned length;
};

// Rewrites the listed parameters of the input metadata into CHAR items.
// When the builder fails, the original metadata is returned with an added reference.
AutoRelease<Firebird::IMessageMetadata> adjustInputMetadata(Firebird::IMessageMetadata* meta,
	const std::vector<TextOverride>& overrides);

} // namespace FbDriver

#endif // FBDRIVER_DRIVER_MESSAGE_H
