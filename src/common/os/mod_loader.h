/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			mod_loader.h
 *	DESCRIPTION:	Abstraction for loadable modules.
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

#ifndef FBDRIVER_COMMON_MOD_LOADER_H
#define FBDRIVER_COMMON_MOD_LOADER_H

#include <memory>
#include <string>

namespace FbDriver {

class ModuleLoader
{
public:
	class Module
	{
	public:
		virtual ~Module() {}

		// Returns nullptr when the symbol is not exported by this module
		virtual void* findSymbol(const std::string& symName) = 0;

		template <typename T>
		T findSymbol(const std::string& symName)
		{
			return reinterpret_cast<T>(findSymbol(symName));
		}

		const std::string& getFileName() const
		{
			return m_fileName;
		}

	protected:
		explicit Module(const std::string& fileName)
			: m_fileName(fileName)
		{}

	private:
		std::string m_fileName;
	};

	// Raises InterfaceError with the loader's message on failure
	static std::unique_ptr<Module> loadModule(const std::string& modPath);
	static void doctorModuleExtension(std::string& name);
	static bool isLoadableModule(const std::string& module);
};

} // namespace FbDriver

#endif // FBDRIVER_COMMON_MOD_LOADER_H
