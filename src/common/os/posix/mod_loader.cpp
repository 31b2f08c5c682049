/*
 *	PROGRAM:		Firebird client driver.
 *	MODULE:			mod_loader.cpp
 *	DESCRIPTION:	POSIX-specific class for loadable modules.
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

#include "../common/os/mod_loader.h"
#include "../common/fbd_exception.h"

#include <unistd.h>
#include <limits.h>
#include <stdlib.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <dlfcn.h>

/// This is the POSIX (dlopen) implementation of the mod_loader abstraction.

#ifdef __APPLE__
#define SHRLIB_EXT "dylib"
#else
#define SHRLIB_EXT "so"
#endif

namespace {

using namespace FbDriver;

class DlfcnModule : public ModuleLoader::Module
{
public:
	DlfcnModule(const std::string& aFileName, void* m)
		: ModuleLoader::Module(aFileName),
		  module(m)
	{}

	~DlfcnModule();
	void* findSymbol(const std::string&) override;

private:
	void* module;
};

DlfcnModule::~DlfcnModule()
{
	if (module)
		dlclose(module);
}

void* DlfcnModule::findSymbol(const std::string& symName)
{
	void* result = dlsym(module, symName.c_str());
	if (!result)
	{
		const std::string newSym = '_' + symName;

		result = dlsym(module, newSym.c_str());
	}

	return result;
}

} // namespace

namespace FbDriver {

bool ModuleLoader::isLoadableModule(const std::string& module)
{
	struct stat sb;
	if (-1 == stat(module.c_str(), &sb))
		return false;
	if ( ! (sb.st_mode & S_IFREG) )		// Make sure it is a plain file
		return false;
	if ( -1 == access(module.c_str(), R_OK | X_OK))
		return false;
	return true;
}

void ModuleLoader::doctorModuleExtension(std::string& name)
{
	if (name.empty())
		return;

	const std::string ext = "." SHRLIB_EXT;

	std::string::size_type pos = name.rfind(ext);
	if (pos == std::string::npos || pos != name.length() - ext.length())
	{
		pos = name.rfind(ext + ".");
		if (pos == std::string::npos)
			name += ext;
	}
	pos = name.rfind('/');
	pos = (pos == std::string::npos) ? 0 : pos + 1;
	if (name.find("lib", pos) != pos)
	{
		name.insert(pos, "lib");
	}
}

std::unique_ptr<ModuleLoader::Module> ModuleLoader::loadModule(const std::string& modPath)
{
	void* module = dlopen(modPath.c_str(), RTLD_LAZY);
	if (module == NULL)
	{
		const char* const error = dlerror();
		InterfaceError::raise("Cannot load client library %s: %s",
			modPath.c_str(), error ? error : "unknown error");
	}

	std::string linkPath = modPath;
	char b[PATH_MAX];
	const char* newPath = realpath(modPath.c_str(), b);
	if (newPath)
		linkPath = newPath;

	return std::unique_ptr<Module>(new DlfcnModule(linkPath, module));
}

} // namespace FbDriver
