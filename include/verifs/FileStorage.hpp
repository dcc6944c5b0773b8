#ifndef _VERIFS_API_FILE_STORAGE_H
#define _VERIFS_API_FILE_STORAGE_H

#include <memory>
#include "verifs/Defs.hpp"
#include "verifs/IStorage.hpp"

namespace verifs
{

// Opens an existing file for reading. Throws StreamError(InvalidArgument) if it can't be opened.
VERIFS_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const char * fileName);
VERIFS_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName);

// Opens a file for reading and writing, the file is created if it doesn't exist
VERIFS_API_DECL std::unique_ptr<IWritableStorage> OpenWritableFileStorage(const char * fileName);
VERIFS_API_DECL std::unique_ptr<IWritableStorage> OpenWritableFileStorage(const wchar_t * fileName);

}

#endif
