#ifndef _VERIFS_API_ISTORAGE_H
#define _VERIFS_API_ISTORAGE_H

#include <cstdint>
#include "verifs/Common.hpp"

namespace verifs
{

// Random access bytes of a data copy or of its checksums
class IStorage
{
public:
  virtual uint64_t size() const = 0;
  // Throws StreamError(InvalidArgument) if [position, position + size) is past the end
  virtual void read(uint64_t position, size_t size, void *) const = 0;

  virtual ~IStorage() {}
};

// Storage checksums are written to
class IWritableStorage: public IStorage
{
public:
  virtual void write(uint64_t position, size_t size, void const *) = 0; // grows the storage if needed
  virtual void resize(uint64_t size) = 0; // fill with zeros on increase
};

}

#endif
