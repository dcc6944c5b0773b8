#pragma once

#include <cstdint>
#include <cstring>
#include <type_traits>
#include <boost/endian/conversion.hpp>

namespace verifs { namespace util {

// Number of chunks needed to hold 'size' bytes
template<class T1, class T2>
inline T1 ChunksCount(T1 size, T2 chunkSize)
{
  // Works only for positive integers
  static_assert(std::is_integral<T1>::value, "");
  static_assert(std::is_integral<T2>::value, "");

  return (size + chunkSize - 1) / chunkSize;
}

inline uint32_t LoadChecksum(char const * bytes)
{
  uint32_t value;
  memcpy(&value, bytes, sizeof(value));
  return boost::endian::big_to_native(value);
}

inline void StoreChecksum(uint32_t value, char * bytes)
{
  value = boost::endian::native_to_big(value);
  memcpy(bytes, &value, sizeof(value));
}

}}
