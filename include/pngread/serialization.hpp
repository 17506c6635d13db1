#ifndef _pngread__serialization__hpp__included__
#define _pngread__serialization__hpp__included__

#include <cstdint>
#include <cstdlib>

namespace pngread
{
namespace serialization
{
template<size_t n> struct unsigned_of {};
template<> struct unsigned_of<1> { typedef uint8_t t; };
template<> struct unsigned_of<2> { typedef uint16_t t; };
template<> struct unsigned_of<4> { typedef uint32_t t; };

template<typename T1, bool be>
void write_common(uint8_t* target, T1 value)
{
	for(size_t i = 0; i < sizeof(T1); i++)
		if(be)
			target[i] = static_cast<typename unsigned_of<sizeof(T1)>::t>(value) >> 8 * (sizeof(T1) - i - 1);
		else
			target[i] = static_cast<typename unsigned_of<sizeof(T1)>::t>(value) >> 8 * i;
}

template<typename T1, bool be>
T1 read_common(const uint8_t* source)
{
	typename unsigned_of<sizeof(T1)>::t value = 0;
	for(size_t i = 0; i < sizeof(T1); i++)
		if(be)
			value |= static_cast<typename unsigned_of<sizeof(T1)>::t>(source[i]) << 8 * (sizeof(T1) - i - 1);
		else
			value |= static_cast<typename unsigned_of<sizeof(T1)>::t>(source[i]) << 8 * i;
	return static_cast<T1>(value);
}

inline void u16b(void* t, uint16_t v)
{
	write_common<uint16_t, true>(reinterpret_cast<uint8_t*>(t), v);
}
inline void u32b(void* t, uint32_t v)
{
	write_common<uint32_t, true>(reinterpret_cast<uint8_t*>(t), v);
}
inline uint16_t u16b(const void* t)
{
	return read_common<uint16_t, true>(reinterpret_cast<const uint8_t*>(t));
}
inline uint16_t u16l(const void* t)
{
	return read_common<uint16_t, false>(reinterpret_cast<const uint8_t*>(t));
}
inline uint32_t u32b(const void* t)
{
	return read_common<uint32_t, true>(reinterpret_cast<const uint8_t*>(t));
}
}
}

#endif
