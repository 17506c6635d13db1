#include "pngread/bytereader.hpp"
#include "pngread/serialization.hpp"
#include "pngread/string.hpp"

namespace pngread
{
byte_reader::byte_reader(const uint8_t* _data, size_t _size, size_t _base, error_code _code, error_stage _stage)
	: data(_data), size(_size), ptr(0), base(_base), code(_code), stage(_stage)
{
}

void byte_reader::require(size_t n)
{
	if(n > size - ptr)
		throw decode_error(code, stage, base + ptr, (stringfmt() << "Need " << n << " bytes, only "
			<< (size - ptr) << " left").str());
}

uint8_t byte_reader::u8()
{
	require(1);
	return data[ptr++];
}

uint16_t byte_reader::u16b()
{
	require(2);
	uint16_t v = serialization::u16b(data + ptr);
	ptr += 2;
	return v;
}

uint32_t byte_reader::u32b()
{
	require(4);
	uint32_t v = serialization::u32b(data + ptr);
	ptr += 4;
	return v;
}

const uint8_t* byte_reader::bytes(size_t n)
{
	require(n);
	const uint8_t* r = data + ptr;
	ptr += n;
	return r;
}
}
