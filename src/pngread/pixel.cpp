#include "pngread/pixel.hpp"
#include "pngread/error.hpp"
#include "pngread/serialization.hpp"
#include "pngread/string.hpp"

namespace pngread
{
namespace
{
	template<unsigned bits>
	inline uint32_t decode_type_0(const uint8_t* in, unsigned bit, const uint16_t* trans)
	{
		uint16_t v;
		uint32_t m;
		uint32_t s = 0;
		switch(bits) {
		case 1: v = (*in >> (7 - bit)) & 1; m = 0xFFFFFF; break;
		case 2: v = (*in >> (6 - bit)) & 3; m = 0x555555; break;
		case 4: v = (*in >> (4 - bit)) & 15; m = 0x111111; break;
		case 8: v = *in; m = 0x010101; break;
		default: v = serialization::u16b(in); m = 0x010101; s = 8; break;
		};
		uint32_t alpha = 0xFF000000U;
		if(trans && v == trans[0])
			alpha = 0;
		return alpha | (m * (v >> s));
	}

	template<unsigned bits>
	inline uint32_t decode_type_2(const uint8_t* in, unsigned bit, const uint16_t* trans)
	{
		uint32_t alpha = 0xFF000000U;
		if(bits == 8) {
			if(trans && in[0] == trans[0] && in[1] == trans[1] && in[2] == trans[2])
				alpha = 0;
			return make_pixel(in[0], in[1], in[2]) & (alpha | 0x00FFFFFFU);
		}
		if(trans && serialization::u16b(in + 0) == trans[0] && serialization::u16b(in + 2) == trans[1] &&
			serialization::u16b(in + 4) == trans[2])
			alpha = 0;
		return make_pixel(in[0], in[2], in[4]) & (alpha | 0x00FFFFFFU);
	}

	template<unsigned bits>
	inline uint32_t decode_type_3(const uint8_t* in, unsigned bit, const uint16_t* trans)
	{
		switch(bits) {
		case 1: return (*in >> (7 - bit)) & 1;
		case 2: return (*in >> (6 - bit)) & 3;
		case 4: return (*in >> (4 - bit)) & 15;
		default: return *in;
		};
	}

	template<unsigned bits>
	uint32_t decode_type_4(const uint8_t* in, unsigned bit, const uint16_t* trans)
	{
		if(bits == 8)
			return make_pixel(in[0], in[0], in[0], in[1]);
		return make_pixel(in[0], in[0], in[0], in[2]);
	}

	template<unsigned bits>
	uint32_t decode_type_6(const uint8_t* in, unsigned bit, const uint16_t* trans)
	{
		if(bits == 8)
			return make_pixel(in[0], in[1], in[2], in[3]);
		return make_pixel(in[0], in[2], in[4], in[6]);
	}
}

pixel_decoder::pixel_decoder(const image_info& _info, bool _keep_alpha)
	: info(_info), keep_alpha(_keep_alpha), fn(NULL), bits(_info.header.bits_per_pixel()), trans(NULL)
{
	const image_header& hdr = info.header;
	if(keep_alpha && info.trans.present && hdr.type != color_indexed)
		trans = info.trans.key;
	switch(hdr.type) {
	case color_grayscale:
		switch(hdr.depth) {
		case 1: fn = decode_type_0<1>; break;
		case 2: fn = decode_type_0<2>; break;
		case 4: fn = decode_type_0<4>; break;
		case 8: fn = decode_type_0<8>; break;
		case 16: fn = decode_type_0<16>; break;
		};
		break;
	case color_truecolor:
		switch(hdr.depth) {
		case 8: fn = decode_type_2<8>; break;
		case 16: fn = decode_type_2<16>; break;
		};
		break;
	case color_indexed:
		switch(hdr.depth) {
		case 1: fn = decode_type_3<1>; break;
		case 2: fn = decode_type_3<2>; break;
		case 4: fn = decode_type_3<4>; break;
		case 8: fn = decode_type_3<8>; break;
		};
		break;
	case color_grayscale_alpha:
		switch(hdr.depth) {
		case 8: fn = decode_type_4<8>; break;
		case 16: fn = decode_type_4<16>; break;
		};
		break;
	case color_truecolor_alpha:
		switch(hdr.depth) {
		case 8: fn = decode_type_6<8>; break;
		case 16: fn = decode_type_6<16>; break;
		};
		break;
	}
	if(!fn)
		throw decode_error(unsupported_color_type_bit_depth, stage_pixel, 0, (stringfmt()
			<< "Unsupported color type " << (int)hdr.type << " with bit depth " << (int)hdr.depth).str());
}

void pixel_decoder::decode(uint32_t* output, const uint8_t* row, size_t rowno) const
{
	uint32_t opaque = keep_alpha ? 0 : 0xFF000000U;
	size_t width = info.header.width;
	size_t off = 0;
	unsigned bit = 0;
	if(info.header.type == color_indexed) {
		const std::vector<uint32_t>& palette = info.palette;
		for(size_t i = 0; i < width; i++) {
			uint32_t index = fn(row + off, bit, trans);
			if(index >= palette.size())
				throw decode_error(palette_index_out_of_range, stage_pixel, rowno, (stringfmt()
					<< "Palette index " << index << " at column " << i << " out of range (palette has "
					<< palette.size() << " entries)").str());
			output[i] = palette[index] | opaque;
			bit += bits;
			off += (bit >> 3);
			bit &= 7;
		}
		return;
	}
	for(size_t i = 0; i < width; i++) {
		output[i] = fn(row + off, bit, trans) | opaque;
		bit += bits;
		off += (bit >> 3);
		bit &= 7;
	}
}
}
