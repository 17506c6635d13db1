#include "pngread/header.hpp"
#include "pngread/messages.hpp"
#include "pngread/string.hpp"

namespace pngread
{
namespace
{
	const uint32_t max_dimension = 0x7FFFFFFFU;

	void read_palette(image_info& info, const chunk& c)
	{
		const image_header& hdr = info.header;
		if(hdr.type == color_grayscale || hdr.type == color_grayscale_alpha)
			throw decode_error(malformed_chunk_order, stage_header, c.offset - 8,
				"PLTE not allowed in grayscale images");
		if(c.length == 0 || c.length % 3 || c.length > 3 * 256)
			throw decode_error(invalid_chunk_payload, stage_header, c.offset, (stringfmt()
				<< "Bad PLTE size " << c.length).str());
		size_t entries = c.length / 3;
		if(hdr.type != color_indexed) {
			//Advisory.
			messages << "pngread: ignoring suggested palette of " << entries << " entries" << std::endl;
			return;
		}
		if(entries > (static_cast<size_t>(1) << hdr.depth))
			throw decode_error(invalid_chunk_payload, stage_header, c.offset, (stringfmt() << "PLTE has "
				<< entries << " entries, too many for bit depth " << (int)hdr.depth).str());
		byte_reader r(c.data, c.length, c.offset, invalid_chunk_payload, stage_header);
		info.palette.resize(entries);
		for(size_t i = 0; i < entries; i++) {
			uint32_t red = r.u8();
			uint32_t green = r.u8();
			uint32_t blue = r.u8();
			info.palette[i] = 0xFF000000U | (red << 16) | (green << 8) | blue;
		}
	}

	void read_transparency(image_info& info, const chunk& c)
	{
		const image_header& hdr = info.header;
		byte_reader r(c.data, c.length, c.offset, invalid_chunk_payload, stage_header);
		switch(hdr.type) {
		case color_grayscale:
			if(c.length != 2)
				throw decode_error(invalid_chunk_payload, stage_header, c.offset,
					"Expected 2-byte tRNS for grayscale image");
			info.trans.key[0] = r.u16b();
			break;
		case color_truecolor:
			if(c.length != 6)
				throw decode_error(invalid_chunk_payload, stage_header, c.offset,
					"Expected 6-byte tRNS for truecolor image");
			for(unsigned i = 0; i < 3; i++)
				info.trans.key[i] = r.u16b();
			break;
		case color_indexed:
			if(info.palette.empty())
				throw decode_error(malformed_chunk_order, stage_header, c.offset - 8,
					"tRNS without preceding PLTE");
			if(c.length > info.palette.size())
				throw decode_error(invalid_chunk_payload, stage_header, c.offset, (stringfmt()
					<< "tRNS has " << c.length << " entries, palette only " << info.palette.size()).str());
			for(size_t i = 0; i < c.length; i++)
				info.palette[i] = (info.palette[i] & 0x00FFFFFFU) | (static_cast<uint32_t>(r.u8()) << 24);
			break;
		default:
			throw decode_error(malformed_chunk_order, stage_header, c.offset - 8,
				"tRNS not allowed in images with an alpha channel");
		}
		info.trans.present = true;
	}
}

const char* color_type_name(uint8_t type)
{
	switch(type) {
	case color_grayscale:		return "grayscale";
	case color_truecolor:		return "truecolor";
	case color_indexed:		return "indexed";
	case color_grayscale_alpha:	return "grayscale+alpha";
	case color_truecolor_alpha:	return "truecolor+alpha";
	default:			return NULL;
	}
}

unsigned color_type_channels(uint8_t type)
{
	unsigned mul[7] = {1, 0, 3, 1, 2, 0, 4};
	return (type > 6) ? 0 : mul[type];
}

bool legal_bit_depth(uint8_t type, uint8_t depth)
{
	switch(type) {
	case color_grayscale:
		return depth == 1 || depth == 2 || depth == 4 || depth == 8 || depth == 16;
	case color_indexed:
		return depth == 1 || depth == 2 || depth == 4 || depth == 8;
	case color_truecolor:
	case color_grayscale_alpha:
	case color_truecolor_alpha:
		return depth == 8 || depth == 16;
	default:
		return false;
	}
}

image_header parse_header(const chunk& c)
{
	if(c.type != chunk_ihdr)
		throw decode_error(malformed_chunk_order, stage_header, c.offset - 8, "Expected IHDR chunk");
	if(c.length != 13)
		throw decode_error(invalid_header, stage_header, c.offset, "Expected IHDR chunk to be 13 bytes");
	byte_reader r(c.data, c.length, c.offset, invalid_header, stage_header);
	image_header hdr;
	hdr.width = r.u32b();
	hdr.height = r.u32b();
	hdr.depth = r.u8();
	hdr.type = r.u8();
	hdr.compression = r.u8();
	hdr.filter = r.u8();
	uint8_t interlace = r.u8();
	hdr.interlace = (interlace != 0);
	if(hdr.width == 0 || hdr.height == 0)
		throw decode_error(invalid_header, stage_header, c.offset, "PNG file has zero width or height");
	if(hdr.width > max_dimension || hdr.height > max_dimension)
		throw decode_error(invalid_header, stage_header, c.offset, "PNG image dimensions exceed 2^31-1");
	if(!legal_bit_depth(hdr.type, hdr.depth))
		throw decode_error(unsupported_color_type_bit_depth, stage_header, c.offset + 8, (stringfmt()
			<< "Unsupported color type " << (int)hdr.type << " with bit depth " << (int)hdr.depth).str());
	if(hdr.compression != 0)
		throw decode_error(invalid_header, stage_header, c.offset + 10, (stringfmt()
			<< "Unsupported compression method " << (int)hdr.compression).str());
	if(hdr.filter != 0)
		throw decode_error(invalid_header, stage_header, c.offset + 11, (stringfmt()
			<< "Unknown scanline filter method " << (int)hdr.filter).str());
	if(interlace == 1)
		throw decode_error(unsupported_interlacing, stage_header, c.offset + 12,
			"Adam7 interlaced images are not supported");
	if(interlace > 1)
		throw decode_error(invalid_header, stage_header, c.offset + 12, (stringfmt()
			<< "Unknown interlace method " << (int)interlace).str());
	return hdr;
}

image_info read_metadata(const std::vector<chunk>& chunks)
{
	if(chunks.empty())
		throw decode_error(malformed_chunk_order, stage_header, 8, "PNG file has no chunks");
	image_info info;
	info.header = parse_header(chunks[0]);
	info.trans.present = false;
	info.trans.key[0] = info.trans.key[1] = info.trans.key[2] = 0;
	for(size_t i = 1; i < chunks.size(); i++) {
		switch(chunks[i].type) {
		case chunk_plte:
			read_palette(info, chunks[i]);
			break;
		case chunk_trns:
			read_transparency(info, chunks[i]);
			break;
		}
	}
	if(info.header.type == color_indexed && info.palette.empty())
		throw decode_error(missing_palette, stage_header, chunks[0].offset,
			"Indexed color image has no PLTE chunk");
	messages << "pngread: " << info.header.width << "x" << info.header.height << " "
		<< color_type_name(info.header.type) << ", " << (int)info.header.depth << " bits/sample" << std::endl;
	return info;
}
}
