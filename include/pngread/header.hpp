#ifndef _pngread__header__hpp__included__
#define _pngread__header__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <vector>
#include "pngread/chunk.hpp"

namespace pngread
{
enum color_type
{
	color_grayscale = 0,
	color_truecolor = 2,
	color_indexed = 3,
	color_grayscale_alpha = 4,
	color_truecolor_alpha = 6,
};

/**
 * Get name of color type, or NULL if the value is not a valid color type.
 */
const char* color_type_name(uint8_t type);

/**
 * Number of samples per pixel for color type, 0 if the type is not valid.
 */
unsigned color_type_channels(uint8_t type);

/**
 * Is the color type / bit depth combination allowed?
 */
bool legal_bit_depth(uint8_t type, uint8_t depth);

/**
 * Contents of the IHDR chunk.
 */
struct image_header
{
	uint32_t width;
	uint32_t height;
	uint8_t depth;
	uint8_t type;
	uint8_t compression;
	uint8_t filter;
	bool interlace;
	unsigned channels() const { return color_type_channels(type); }
	unsigned bits_per_pixel() const { return channels() * depth; }
/**
 * Distance in bytes between a byte and its left neighbour for scanline filtering.
 */
	size_t filter_step() const { return (bits_per_pixel() >= 8) ? (bits_per_pixel() >> 3) : 1; }
/**
 * Bytes of sample data per scanline, excluding the filter type byte.
 */
	uint64_t stride() const { return (static_cast<uint64_t>(width) * bits_per_pixel() + 7) / 8; }
/**
 * Size of the whole decompressed image data, filter type bytes included.
 */
	uint64_t raw_size() const { return static_cast<uint64_t>(height) * (1 + stride()); }
};

/**
 * Transparency data from tRNS for grayscale and truecolor images. For indexed images tRNS goes to
 * the palette alpha instead and only the present flag is set here.
 */
struct transparency
{
	bool present;
	uint16_t key[3];
};

/**
 * Image metadata, fixed once the metadata chunks have been read.
 */
struct image_info
{
	image_header header;
/**
 * Palette entries as 0xAARRGGBB. Empty if the image has no palette or the palette is only advisory.
 */
	std::vector<uint32_t> palette;
	transparency trans;
};

/**
 * Parse and validate the IHDR chunk.
 *
 * Throws decode_error: Invalid or unsupported header.
 */
image_header parse_header(const chunk& c);

/**
 * Build the image metadata from the chunk list produced by split_chunks().
 *
 * Throws decode_error: Invalid header, palette or transparency data.
 */
image_info read_metadata(const std::vector<chunk>& chunks);
}

#endif
