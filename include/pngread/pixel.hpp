#ifndef _pngread__pixel__hpp__included__
#define _pngread__pixel__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <vector>
#include "pngread/header.hpp"

namespace pngread
{
/**
 * Pack pixel as 0xAARRGGBB.
 */
inline uint32_t make_pixel(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF)
{
	return ((uint32_t)a << 24) | ((uint32_t)r << 16) | ((uint32_t)g << 8) | (uint32_t)b;
}
inline uint8_t pixel_red(uint32_t px) { return px >> 16; }
inline uint8_t pixel_green(uint32_t px) { return px >> 8; }
inline uint8_t pixel_blue(uint32_t px) { return px; }
inline uint8_t pixel_alpha(uint32_t px) { return px >> 24; }

/**
 * Converts unfiltered scanlines into packed 0xAARRGGBB pixels.
 *
 * Grayscale samples are replicated into red, green and blue, with 1, 2 and 4 bit samples scaled to
 * the full 8-bit range. 16-bit samples keep only their high byte.
 */
class pixel_decoder
{
public:
/**
 * Create a decoder.
 *
 * Parameter _info: Image metadata. Must outlive the decoder.
 * Parameter _keep_alpha: If true, carry alpha samples and tRNS transparency into the output. If
 *	false, all output pixels are opaque.
 * Throws decode_error: The color type / bit depth combination is not supported.
 */
	pixel_decoder(const image_info& _info, bool _keep_alpha);
/**
 * Decode one row.
 *
 * Parameter output: Receives width pixels.
 * Parameter row: The unfiltered row (stride bytes).
 * Parameter rowno: Row number to report errors with.
 * Throws decode_error: Palette index out of range.
 */
	void decode(uint32_t* output, const uint8_t* row, size_t rowno) const;
	bool has_alpha() const { return keep_alpha; }
private:
	typedef uint32_t (*decode_fn)(const uint8_t* in, unsigned bit, const uint16_t* trans);
	const image_info& info;
	bool keep_alpha;
	decode_fn fn;
	unsigned bits;
	const uint16_t* trans;
};
}

#endif
