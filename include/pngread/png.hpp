#ifndef _pngread__png__hpp__included__
#define _pngread__png__hpp__included__

#include <cstdlib>
#include <cstdint>
#include <vector>
#include "pngread/error.hpp"
#include "pngread/header.hpp"
#include "pngread/pixel.hpp"

namespace pngread
{
/**
 * Per-call decoder settings.
 */
struct decode_options
{
	decode_options();
/**
 * Carry alpha (alpha channels and tRNS) into the output. Default false: output is opaque RGB.
 */
	bool keep_alpha;
/**
 * Largest accepted size of the decompressed image data (rows including filter bytes). Default 1GiB.
 */
	uint64_t max_raw_bytes;
};

/**
 * A decoded image.
 */
struct pixel_grid
{
	pixel_grid();
	size_t width;
	size_t height;
/**
 * True if alpha was kept. If false, every pixel has alpha 0xFF.
 */
	bool has_alpha;
/**
 * Row-major pixels, 0xAARRGGBB.
 */
	std::vector<uint32_t> data;
	uint32_t at(size_t x, size_t y) const { return data[y * width + x]; }
};

/**
 * Decode a PNG file held in memory.
 *
 * Parameter data: The whole file.
 * Parameter size: Size of the file.
 * Parameter opts: Decoder settings.
 * Returns: The complete image.
 * Throws decode_error: The file is invalid or unsupported. No partial image is produced.
 * Throws std::bad_alloc: Not enough memory.
 */
pixel_grid decode(const uint8_t* data, size_t size, const decode_options& opts = decode_options());

/**
 * Decode a PNG file held in memory.
 */
pixel_grid decode(const std::vector<uint8_t>& file, const decode_options& opts = decode_options());

/**
 * Read the metadata of a PNG file without decompressing the image data.
 *
 * Throws decode_error: The container or metadata is invalid.
 */
image_info probe(const uint8_t* data, size_t size);
}

#endif
