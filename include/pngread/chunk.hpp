#ifndef _pngread__chunk__hpp__included__
#define _pngread__chunk__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <vector>
#include "pngread/bytereader.hpp"

namespace pngread
{
const uint32_t chunk_ihdr = 0x49484452;
const uint32_t chunk_plte = 0x504C5445;
const uint32_t chunk_trns = 0x74524E53;
const uint32_t chunk_idat = 0x49444154;
const uint32_t chunk_iend = 0x49454E44;

/**
 * The 8-byte PNG file signature.
 */
extern const uint8_t png_signature[8];

/**
 * One chunk of the container. The payload is borrowed from the file buffer.
 */
struct chunk
{
	uint32_t type;
	uint32_t length;
	size_t offset;
	uint32_t crc;
	const uint8_t* data;
};

/**
 * Is the chunk type critical (uppercase first letter)?
 */
inline bool chunk_is_critical(uint32_t type)
{
	return (type & 0x20000000U) == 0;
}

/**
 * Sequential reader of chunks from a file buffer.
 */
class dechunker
{
public:
/**
 * Create a dechunker positioned just after the signature.
 *
 * Throws decode_error: The buffer does not start with the PNG signature.
 */
	dechunker(const uint8_t* data, size_t size);
/**
 * Load the next chunk and verify its CRC.
 *
 * Returns: True if a chunk was loaded, false if the buffer ended exactly at a chunk boundary.
 * Throws decode_error: The chunk is truncated or its CRC does not match.
 */
	bool next_chunk();
/**
 * The chunk loaded by the last successful next_chunk().
 */
	const chunk& current() const { return cur; }
/**
 * File offset of the next unread byte.
 */
	size_t position() const { return reader.position(); }
	bool eof() const { return reader.eof(); }
private:
	dechunker(const dechunker&);
	dechunker& operator=(const dechunker&);
	byte_reader reader;
	chunk cur;
};

/**
 * Split a file into chunks, enforcing the chunk ordering rules.
 *
 * Unknown ancillary chunks are dropped from the result; everything else (IHDR, PLTE, tRNS, IDAT and
 * IEND) is returned in file order.
 *
 * Parameter data: The whole file.
 * Parameter size: Size of the file.
 * Returns: The chunks, starting with IHDR and ending with IEND.
 * Throws decode_error: Structural error in the container.
 */
std::vector<chunk> split_chunks(const uint8_t* data, size_t size);
}

#endif
