#ifndef _pngread__bytereader__hpp__included__
#define _pngread__bytereader__hpp__included__

#include <cstdint>
#include <cstdlib>
#include "pngread/error.hpp"

namespace pngread
{
/**
 * Cursor over immutable byte buffer. All reads are big-endian and bounds-checked.
 */
class byte_reader
{
public:
/**
 * Create a reader.
 *
 * Parameter _data: The buffer. Not copied, must outlive the reader.
 * Parameter _size: Size of the buffer.
 * Parameter _base: File offset of the first byte, used in error reports.
 * Parameter _code: Error to raise if a read runs past the end.
 * Parameter _stage: Stage to report the error in.
 */
	byte_reader(const uint8_t* _data, size_t _size, size_t _base = 0, error_code _code = truncated_chunk,
		error_stage _stage = stage_chunk);
/**
 * Read one byte.
 *
 * Throws decode_error: Buffer exhausted.
 */
	uint8_t u8();
/**
 * Read big-endian 16-bit value.
 *
 * Throws decode_error: Buffer exhausted.
 */
	uint16_t u16b();
/**
 * Read big-endian 32-bit value.
 *
 * Throws decode_error: Buffer exhausted.
 */
	uint32_t u32b();
/**
 * Borrow the next n bytes and advance past them.
 *
 * Returns: Pointer to the bytes inside the original buffer.
 * Throws decode_error: Fewer than n bytes remain.
 */
	const uint8_t* bytes(size_t n);
/**
 * Skip n bytes.
 *
 * Throws decode_error: Fewer than n bytes remain.
 */
	void skip(size_t n) { bytes(n); }
	size_t remaining() const { return size - ptr; }
	bool eof() const { return ptr == size; }
/**
 * Offset of the cursor, relative to the file (base included).
 */
	size_t position() const { return base + ptr; }
private:
	void require(size_t n);
	const uint8_t* data;
	size_t size;
	size_t ptr;
	size_t base;
	error_code code;
	error_stage stage;
};
}

#endif
