#ifndef _pngread__inflate__hpp__included__
#define _pngread__inflate__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace pngread
{
/**
 * Bit cursor over a DEFLATE stream. Bits are consumed least significant first.
 */
class bit_reader
{
public:
/**
 * Create a reader.
 *
 * Parameter _data: The stream. Not copied.
 * Parameter _size: Size of the stream.
 * Parameter _base: Offset of the first byte, used in error reports.
 */
	bit_reader(const uint8_t* _data, size_t _size, size_t _base = 0);
/**
 * Read n bits (0 <= n <= 16), first bit read ending up as the least significant.
 *
 * Throws decode_error: Input exhausted.
 */
	unsigned bits(unsigned n);
	unsigned bit() { return bits(1); }
/**
 * Discard the rest of the partially read byte.
 */
	void align() { buffer = 0; count = 0; }
/**
 * Borrow n whole bytes. Only valid when aligned.
 *
 * Throws decode_error: Input exhausted.
 */
	const uint8_t* bytes(size_t n);
/**
 * Offset of the next byte that has not been touched yet.
 */
	size_t position() const { return base + ptr; }
private:
	const uint8_t* data;
	size_t size;
	size_t ptr;
	size_t base;
	uint32_t buffer;
	unsigned count;
};

/**
 * Canonical prefix code decoder.
 */
class huffman_code
{
public:
/**
 * Create empty code. Decoding anything with it fails.
 */
	huffman_code();
/**
 * Create code from code lengths.
 *
 * Parameter lengths: Code length of each symbol, 0 for unused symbols, at most 15.
 * Parameter n: Number of symbols.
 * Parameter offset: Stream offset to report errors at.
 * Throws decode_error: The lengths over-subscribe the code space.
 */
	huffman_code(const uint8_t* lengths, size_t n, size_t offset = 0);
/**
 * Decode one symbol.
 *
 * Throws decode_error: The input bits do not form a code, or input is exhausted.
 */
	unsigned decode(bit_reader& in) const;
private:
	static const unsigned max_bits = 15;
	uint16_t count[max_bits + 1];
	std::vector<uint16_t> symbol;
};

/**
 * Decompress a raw DEFLATE stream (RFC 1951).
 *
 * Parameter data: The compressed stream.
 * Parameter size: Size of compressed stream.
 * Parameter expected: Exact number of bytes the stream must decompress to.
 * Parameter consumed: If not NULL, receives the number of input bytes used, rounded up to whole bytes.
 * Returns: The decompressed data, exactly expected bytes.
 * Throws decode_error: The stream is corrupt, truncated or decompresses to the wrong size.
 * Throws std::bad_alloc: Not enough memory.
 */
std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t size, size_t expected, size_t* consumed = NULL);

/**
 * Decompress a zlib stream (RFC 1950): header, DEFLATE data, Adler-32 trailer.
 *
 * Parameter data: The compressed stream.
 * Parameter size: Size of compressed stream.
 * Parameter expected: Exact number of bytes the stream must decompress to.
 * Returns: The decompressed data, exactly expected bytes.
 * Throws decode_error: Bad header, corrupt or truncated stream, wrong size or checksum mismatch.
 * Throws std::bad_alloc: Not enough memory.
 */
std::vector<uint8_t> inflate_zlib(const uint8_t* data, size_t size, size_t expected);
}

#endif
