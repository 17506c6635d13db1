#ifndef _pngread__error__hpp__included__
#define _pngread__error__hpp__included__

#include <cstdlib>
#include <string>
#include <stdexcept>

namespace pngread
{
/**
 * Reason a decode failed.
 */
enum error_code
{
	//Container structure.
	bad_signature,
	truncated_chunk,
	chunk_checksum_mismatch,
	malformed_chunk_order,
	unknown_critical_chunk,
	invalid_chunk_payload,
	//Header and metadata.
	invalid_header,
	unsupported_color_type_bit_depth,
	unsupported_interlacing,
	missing_palette,
	image_too_large,
	//Compressed stream.
	invalid_stream_header,
	invalid_compressed_block,
	invalid_code,
	output_overrun,
	truncated_stream,
	stream_checksum_mismatch,
	//Scanlines and pixels.
	unknown_filter_type,
	palette_index_out_of_range,
};

/**
 * Pipeline stage an error was raised in. Determines the meaning of decode_error::offset().
 */
enum error_stage
{
	stage_chunk,
	stage_header,
	stage_inflate,
	stage_filter,
	stage_pixel,
};

/**
 * Get symbolic name of error code (e.g. "truncated_chunk").
 */
const char* error_name(error_code code);

/**
 * Get name of pipeline stage.
 */
const char* stage_name(error_stage stage);

/**
 * Decoding failed.
 *
 * The offset is a byte offset into the file for chunk and header errors, a byte offset into the
 * concatenated compressed stream for inflate errors and a row number for filter and pixel errors.
 */
class decode_error : public std::runtime_error
{
public:
	decode_error(error_code _code, error_stage _stage, size_t _offset, const std::string& detail);
	error_code code() const { return ecode; }
	error_stage stage() const { return estage; }
	size_t offset() const { return eoffset; }
private:
	error_code ecode;
	error_stage estage;
	size_t eoffset;
};
}

#endif
