#include "pngread/error.hpp"
#include "pngread/string.hpp"

namespace pngread
{
namespace
{
	std::string format_error(error_code code, error_stage stage, size_t offset, const std::string& detail)
	{
		stringfmt x;
		x << detail << " [" << error_name(code) << ", " << stage_name(stage);
		switch(stage) {
		case stage_chunk:
		case stage_header:	x << " at file offset " << offset; break;
		case stage_inflate:	x << " at stream offset " << offset; break;
		case stage_filter:
		case stage_pixel:	x << " in row " << offset; break;
		}
		x << "]";
		return x.str();
	}
}

const char* error_name(error_code code)
{
	switch(code) {
	case bad_signature:			return "bad_signature";
	case truncated_chunk:			return "truncated_chunk";
	case chunk_checksum_mismatch:		return "chunk_checksum_mismatch";
	case malformed_chunk_order:		return "malformed_chunk_order";
	case unknown_critical_chunk:		return "unknown_critical_chunk";
	case invalid_chunk_payload:		return "invalid_chunk_payload";
	case invalid_header:			return "invalid_header";
	case unsupported_color_type_bit_depth:	return "unsupported_color_type_bit_depth";
	case unsupported_interlacing:		return "unsupported_interlacing";
	case missing_palette:			return "missing_palette";
	case image_too_large:			return "image_too_large";
	case invalid_stream_header:		return "invalid_stream_header";
	case invalid_compressed_block:		return "invalid_compressed_block";
	case invalid_code:			return "invalid_code";
	case output_overrun:			return "output_overrun";
	case truncated_stream:			return "truncated_stream";
	case stream_checksum_mismatch:		return "stream_checksum_mismatch";
	case unknown_filter_type:		return "unknown_filter_type";
	case palette_index_out_of_range:	return "palette_index_out_of_range";
	};
	return "unknown_error";
}

const char* stage_name(error_stage stage)
{
	switch(stage) {
	case stage_chunk:	return "chunk";
	case stage_header:	return "header";
	case stage_inflate:	return "inflate";
	case stage_filter:	return "filter";
	case stage_pixel:	return "pixel";
	};
	return "unknown";
}

decode_error::decode_error(error_code _code, error_stage _stage, size_t _offset, const std::string& detail)
	: std::runtime_error(format_error(_code, _stage, _offset, detail)), ecode(_code), estage(_stage),
	eoffset(_offset)
{
}
}
