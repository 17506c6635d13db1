#include "pngread/chunk.hpp"
#include "pngread/messages.hpp"
#include "pngread/serialization.hpp"
#include "pngread/string.hpp"
#include <cstring>
#include <zlib.h>

namespace pngread
{
const uint8_t png_signature[8] = {137, 80, 78, 71, 13, 10, 26, 10};

namespace
{
	const uint32_t max_chunk_length = 0x7FFFFFFFU;

	void order_error(const chunk& c, const std::string& what)
	{
		throw decode_error(malformed_chunk_order, stage_chunk, c.offset - 8, what);
	}
}

dechunker::dechunker(const uint8_t* data, size_t size)
	: reader(data, size)
{
	if(size < sizeof(png_signature) || memcmp(data, png_signature, sizeof(png_signature)))
		throw decode_error(bad_signature, stage_chunk, 0, "Not a PNG file");
	reader.skip(sizeof(png_signature));
	memset(&cur, 0, sizeof(cur));
}

bool dechunker::next_chunk()
{
	if(reader.eof())
		return false;
	size_t start = reader.position();
	uint32_t length = reader.u32b();
	if(length > max_chunk_length)
		throw decode_error(truncated_chunk, stage_chunk, start, (stringfmt() << "Chunk length " << length
			<< " exceeds 2^31-1").str());
	const uint8_t* tag = reader.bytes(4);
	cur.type = serialization::u32b(tag);
	cur.length = length;
	cur.offset = reader.position();
	cur.data = reader.bytes(length);
	cur.crc = reader.u32b();
	uint32_t crc = crc32(0, NULL, 0);
	crc = crc32(crc, tag, 4);
	if(length > 0)
		crc = crc32(crc, cur.data, length);
	if(crc != cur.crc)
		throw decode_error(chunk_checksum_mismatch, stage_chunk, start, (stringfmt() << "CRC check failed for "
			<< tag_name(cur.type) << " chunk (stored " << std::hex << cur.crc << ", computed " << crc
			<< ")").str());
	return true;
}

std::vector<chunk> split_chunks(const uint8_t* data, size_t size)
{
	dechunker dechunk(data, size);
	std::vector<chunk> chunks;
	bool seen_plte = false;
	bool seen_trns = false;
	bool seen_idat = false;
	bool idat_ended = false;
	size_t skipped = 0;
	while(dechunk.next_chunk()) {
		const chunk& c = dechunk.current();
		if(chunks.empty() && c.type != chunk_ihdr)
			order_error(c, "First chunk is " + tag_name(c.type) + ", expected IHDR");
		if(seen_idat && c.type != chunk_idat)
			idat_ended = true;
		switch(c.type) {
		case chunk_ihdr:
			if(!chunks.empty())
				order_error(c, "Duplicate IHDR chunk");
			break;
		case chunk_plte:
			if(seen_plte)
				order_error(c, "Duplicate PLTE chunk");
			if(seen_trns)
				order_error(c, "PLTE after tRNS");
			if(seen_idat)
				order_error(c, "PLTE not allowed after image data");
			seen_plte = true;
			break;
		case chunk_trns:
			if(seen_trns)
				order_error(c, "Duplicate tRNS chunk");
			if(seen_idat)
				order_error(c, "tRNS not allowed after image data");
			seen_trns = true;
			break;
		case chunk_idat:
			if(idat_ended)
				order_error(c, "IDAT chunks are not consecutive");
			seen_idat = true;
			break;
		case chunk_iend:
			if(c.length)
				order_error(c, "IEND chunk has a payload");
			if(!seen_idat)
				order_error(c, "No IDAT chunk before IEND");
			if(!dechunk.eof())
				throw decode_error(malformed_chunk_order, stage_chunk, dechunk.position(),
					"Trailing data after IEND");
			chunks.push_back(c);
			messages << "pngread: " << chunks.size() << " chunks, " << skipped << " ancillary skipped"
				<< std::endl;
			return chunks;
		default:
			if(chunk_is_critical(c.type))
				throw decode_error(unknown_critical_chunk, stage_chunk, c.offset - 8,
					"Unknown critical chunk " + tag_name(c.type));
			skipped++;
			continue;
		}
		chunks.push_back(c);
	}
	throw decode_error(truncated_chunk, stage_chunk, dechunk.position(), "File ends before IEND chunk");
}
}
