#include "pngread/inflate.hpp"
#include "pngread/error.hpp"
#include "pngread/serialization.hpp"
#include "pngread/string.hpp"
#include <cstring>
#include <zlib.h>

namespace pngread
{
namespace
{
	const uint16_t length_base[29] = {
		3, 4, 5, 6, 7, 8, 9, 10,		//257...264
		11, 13, 15, 17,				//265...268
		19, 23, 27, 31,				//269...272
		35, 43, 51, 59,				//273...276
		67, 83, 99, 115,			//277...280
		131, 163, 195, 227,			//281...284
		258					//285
	};
	const uint8_t length_extra[29] = {
		0, 0, 0, 0, 0, 0, 0, 0,
		1, 1, 1, 1,
		2, 2, 2, 2,
		3, 3, 3, 3,
		4, 4, 4, 4,
		5, 5, 5, 5,
		0
	};
	const uint16_t distance_base[30] = {
		1, 2, 3, 4,
		5, 7, 9, 13, 17, 25, 33, 49, 65, 97, 129, 193,
		257, 385, 513, 769, 1025, 1537, 2049, 3073,
		4097, 6145, 8193, 12289, 16385, 24577
	};
	const uint8_t distance_extra[30] = {
		0, 0, 0, 0,
		1, 1, 2, 2, 3, 3, 4, 4, 5, 5, 6, 6,
		7, 7, 8, 8, 9, 9, 10, 10,
		11, 11, 12, 12, 13, 13
	};
	//Order code length code lengths are transmitted in.
	const uint8_t code_length_order[19] = {16, 17, 18, 0, 8, 7, 9, 6, 10, 5, 11, 4, 12, 3, 13, 2, 14, 1, 15};

	const size_t max_literal_codes = 286;
	const size_t max_distance_codes = 30;

	//=========================================================
	//=================== FIXED CODES =========================
	//=========================================================
	struct fixed_codes
	{
		fixed_codes()
		{
			uint8_t lengths[288];
			memset(lengths + 0, 8, 144);
			memset(lengths + 144, 9, 112);
			memset(lengths + 256, 7, 24);
			memset(lengths + 280, 8, 8);
			literal = huffman_code(lengths, 288);
			//Symbols 30 and 31 have codes but never occur in valid data.
			memset(lengths, 5, 32);
			distance = huffman_code(lengths, 32);
		}
		huffman_code literal;
		huffman_code distance;
	};

	const fixed_codes& get_fixed_codes()
	{
		static const fixed_codes codes;
		return codes;
	}

	//=========================================================
	//=================== BLOCK DECODER =======================
	//=========================================================
	class inflater
	{
	public:
		inflater(bit_reader& _in, std::vector<uint8_t>& _out, size_t _expected)
			: in(_in), out(_out), expected(_expected)
		{
		}
		void run();
	private:
		inflater(const inflater&);
		inflater& operator=(const inflater&);
		void stored();
		void dynamic();
		void codes(const huffman_code& literal, const huffman_code& distance);
		void room_for(size_t n)
		{
			if(n > expected - out.size())
				throw decode_error(output_overrun, stage_inflate, in.position(), (stringfmt()
					<< "Decompressed data exceeds expected " << expected << " bytes").str());
		}
		void block_error(const std::string& msg)
		{
			throw decode_error(invalid_compressed_block, stage_inflate, in.position(), msg);
		}
		bit_reader& in;
		std::vector<uint8_t>& out;
		size_t expected;
	};

	void inflater::run()
	{
		bool last;
		do {
			last = in.bit();
			unsigned type = in.bits(2);
			switch(type) {
			case 0:
				stored();
				break;
			case 1:
				codes(get_fixed_codes().literal, get_fixed_codes().distance);
				break;
			case 2:
				dynamic();
				break;
			default:
				block_error("Reserved block type 3");
			}
		} while(!last);
		if(out.size() < expected)
			throw decode_error(truncated_stream, stage_inflate, in.position(), (stringfmt()
				<< "Stream ended after " << out.size() << " of " << expected << " bytes").str());
	}

	void inflater::stored()
	{
		in.align();
		const uint8_t* hdr = in.bytes(4);
		uint16_t len = serialization::u16l(hdr + 0);
		uint16_t nlen = serialization::u16l(hdr + 2);
		if(len != static_cast<uint16_t>(~nlen))
			block_error("Stored block length integrity check failed");
		room_for(len);
		const uint8_t* data = in.bytes(len);
		out.insert(out.end(), data, data + len);
	}

	void inflater::dynamic()
	{
		size_t nlen = in.bits(5) + 257;
		size_t ndist = in.bits(5) + 1;
		size_t ncode = in.bits(4) + 4;
		if(nlen > max_literal_codes)
			block_error((stringfmt() << "Too many literal/length codes (" << nlen << ")").str());
		if(ndist > max_distance_codes)
			block_error((stringfmt() << "Too many distance codes (" << ndist << ")").str());

		uint8_t lengths[max_literal_codes + max_distance_codes];
		memset(lengths, 0, sizeof(lengths));
		for(size_t i = 0; i < ncode; i++)
			lengths[code_length_order[i]] = in.bits(3);
		huffman_code lencode(lengths, 19, in.position());

		memset(lengths, 0, sizeof(lengths));
		size_t index = 0;
		while(index < nlen + ndist) {
			unsigned symbol = lencode.decode(in);
			if(symbol < 16) {
				lengths[index++] = symbol;
				continue;
			}
			uint8_t len = 0;
			size_t rep;
			if(symbol == 16) {
				if(index == 0)
					block_error("Length repeat with no previous length");
				len = lengths[index - 1];
				rep = 3 + in.bits(2);
			} else if(symbol == 17)
				rep = 3 + in.bits(3);
			else
				rep = 11 + in.bits(7);
			if(index + rep > nlen + ndist)
				block_error("Code length repeat runs past the end of the code lengths");
			memset(lengths + index, len, rep);
			index += rep;
		}
		if(lengths[256] == 0)
			block_error("Block has no end-of-block code");

		huffman_code literal(lengths, nlen, in.position());
		huffman_code distance(lengths + nlen, ndist, in.position());
		codes(literal, distance);
	}

	void inflater::codes(const huffman_code& literal, const huffman_code& distance)
	{
		while(true) {
			unsigned symbol = literal.decode(in);
			if(symbol < 256) {
				room_for(1);
				out.push_back(symbol);
				continue;
			}
			if(symbol == 256)
				return;
			symbol -= 257;
			if(symbol >= 29)
				throw decode_error(invalid_code, stage_inflate, in.position(), (stringfmt()
					<< "Invalid length symbol " << (symbol + 257)).str());
			size_t len = length_base[symbol] + in.bits(length_extra[symbol]);
			unsigned dsymbol = distance.decode(in);
			if(dsymbol >= 30)
				throw decode_error(invalid_code, stage_inflate, in.position(), (stringfmt()
					<< "Invalid distance symbol " << dsymbol).str());
			size_t dist = distance_base[dsymbol] + in.bits(distance_extra[dsymbol]);
			if(dist > out.size())
				block_error((stringfmt() << "Back-reference distance " << dist << " exceeds the "
					<< out.size() << " bytes decoded so far").str());
			room_for(len);
			//May overlap the bytes being written.
			size_t from = out.size() - dist;
			for(size_t i = 0; i < len; i++) {
				uint8_t b = out[from + i];
				out.push_back(b);
			}
		}
	}

	std::vector<uint8_t> inflate_stream(const uint8_t* data, size_t size, size_t base, size_t expected,
		size_t* consumed)
	{
		std::vector<uint8_t> out;
		out.reserve(expected);
		bit_reader in(data, size, base);
		inflater state(in, out, expected);
		state.run();
		if(consumed)
			*consumed = in.position() - base;
		return out;
	}
}

//=========================================================
//=================== BIT READER ==========================
//=========================================================
bit_reader::bit_reader(const uint8_t* _data, size_t _size, size_t _base)
	: data(_data), size(_size), ptr(0), base(_base), buffer(0), count(0)
{
}

unsigned bit_reader::bits(unsigned n)
{
	while(count < n) {
		if(ptr == size)
			throw decode_error(truncated_stream, stage_inflate, base + ptr, "Compressed stream truncated");
		buffer |= static_cast<uint32_t>(data[ptr++]) << count;
		count += 8;
	}
	unsigned v = buffer & ((static_cast<uint32_t>(1) << n) - 1);
	buffer >>= n;
	count -= n;
	return v;
}

const uint8_t* bit_reader::bytes(size_t n)
{
	if(n > size - ptr)
		throw decode_error(truncated_stream, stage_inflate, base + ptr, (stringfmt() << "Stored block needs "
			<< n << " bytes, only " << (size - ptr) << " left").str());
	const uint8_t* r = data + ptr;
	ptr += n;
	return r;
}

//=========================================================
//=================== PREFIX CODES ========================
//=========================================================
huffman_code::huffman_code()
{
	memset(count, 0, sizeof(count));
}

huffman_code::huffman_code(const uint8_t* lengths, size_t n, size_t offset)
{
	memset(count, 0, sizeof(count));
	for(size_t i = 0; i < n; i++)
		count[lengths[i]]++;
	int left = 1;
	for(unsigned len = 1; len <= max_bits; len++) {
		left <<= 1;
		left -= count[len];
		if(left < 0)
			throw decode_error(invalid_code, stage_inflate, offset, "Over-subscribed prefix code");
	}
	uint16_t offsets[max_bits + 2];
	offsets[1] = 0;
	for(unsigned len = 1; len <= max_bits; len++)
		offsets[len + 1] = offsets[len] + count[len];
	symbol.resize(offsets[max_bits + 1]);
	for(size_t i = 0; i < n; i++)
		if(lengths[i])
			symbol[offsets[lengths[i]]++] = i;
}

unsigned huffman_code::decode(bit_reader& in) const
{
	int code = 0;
	int first = 0;
	int index = 0;
	for(unsigned len = 1; len <= max_bits; len++) {
		code |= in.bit();
		int n = count[len];
		if(code - first < n)
			return symbol[index + (code - first)];
		index += n;
		first += n;
		first <<= 1;
		code <<= 1;
	}
	throw decode_error(invalid_code, stage_inflate, in.position(), "Bit sequence matches no prefix code");
}

//=========================================================
//=================== STREAM WRAPPERS =====================
//=========================================================
std::vector<uint8_t> inflate_raw(const uint8_t* data, size_t size, size_t expected, size_t* consumed)
{
	return inflate_stream(data, size, 0, expected, consumed);
}

std::vector<uint8_t> inflate_zlib(const uint8_t* data, size_t size, size_t expected)
{
	if(size < 2)
		throw decode_error(truncated_stream, stage_inflate, 0, "Missing zlib header");
	uint8_t cmf = data[0];
	uint8_t flg = data[1];
	if((256 * cmf + flg) % 31)
		throw decode_error(invalid_stream_header, stage_inflate, 0, "zlib header integrity check failed");
	if((cmf & 15) != 8)
		throw decode_error(invalid_stream_header, stage_inflate, 0, (stringfmt()
			<< "Unsupported zlib compression method " << (cmf & 15)).str());
	if((cmf >> 4) > 7)
		throw decode_error(invalid_stream_header, stage_inflate, 0, (stringfmt()
			<< "zlib window size 2^" << ((cmf >> 4) + 8) << " exceeds 32768").str());
	if(flg & 0x20)
		throw decode_error(invalid_stream_header, stage_inflate, 1, "Preset dictionaries are not allowed");

	size_t used = 0;
	std::vector<uint8_t> out = inflate_stream(data + 2, size - 2, 2, expected, &used);
	size_t trailer = 2 + used;
	if(size - trailer < 4)
		throw decode_error(truncated_stream, stage_inflate, trailer, "Missing Adler-32 trailer");
	uint32_t claim = serialization::u32b(data + trailer);
	uint32_t actual = adler32_z(adler32(0, NULL, 0), out.empty() ? NULL : &out[0], out.size());
	if(claim != actual)
		throw decode_error(stream_checksum_mismatch, stage_inflate, trailer, (stringfmt()
			<< "Adler-32 mismatch (stored " << std::hex << claim << ", computed " << actual << ")").str());
	return out;
}
}
