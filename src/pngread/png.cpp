#include "pngread/png.hpp"
#include "pngread/chunk.hpp"
#include "pngread/filter.hpp"
#include "pngread/inflate.hpp"
#include "pngread/messages.hpp"
#include "pngread/string.hpp"
#include <algorithm>
#include <limits>
#include <new>

namespace pngread
{
namespace
{
	std::vector<uint8_t> collect_image_data(const std::vector<chunk>& chunks)
	{
		size_t total = 0;
		for(size_t i = 0; i < chunks.size(); i++)
			if(chunks[i].type == chunk_idat)
				total += chunks[i].length;
		std::vector<uint8_t> stream;
		stream.reserve(total);
		for(size_t i = 0; i < chunks.size(); i++)
			if(chunks[i].type == chunk_idat)
				stream.insert(stream.end(), chunks[i].data, chunks[i].data + chunks[i].length);
		return stream;
	}
}

decode_options::decode_options()
{
	keep_alpha = false;
	max_raw_bytes = 1ULL << 30;
}

pixel_grid::pixel_grid()
{
	width = 0;
	height = 0;
	has_alpha = false;
}

image_info probe(const uint8_t* data, size_t size)
{
	std::vector<chunk> chunks = split_chunks(data, size);
	return read_metadata(chunks);
}

pixel_grid decode(const uint8_t* data, size_t size, const decode_options& opts)
{
	std::vector<chunk> chunks = split_chunks(data, size);
	image_info info = read_metadata(chunks);
	const image_header& hdr = info.header;

	//Rows are compared before multiplying, the product may not fit 64 bits.
	uint64_t limit = std::min<uint64_t>(opts.max_raw_bytes, std::numeric_limits<size_t>::max());
	if(hdr.stride() + 1 > limit / hdr.height)
		throw decode_error(image_too_large, stage_header, chunks[0].offset, (stringfmt() << "Image of "
			<< hdr.height << " rows of " << (hdr.stride() + 1) << " bytes exceeds limit of " << limit
			<< " bytes").str());
	uint64_t raw_size = hdr.raw_size();
	size_t stride = hdr.stride();
	size_t pixels = static_cast<size_t>(hdr.width) * hdr.height;
	if(pixels / hdr.width != hdr.height)
		throw std::bad_alloc();
	pixel_decoder pixdecoder(info, opts.keep_alpha);

	std::vector<uint8_t> stream = collect_image_data(chunks);
	messages << "pngread: " << stream.size() << " bytes of compressed data, expecting " << raw_size
		<< " bytes" << std::endl;
	std::vector<uint8_t> raw = inflate_zlib(stream.empty() ? NULL : &stream[0], stream.size(), raw_size);
	std::vector<uint8_t>().swap(stream);

	std::vector<uint32_t> ndata;
	ndata.resize(pixels);
	scanline_filter filterbank(hdr.filter_step(), stride);
	for(size_t y = 0; y < hdr.height; y++) {
		const uint8_t* row = filterbank.unfilter(&raw[y * (stride + 1)]);
		pixdecoder.decode(&ndata[y * hdr.width], row, y);
	}

	pixel_grid out;
	std::swap(out.data, ndata);
	out.width = hdr.width;
	out.height = hdr.height;
	out.has_alpha = pixdecoder.has_alpha();
	messages << "pngread: decoded " << out.width << "x" << out.height << " image" << std::endl;
	return out;
}

pixel_grid decode(const std::vector<uint8_t>& file, const decode_options& opts)
{
	return decode(file.empty() ? NULL : &file[0], file.size(), opts);
}
}
