#include "testpng.hpp"
#include "pngread/png.hpp"
#include "pngread/messages.hpp"
#include "pngread/serialization.hpp"
#include <sstream>

using namespace pngread;
using testpng::png_writer;
using testpng::throws_code;

namespace
{
	std::vector<uint8_t> scenario_gray()
	{
		uint8_t raw[] = {0, 10, 20, 0, 30, 40};
		return testpng::make_png(2, 2, 8, 0, std::vector<uint8_t>(raw, raw + sizeof(raw)));
	}

	std::vector<uint8_t> scenario_palette()
	{
		uint8_t raw[] = {0, 0, 1, 0, 1, 0};
		std::vector<uint32_t> pal;
		pal.push_back(0xFF0000);
		pal.push_back(0x00FF00);
		png_writer w;
		w.header(2, 2, 8, 3).palette(pal).image_data(std::vector<uint8_t>(raw, raw + sizeof(raw))).end();
		return w.bytes();
	}

	std::function<void()> decoder(const std::vector<uint8_t>& file, const decode_options& opts = decode_options())
	{
		return [file, opts]() { decode(file, opts); };
	}

	//Offset of the first IDAT payload in a file with only IHDR before it.
	const size_t idat_payload = 8 + 25 + 8;
}

struct testpng::test tests[] = {
	{"Grayscale image", []() {
		pixel_grid img = decode(scenario_gray());
		return img.width == 2 && img.height == 2 && !img.has_alpha && img.data.size() == 4 &&
			img.at(0, 0) == 0xFF0A0A0AU && img.at(1, 0) == 0xFF141414U && img.at(0, 1) == 0xFF1E1E1EU &&
			img.at(1, 1) == 0xFF282828U;
	}},{"Indexed image", []() {
		pixel_grid img = decode(scenario_palette());
		return img.at(0, 0) == 0xFFFF0000U && img.at(1, 0) == 0xFF00FF00U && img.at(0, 1) == 0xFF00FF00U &&
			img.at(1, 1) == 0xFFFF0000U;
	}},{"Interlaced image", []() {
		png_writer w;
		w.header(2, 2, 8, 0, 1).image_data(std::vector<uint8_t>(6, 0)).end();
		return throws_code(decoder(w.bytes()), unsupported_interlacing);
	}},{"Corrupted image data", []() {
		std::vector<uint8_t> file = scenario_gray();
		file[idat_payload] ^= 0x01;
		try {
			decode(file);
		} catch(decode_error& e) {
			return e.code() == chunk_checksum_mismatch && e.offset() == 33;
		}
		return false;
	}},{"Error message", []() {
		std::vector<uint8_t> file = scenario_gray();
		file[idat_payload] ^= 0x01;
		try {
			decode(file);
		} catch(std::exception& e) {
			std::string msg = e.what();
			return msg.find("chunk_checksum_mismatch") != std::string::npos &&
				msg.find("IDAT") != std::string::npos;
		}
		return false;
	}},{"Repeatable", []() {
		std::vector<uint8_t> file = scenario_palette();
		pixel_grid a = decode(file);
		pixel_grid b = decode(file);
		return a.data == b.data && a.width == b.width && a.height == b.height;
	}},{"Split image data", []() {
		uint8_t raw[] = {0, 10, 20, 0, 30, 40};
		for(size_t pieces = 2; pieces < 6; pieces++) {
			png_writer w;
			w.header(2, 2, 8, 0).image_data(std::vector<uint8_t>(raw, raw + sizeof(raw)), pieces).end();
			if(decode(w.bytes()).data != decode(scenario_gray()).data)
				return false;
		}
		return true;
	}},{"Filtered truecolor", []() {
		std::vector<uint8_t> rows[3];
		std::vector<uint8_t> raw;
		std::vector<uint8_t> prev(6, 0);
		for(unsigned y = 0; y < 3; y++) {
			for(unsigned i = 0; i < 6; i++)
				rows[y].push_back(40 * y + 7 * i);
			std::vector<uint8_t> f = testpng::filter_row(y + 1, rows[y], prev, 3);
			raw.insert(raw.end(), f.begin(), f.end());
			prev = rows[y];
		}
		pixel_grid img = decode(testpng::make_png(2, 3, 8, 2, raw));
		for(unsigned y = 0; y < 3; y++)
			for(unsigned x = 0; x < 2; x++)
				if(img.at(x, y) != make_pixel(rows[y][3 * x], rows[y][3 * x + 1], rows[y][3 * x + 2]))
					return false;
		return true;
	}},{"Packed rows padded", []() {
		uint8_t raw[] = {0, 0xFF, 0xC0, 0, 0x00, 0x3F};
		pixel_grid img = decode(testpng::make_png(10, 2, 1, 0, std::vector<uint8_t>(raw, raw + sizeof(raw))));
		for(unsigned x = 0; x < 10; x++)
			if(img.at(x, 0) != 0xFFFFFFFFU || img.at(x, 1) != 0xFF000000U)
				return false;
		return true;
	}},{"Alpha kept", []() {
		uint8_t raw[] = {0, 1, 2, 3, 0x40, 0, 4, 5, 6, 0xFF};
		std::vector<uint8_t> file = testpng::make_png(1, 2, 8, 6, std::vector<uint8_t>(raw, raw + sizeof(raw)));
		decode_options opts;
		opts.keep_alpha = true;
		pixel_grid img = decode(file, opts);
		if(!img.has_alpha || img.at(0, 0) != 0x40010203U || img.at(0, 1) != 0xFF040506U)
			return false;
		img = decode(file);
		return !img.has_alpha && img.at(0, 0) == 0xFF010203U;
	}},{"Transparent palette", []() {
		std::vector<uint32_t> pal;
		pal.push_back(0xFF0000);
		pal.push_back(0x00FF00);
		uint8_t raw[] = {0, 0x10};	//0, 1, 0, 0
		png_writer w;
		w.header(4, 1, 2, 3).palette(pal).chunk(chunk_trns, std::vector<uint8_t>(1, 0));
		w.image_data(std::vector<uint8_t>(raw, raw + sizeof(raw))).end();
		decode_options opts;
		opts.keep_alpha = true;
		pixel_grid img = decode(w.bytes(), opts);
		return img.at(0, 0) == 0x00FF0000U && img.at(1, 0) == 0xFF00FF00U;
	}},{"Palette index out of range", []() {
		std::vector<uint32_t> pal;
		pal.push_back(0xFF0000);
		pal.push_back(0x00FF00);
		uint8_t raw[] = {0, 0, 1, 0, 1, 2};
		png_writer w;
		w.header(2, 2, 8, 3).palette(pal).image_data(std::vector<uint8_t>(raw, raw + sizeof(raw))).end();
		try {
			decode(w.bytes());
		} catch(decode_error& e) {
			return e.code() == palette_index_out_of_range && e.offset() == 1;
		}
		return false;
	}},{"Unknown filter in image", []() {
		uint8_t raw[] = {0, 10, 20, 9, 30, 40};
		return throws_code(decoder(testpng::make_png(2, 2, 8, 0, std::vector<uint8_t>(raw, raw + sizeof(raw)))),
			unknown_filter_type);
	}},{"Too much image data", []() {
		uint8_t raw[] = {0, 10, 20, 0, 30, 40, 0, 50, 60};
		return throws_code(decoder(testpng::make_png(2, 2, 8, 0, std::vector<uint8_t>(raw, raw + sizeof(raw)))),
			output_overrun);
	}},{"Too little image data", []() {
		uint8_t raw[] = {0, 10, 20};
		return throws_code(decoder(testpng::make_png(2, 2, 8, 0, std::vector<uint8_t>(raw, raw + sizeof(raw)))),
			truncated_stream);
	}},{"Bad Adler-32", []() {
		uint8_t raw[] = {0, 10, 20, 0, 30, 40};
		std::vector<uint8_t> z = testpng::zlib_compress(std::vector<uint8_t>(raw, raw + sizeof(raw)));
		z[z.size() - 1] ^= 0x80;
		png_writer w;
		w.header(2, 2, 8, 0).chunk(chunk_idat, z).end();
		return throws_code(decoder(w.bytes()), stream_checksum_mismatch);
	}},{"Size limit", []() {
		decode_options opts;
		opts.max_raw_bytes = 5;
		if(!throws_code(decoder(scenario_gray(), opts), image_too_large))
			return false;
		opts.max_raw_bytes = 6;
		return decode(scenario_gray(), opts).data.size() == 4;
	}},{"Huge dimensions", []() {
		png_writer w;
		w.header(0x7FFFFFFF, 0x7FFFFFFF, 8, 6).image_data(std::vector<uint8_t>(6, 0)).end();
		return throws_code(decoder(w.bytes()), image_too_large);
	}},{"Probe skips image data", []() {
		png_writer w;
		w.header(3, 4, 16, 2).chunk(chunk_idat, std::vector<uint8_t>(5, 0xEE)).end();
		std::vector<uint8_t> file = w.bytes();
		image_info info = probe(&file[0], file.size());
		if(info.header.width != 3 || info.header.height != 4 || info.header.depth != 16)
			return false;
		return throws_code(decoder(file), invalid_stream_header);
	}},{"Messages", []() {
		std::ostringstream log;
		messages_relay_class::set_target(&log);
		decode(scenario_gray());
		messages_relay_class::set_target(NULL);
		decode(scenario_gray());
		std::string s = log.str();
		return s.find("pngread: 2x2 grayscale") != std::string::npos &&
			s.find("decoded 2x2") == s.rfind("decoded 2x2");
	}},
};

int main()
{
	return testpng::run_tests(tests, sizeof(tests) / sizeof(tests[0]));
}
