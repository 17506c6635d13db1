#include "testpng.hpp"
#include "pngread/pixel.hpp"

using namespace pngread;
using testpng::throws_code;

namespace
{
	image_info make_info(uint32_t width, uint8_t depth, uint8_t type)
	{
		image_info info;
		info.header.width = width;
		info.header.height = 1;
		info.header.depth = depth;
		info.header.type = type;
		info.header.compression = 0;
		info.header.filter = 0;
		info.header.interlace = false;
		info.trans.present = false;
		info.trans.key[0] = info.trans.key[1] = info.trans.key[2] = 0;
		return info;
	}

	std::vector<uint32_t> decode_row(const image_info& info, bool keep_alpha, const uint8_t* row)
	{
		std::vector<uint32_t> out(info.header.width);
		pixel_decoder d(info, keep_alpha);
		d.decode(&out[0], row, 0);
		return out;
	}

	std::vector<uint32_t> pixels(uint32_t a, uint32_t b)
	{
		std::vector<uint32_t> p;
		p.push_back(a);
		p.push_back(b);
		return p;
	}
}

struct testpng::test tests[] = {
	{"Pixel packing", []() {
		uint32_t px = make_pixel(1, 2, 3, 4);
		return px == 0x04010203U && pixel_red(px) == 1 && pixel_green(px) == 2 && pixel_blue(px) == 3 &&
			pixel_alpha(px) == 4 && make_pixel(1, 2, 3) == 0xFF010203U;
	}},{"Gray 1 bit", []() {
		image_info info = make_info(8, 1, color_grayscale);
		uint8_t row[] = {0xA5};
		std::vector<uint32_t> p = decode_row(info, false, row);
		return p[0] == 0xFFFFFFFFU && p[1] == 0xFF000000U && p[2] == 0xFFFFFFFFU && p[3] == 0xFF000000U &&
			p[5] == 0xFFFFFFFFU && p[7] == 0xFFFFFFFFU;
	}},{"Gray 2 bit", []() {
		image_info info = make_info(4, 2, color_grayscale);
		uint8_t row[] = {0x1B};
		std::vector<uint32_t> p = decode_row(info, false, row);
		return p[0] == 0xFF000000U && p[1] == 0xFF555555U && p[2] == 0xFFAAAAAAU && p[3] == 0xFFFFFFFFU;
	}},{"Gray 4 bit", []() {
		image_info info = make_info(3, 4, color_grayscale);
		uint8_t row[] = {0x3C, 0xF0};
		std::vector<uint32_t> p = decode_row(info, false, row);
		return p[0] == 0xFF333333U && p[1] == 0xFFCCCCCCU && p[2] == 0xFFFFFFFFU;
	}},{"Gray 8 bit", []() {
		image_info info = make_info(2, 8, color_grayscale);
		uint8_t row[] = {0x80, 0x01};
		return decode_row(info, false, row) == pixels(0xFF808080U, 0xFF010101U);
	}},{"Gray 16 bit keeps high byte", []() {
		image_info info = make_info(2, 16, color_grayscale);
		uint8_t row[] = {0x12, 0x34, 0xFF, 0x00};
		return decode_row(info, false, row) == pixels(0xFF121212U, 0xFFFFFFFFU);
	}},{"Truecolor 8 bit", []() {
		image_info info = make_info(2, 8, color_truecolor);
		uint8_t row[] = {1, 2, 3, 4, 5, 6};
		return decode_row(info, false, row) == pixels(0xFF010203U, 0xFF040506U);
	}},{"Truecolor 16 bit", []() {
		image_info info = make_info(1, 16, color_truecolor);
		uint8_t row[] = {0x10, 0xFF, 0x20, 0xFF, 0x30, 0xFF};
		return decode_row(info, false, row)[0] == 0xFF102030U;
	}},{"Gray alpha dropped", []() {
		image_info info = make_info(1, 8, color_grayscale_alpha);
		uint8_t row[] = {0x40, 0x00};
		return decode_row(info, false, row)[0] == 0xFF404040U;
	}},{"Gray alpha kept", []() {
		image_info info = make_info(2, 16, color_grayscale_alpha);
		uint8_t row[] = {0x40, 0x11, 0x20, 0x22, 0x50, 0x00, 0xFF, 0xFF};
		return decode_row(info, true, row) == pixels(0x20404040U, 0xFF505050U);
	}},{"Truecolor alpha", []() {
		image_info info = make_info(1, 16, color_truecolor_alpha);
		uint8_t row[] = {0xAA, 0, 0xBB, 0, 0xCC, 0, 0x80, 0};
		if(decode_row(info, true, row)[0] != 0x80AABBCCU)
			return false;
		return decode_row(info, false, row)[0] == 0xFFAABBCCU;
	}},{"Truecolor alpha 8 bit", []() {
		image_info info = make_info(1, 8, color_truecolor_alpha);
		uint8_t row[] = {1, 2, 3, 0};
		return decode_row(info, true, row)[0] == 0x00010203U;
	}},{"Gray transparency key", []() {
		image_info info = make_info(2, 8, color_grayscale);
		info.trans.present = true;
		info.trans.key[0] = 0x80;
		uint8_t row[] = {0x80, 0x81};
		if(decode_row(info, true, row) != pixels(0x00808080U, 0xFF818181U))
			return false;
		return decode_row(info, false, row) == pixels(0xFF808080U, 0xFF818181U);
	}},{"Gray transparency key 16 bit", []() {
		image_info info = make_info(2, 16, color_grayscale);
		info.trans.present = true;
		info.trans.key[0] = 0x1234;
		uint8_t row[] = {0x12, 0x34, 0x12, 0x35};
		return decode_row(info, true, row) == pixels(0x00121212U, 0xFF121212U);
	}},{"Gray transparency key 2 bit", []() {
		image_info info = make_info(4, 2, color_grayscale);
		info.trans.present = true;
		info.trans.key[0] = 2;
		uint8_t row[] = {0x1B};
		std::vector<uint32_t> p = decode_row(info, true, row);
		return p[1] == 0xFF555555U && p[2] == 0x00AAAAAAU;
	}},{"Truecolor transparency key", []() {
		image_info info = make_info(2, 8, color_truecolor);
		info.trans.present = true;
		info.trans.key[0] = 1;
		info.trans.key[1] = 2;
		info.trans.key[2] = 3;
		uint8_t row[] = {1, 2, 3, 1, 2, 4};
		return decode_row(info, true, row) == pixels(0x00010203U, 0xFF010204U);
	}},{"Indexed 8 bit", []() {
		image_info info = make_info(2, 8, color_indexed);
		info.palette.push_back(0xFFFF0000U);
		info.palette.push_back(0xFF00FF00U);
		uint8_t row[] = {1, 0};
		return decode_row(info, false, row) == pixels(0xFF00FF00U, 0xFFFF0000U);
	}},{"Indexed 1 bit", []() {
		image_info info = make_info(10, 1, color_indexed);
		info.palette.push_back(0xFF000011U);
		info.palette.push_back(0xFF000022U);
		uint8_t row[] = {0x81, 0x40};
		std::vector<uint32_t> p = decode_row(info, false, row);
		return p[0] == 0xFF000022U && p[1] == 0xFF000011U && p[7] == 0xFF000022U && p[8] == 0xFF000011U &&
			p[9] == 0xFF000022U;
	}},{"Indexed 4 bit", []() {
		image_info info = make_info(3, 4, color_indexed);
		for(unsigned i = 0; i < 16; i++)
			info.palette.push_back(0xFF000000U | i);
		uint8_t row[] = {0x2F, 0x70};
		std::vector<uint32_t> p = decode_row(info, false, row);
		return p[0] == 0xFF000002U && p[1] == 0xFF00000FU && p[2] == 0xFF000007U;
	}},{"Palette alpha", []() {
		image_info info = make_info(2, 8, color_indexed);
		info.palette.push_back(0x00112233U);
		info.palette.push_back(0x80445566U);
		info.trans.present = true;
		uint8_t row[] = {0, 1};
		if(decode_row(info, true, row) != pixels(0x00112233U, 0x80445566U))
			return false;
		return decode_row(info, false, row) == pixels(0xFF112233U, 0xFF445566U);
	}},{"Palette index out of range", []() {
		image_info info = make_info(4, 2, color_indexed);
		info.palette.push_back(0xFF000000U);
		info.palette.push_back(0xFFFFFFFFU);
		uint8_t row[] = {0x18};	//0, 1, 2, 0
		std::vector<uint32_t> out(4);
		pixel_decoder d(info, false);
		try {
			d.decode(&out[0], row, 7);
		} catch(decode_error& e) {
			return e.code() == palette_index_out_of_range && e.stage() == stage_pixel && e.offset() == 7;
		}
		return false;
	}},{"Alpha flag", []() {
		image_info info = make_info(1, 8, color_truecolor);
		return pixel_decoder(info, true).has_alpha() && !pixel_decoder(info, false).has_alpha();
	}},{"Unsupported depth", []() {
		image_info info = make_info(1, 3, color_grayscale);
		return throws_code([&info]() { pixel_decoder d(info, false); }, unsupported_color_type_bit_depth);
	}},
};

int main()
{
	return testpng::run_tests(tests, sizeof(tests) / sizeof(tests[0]));
}
