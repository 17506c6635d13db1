#include "pngread/png.hpp"
#include "pngread/messages.hpp"
#include "pngread/string.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/device/back_inserter.hpp>

namespace
{
	std::vector<char> read_file(const std::string& path)
	{
		boost::iostreams::file_source src(path, std::ios_base::in | std::ios_base::binary);
		if(!src.is_open())
			(pngread::stringfmt() << "Can't open '" << path << "'").throwex();
		std::vector<char> buf;
		boost::iostreams::copy(src, boost::iostreams::back_inserter(buf));
		return buf;
	}

	void print_info(const pngread::image_info& info)
	{
		const pngread::image_header& hdr = info.header;
		std::cout << "Size: " << hdr.width << "*" << hdr.height << std::endl;
		std::cout << "Color type: " << pngread::color_type_name(hdr.type) << " (" << (int)hdr.type << ")"
			<< std::endl;
		std::cout << "Bit depth: " << (int)hdr.depth << std::endl;
		if(!info.palette.empty())
			std::cout << "Image is paletted, " << info.palette.size() << " colors." << std::endl;
		if(info.trans.present)
			std::cout << "Has transparency (tRNS)" << std::endl;
		std::cout << "Scanline stride: " << hdr.stride() << " bytes" << std::endl;
	}

	uint8_t over_black(uint8_t c, uint8_t a)
	{
		return (static_cast<unsigned>(c) * a + 127) / 255;
	}

	void print_pixels(const pngread::pixel_grid& img)
	{
		for(size_t y = 0; y < img.height; y++) {
			for(size_t x = 0; x < img.width; x++) {
				uint32_t px = img.at(x, y);
				uint8_t a = pngread::pixel_alpha(px);
				std::cout << "\e[48;2;" << (int)over_black(pngread::pixel_red(px), a) << ";"
					<< (int)over_black(pngread::pixel_green(px), a) << ";"
					<< (int)over_black(pngread::pixel_blue(px), a) << "m ";
			}
			std::cout << "\e[0m" << std::endl;
		}
	}
}

int main(int argc, char** argv)
{
	pngread::decode_options opts;
	bool info_only = false;
	std::string file;
	for(int i = 1; i < argc; i++) {
		std::string a = argv[i];
		if(a == "--alpha")
			opts.keep_alpha = true;
		else if(a == "--info")
			info_only = true;
		else if(a == "--verbose")
			pngread::messages_relay_class::set_target(&std::cerr);
		else if(a.length() >= 12 && a.substr(0, 12) == "--max-bytes=") {
			try {
				opts.max_raw_bytes = boost::lexical_cast<uint64_t>(a.substr(12));
			} catch(boost::bad_lexical_cast&) {
				std::cerr << "Bad --max-bytes: " << a.substr(12) << std::endl;
				return 1;
			}
		} else if(a.length() > 2 && a.substr(0, 2) == "--") {
			std::cerr << "Unknown option '" << a << "'" << std::endl;
			return 1;
		} else if(file == "")
			file = a;
		else {
			std::cerr << "Only one file can be shown" << std::endl;
			return 1;
		}
	}
	if(file == "") {
		std::cerr << "Syntax: " << argv[0] << " [--alpha] [--info] [--verbose] [--max-bytes=<n>] <pngfile>"
			<< std::endl;
		return 1;
	}
	try {
		std::vector<char> buf = read_file(file);
		const uint8_t* data = reinterpret_cast<const uint8_t*>(buf.empty() ? NULL : &buf[0]);
		if(info_only)
			print_info(pngread::probe(data, buf.size()));
		else
			print_pixels(pngread::decode(data, buf.size(), opts));
	} catch(std::exception& e) {
		std::cerr << file << ": " << e.what() << std::endl;
		return 2;
	}
	return 0;
}
