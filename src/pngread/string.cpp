#include "pngread/string.hpp"
#include <iomanip>

namespace pngread
{
std::string tag_name(uint32_t tag)
{
	std::ostringstream x;
	for(unsigned i = 0; i < 4; i++) {
		unsigned char ch = tag >> (24 - 8 * i);
		if(ch >= 32 && ch < 127 && ch != '\\')
			x << static_cast<char>(ch);
		else
			x << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ch)
				<< std::dec;
	}
	return x.str();
}
}
