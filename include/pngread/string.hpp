#ifndef _pngread__string__hpp__included__
#define _pngread__string__hpp__included__

#include <cstdint>
#include <string>
#include <sstream>
#include <stdexcept>

namespace pngread
{
/**
 * String formatter
 */
class stringfmt
{
public:
	stringfmt() {}
	std::string str() { return x.str(); }
	template<typename T> stringfmt& operator<<(const T& y) { x << y; return *this; }
	void throwex() { throw std::runtime_error(x.str()); }
private:
	std::ostringstream x;
};

/**
 * Render a four-character chunk tag, escaping anything that is not printable.
 */
std::string tag_name(uint32_t tag);
}

#endif
