#ifndef _pngread__filter__hpp__included__
#define _pngread__filter__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace pngread
{
enum filter_type
{
	filter_none = 0,
	filter_sub = 1,
	filter_up = 2,
	filter_average = 3,
	filter_paeth = 4,
};

inline uint8_t predict_none(uint8_t left, uint8_t up, uint8_t upleft)
{
	return 0;
}

inline uint8_t predict_left(uint8_t left, uint8_t up, uint8_t upleft)
{
	return left;
}

inline uint8_t predict_up(uint8_t left, uint8_t up, uint8_t upleft)
{
	return up;
}

inline uint8_t predict_average(uint8_t left, uint8_t up, uint8_t upleft)
{
	return (left >> 1) + (up >> 1) + (left & up & 1);
}

/**
 * Paeth predictor: whichever of left, up and upleft is closest to left + up - upleft. Ties go to
 * left, then up.
 */
inline uint8_t predict_paeth(uint8_t left, uint8_t up, uint8_t upleft)
{
	int16_t p = (int16_t)up + left - upleft;
	uint16_t pa = (p > left) ? (p - left) : (left - p);
	uint16_t pb = (p > up) ? (p - up) : (up - p);
	uint16_t pc = (p > upleft) ? (p - upleft) : (upleft - p);
	if(pa <= pb && pa <= pc)
		return left;
	if(pb <= pc)
		return up;
	return upleft;
}

/**
 * Undo the filter of one scanline.
 *
 * Parameter filter: The filter type byte of the row.
 * Parameter target: Receives the unfiltered bytes (length bytes).
 * Parameter row: The filtered bytes (without the filter type byte).
 * Parameter above: The unfiltered previous row, all zeroes for the first row.
 * Parameter step: Bytes per complete pixel, at least 1.
 * Parameter length: Bytes in the row.
 * Parameter rowno: Row number to report errors with.
 * Throws decode_error: Unknown filter type.
 */
void unfilter_row(uint8_t filter, uint8_t* target, const uint8_t* row, const uint8_t* above, size_t step,
	size_t length, size_t rowno);

/**
 * Sequential scanline defilterer. Keeps only the current and the previous row.
 */
class scanline_filter
{
public:
/**
 * Create a defilterer.
 *
 * Parameter _step: Bytes per complete pixel (at least 1).
 * Parameter _stride: Bytes per row, excluding the filter type byte.
 */
	scanline_filter(size_t _step, size_t _stride);
/**
 * Unfilter the next row.
 *
 * Parameter row: The filter type byte followed by stride filtered bytes.
 * Returns: The unfiltered row. Valid until the next call.
 * Throws decode_error: Unknown filter type.
 */
	const uint8_t* unfilter(const uint8_t* row);
/**
 * Number of rows unfiltered so far.
 */
	size_t rows() const { return rowno; }
private:
	scanline_filter(const scanline_filter&);
	scanline_filter& operator=(const scanline_filter&);
	size_t step;
	size_t stride;
	size_t rowno;
	std::vector<uint8_t> current;
	std::vector<uint8_t> above;
};
}

#endif
