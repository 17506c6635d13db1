#include "pngread/filter.hpp"
#include "pngread/error.hpp"
#include "pngread/string.hpp"
#include <algorithm>

namespace pngread
{
namespace
{
	template<uint8_t(*predictor)(uint8_t left, uint8_t up, uint8_t upleft)> void do_filter_3(uint8_t* target,
		const uint8_t* row, const uint8_t* above, size_t pitch, size_t length)
	{
		for(size_t i = 0; i < pitch && i < length; i++)
			target[i] = row[i] + predictor(0, above[i], 0);
		for(size_t i = pitch; i < length; i++)
			target[i] = row[i] + predictor(target[i - pitch], above[i], above[i - pitch]);
	}
}

void unfilter_row(uint8_t filter, uint8_t* target, const uint8_t* row, const uint8_t* above, size_t step,
	size_t length, size_t rowno)
{
	switch(filter) {
	case filter_none:	do_filter_3<predict_none>(target, row, above, step, length); break;
	case filter_sub:	do_filter_3<predict_left>(target, row, above, step, length); break;
	case filter_up:		do_filter_3<predict_up>(target, row, above, step, length); break;
	case filter_average:	do_filter_3<predict_average>(target, row, above, step, length); break;
	case filter_paeth:	do_filter_3<predict_paeth>(target, row, above, step, length); break;
	default:
		throw decode_error(unknown_filter_type, stage_filter, rowno, (stringfmt() << "Unknown filter type "
			<< (int)filter).str());
	};
}

scanline_filter::scanline_filter(size_t _step, size_t _stride)
	: step(_step), stride(_stride), rowno(0)
{
	current.resize(stride);
	above.resize(stride);
}

const uint8_t* scanline_filter::unfilter(const uint8_t* row)
{
	unfilter_row(row[0], &current[0], row + 1, &above[0], step, stride, rowno);
	std::swap(current, above);
	rowno++;
	return &above[0];
}
}
