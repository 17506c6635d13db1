#ifndef _pngread__messages__hpp__included__
#define _pngread__messages__hpp__included__

#include <iostream>

namespace pngread
{
/**
 * messages -> log target set by the application, or nowhere.
 */
class messages_relay_class
{
public:
	operator std::ostream&() { return getstream(); }
	static std::ostream& getstream();
/**
 * Set the stream decoder diagnostics go to. NULL discards them (the default).
 *
 * The stream must outlive all decoding.
 */
	static void set_target(std::ostream* target);
};
template<typename T> inline std::ostream& operator<<(messages_relay_class& x, T value)
{
	return messages_relay_class::getstream() << value;
};
inline std::ostream& operator<<(messages_relay_class& x, std::ostream& (*fn)(std::ostream& o))
{
	return fn(messages_relay_class::getstream());
};
extern messages_relay_class messages;
}

#endif
