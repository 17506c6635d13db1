#include "pngread/messages.hpp"
#include <atomic>
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/null.hpp>

namespace pngread
{
namespace
{
	std::atomic<std::ostream*> target_stream(NULL);
}

messages_relay_class messages;

std::ostream& messages_relay_class::getstream()
{
	std::ostream* t = target_stream.load();
	if(t)
		return *t;
	static thread_local boost::iostreams::stream<boost::iostreams::null_sink> discard(
		(boost::iostreams::null_sink()));
	return discard;
}

void messages_relay_class::set_target(std::ostream* target)
{
	target_stream.store(target);
}
}
