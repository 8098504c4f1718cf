#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Zap/Msg/JsonCout.hpp"
#include"Zap/log.hpp"
#include<stdarg.h>

namespace Zap {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	auto level_string = std::string();
	switch (l) {
	case Debug: level_string = "debug"; break;
	case Info: level_string = "info"; break;
	case Warn: level_string = "warn"; break;
	case Error: level_string = "error"; break;
	}

	auto js = Json::Out()
		.start_object()
			.field("jsonrpc", std::string("2.0"))
			.field("method", std::string("log"))
			.start_object("params")
				.field("level", level_string)
				.field("message", msg)
			.end_object()
		.end_object()
		;

	return bus.raise(Zap::Msg::JsonCout{std::move(js)});
}

}
