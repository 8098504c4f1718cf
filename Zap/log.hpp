#ifndef ZAP_LOG_HPP
#define ZAP_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Zap {

enum LogLevel {
	Debug,
	Info,
	Warn,
	Error
};

/* Sends a `log` notification to lightningd.  */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* ZAP_LOG_HPP */
