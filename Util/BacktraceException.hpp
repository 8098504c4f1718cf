#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<utility>

#if ENABLE_EXCEPTION_BACKTRACE
# include<execinfo.h>
# include<sstream>
# include<stdlib.h>
# include<string>
# define UNW_LOCAL_ONLY
# include<libunwind.h>
#endif

namespace Util {

#if !ENABLE_EXCEPTION_BACKTRACE

/** class Util::BacktraceException<E>
 *
 * @brief Plain wrapper around E when backtraces
 * are not enabled in the build.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... As>
	BacktraceException(As&&... as)
		: E(std::forward<As>(as)...) { }
};

#else /* ENABLE_EXCEPTION_BACKTRACE */

/** class Util::BacktraceException<E>
 *
 * @brief Wraps an exception E and records the call stack
 * at the point of construction.
 *
 * @desc The stack is walked with libunwind and
 * symbolized lazily, the first time
 * `what()` is called, so exceptions that are caught and
 * handled silently do not pay for symbolization.
 */
template<typename E>
class BacktraceException : public E {
private:
	static constexpr int max_frames = 64;

	void* frames[max_frames];
	int depth;
	mutable bool formatted;
	mutable std::string message;

	void capture() {
		unw_context_t context;
		unw_cursor_t cursor;
		if (unw_getcontext(&context) != 0)
			return;
		if (unw_init_local(&cursor, &context) != 0)
			return;
		while (depth < max_frames && unw_step(&cursor) > 0) {
			unw_word_t ip;
			if (unw_get_reg(&cursor, UNW_REG_IP, &ip) != 0)
				break;
			frames[depth++] = reinterpret_cast<void*>(ip);
		}
	}

public:
	template<typename... As>
	BacktraceException(As&&... as)
		: E(std::forward<As>(as)...)
		, depth(0)
		, formatted(false)
		{
		capture();
	}

	char const* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			auto os = std::ostringstream();
			os << E::what() << "\nBacktrace:\n";
			auto symbols = ::backtrace_symbols(frames, depth);
			for (auto i = 0; i < depth; ++i) {
				os << '#' << i << ' ';
				if (symbols)
					os << symbols[i];
				else
					os << frames[i];
				os << '\n';
			}
			free(symbols);
			message = os.str();
		}
		return message.c_str();
	}
};

#endif /* ENABLE_EXCEPTION_BACKTRACE */

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
