#include"Zap/decide.hpp"

namespace Zap {

Step decide( Outcome outcome
	   , bool delivered
	   , std::size_t failed_cycles
	   , std::size_t give_up_cycles
	   ) {
	switch (outcome) {
	case NotAZap:
	case InvalidRequest:
	case AmountMismatch:
		return Advance;
	case Built:
		break;
	}
	if (delivered)
		return Advance;
	if (give_up_cycles != 0 && failed_cycles >= give_up_cycles)
		return GiveUp;
	return Hold;
}

char const* outcome_name(Outcome o) {
	switch (o) {
	case NotAZap: return "not_a_zap";
	case InvalidRequest: return "invalid_request";
	case AmountMismatch: return "amount_mismatch";
	case Built: return "built";
	}
	return "unknown";
}

}
