#undef NDEBUG
#include"Zap/decide.hpp"
#include<assert.h>
#include<string>

int main() {
	using namespace Zap;

	/* Payments that are not deliverable zaps never hold
	 * the cursor.  */
	assert(decide(NotAZap, false, 0, 0) == Advance);
	assert(decide(InvalidRequest, false, 0, 0) == Advance);
	assert(decide(AmountMismatch, false, 0, 0) == Advance);

	assert(decide(Built, true, 0, 0) == Advance);
	assert(decide(Built, true, 9, 3) == Advance);

	/* Undelivered receipts hold, forever by default.  */
	assert(decide(Built, false, 1, 0) == Hold);
	assert(decide(Built, false, 1000, 0) == Hold);

	assert(decide(Built, false, 1, 3) == Hold);
	assert(decide(Built, false, 2, 3) == Hold);
	assert(decide(Built, false, 3, 3) == GiveUp);
	assert(decide(Built, false, 4, 3) == GiveUp);

	assert(std::string(outcome_name(NotAZap)) == "not_a_zap");
	assert(std::string(outcome_name(InvalidRequest)) == "invalid_request");
	assert(std::string(outcome_name(AmountMismatch)) == "amount_mismatch");

	return 0;
}
