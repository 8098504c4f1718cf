#ifndef ZAP_DECIDE_HPP
#define ZAP_DECIDE_HPP

#include<cstddef>

namespace Zap {

/* How one payment came out of the pipeline.  */
enum Outcome {
	NotAZap,
	InvalidRequest,
	AmountMismatch,
	Built
};

/* What the watcher does with the cursor next.  */
enum Step {
	/* Persist the payment index and go on.  */
	Advance,
	/* Keep the cursor; retry the payment next cycle.  */
	Hold,
	/* Like Advance, but the receipt was never
	 * delivered.  */
	GiveUp
};

/** Zap::decide
 *
 * @brief the advance-or-hold rule.
 *
 * @desc `delivered` only matters for Built, where it
 * says whether the publish policy was met; a signing
 * failure is a Built outcome that was not delivered.
 * `failed_cycles` counts undelivered cycles for this
 * payment, including the current one.  `give_up_cycles`
 * of 0 never gives up.
 */
Step decide( Outcome outcome
	   , bool delivered
	   , std::size_t failed_cycles
	   , std::size_t give_up_cycles
	   );

char const* outcome_name(Outcome);

}

#endif /* !defined(ZAP_DECIDE_HPP) */
