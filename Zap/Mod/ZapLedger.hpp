#ifndef ZAP_MOD_ZAPLEDGER_HPP
#define ZAP_MOD_ZAPLEDGER_HPP

#include<memory>

namespace S { class Bus; }

namespace Zap { namespace Mod {

/** class Zap::Mod::ZapLedger
 *
 * @brief records every handled payment in the
 * database and reports the most recent ones as the
 * `recent` field of `clzap-status`.
 *
 * @desc Database errors are logged and otherwise
 * ignored; the cursor file, not the ledger, decides
 * what has been handled.
 */
class ZapLedger {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	ZapLedger() =delete;
	explicit
	ZapLedger(S::Bus& bus);
	ZapLedger(ZapLedger&&);
	~ZapLedger();
};

}}

#endif /* !defined(ZAP_MOD_ZAPLEDGER_HPP) */
