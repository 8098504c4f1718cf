#include"Net/Fd.hpp"
#include"Zap/Mod/CommandReceiver.hpp"
#include"Zap/Mod/Initiator.hpp"
#include"Zap/Mod/JsonOutputter.hpp"
#include"Zap/Mod/Manifester.hpp"
#include"Zap/Mod/PaymentWatcher.hpp"
#include"Zap/Mod/SettingsHandler.hpp"
#include"Zap/Mod/ShutdownHandler.hpp"
#include"Zap/Mod/StatusCommand.hpp"
#include"Zap/Mod/Waiter.hpp"
#include"Zap/Mod/ZapLedger.hpp"
#include"Zap/Mod/all.hpp"
#include<utility>
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(std::forward<As>(as)...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Zap { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , std::function< Net::Fd( std::string const&
						 , std::string const&
						 )
					> open_rpc_socket
			 ) {
	auto all = std::make_shared<All>();

	/* Plumbing.  */
	auto waiter = all->install<Waiter>(bus);
	all->install<JsonOutputter>(cout, bus);
	all->install<CommandReceiver>(bus);
	all->install<Manifester>(bus);
	all->install<Initiator>(bus, threadpool, std::move(open_rpc_socket));
	all->install<ShutdownHandler>(bus);
	all->install<StatusCommand>(bus);

	/* Zaps.  */
	all->install<SettingsHandler>(bus);
	all->install<PaymentWatcher>(bus, threadpool, *waiter);
	all->install<ZapLedger>(bus);

	return all;
}

}}
