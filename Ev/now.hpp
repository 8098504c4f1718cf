#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/* Seconds since the epoch, as of the latest event loop
 * iteration.  Receipt timestamps and ledger times come
 * from here.  */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
