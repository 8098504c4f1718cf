#include"Ev/ThreadPool.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<condition_variable>
#include<errno.h>
#include<ev.h>
#include<fcntl.h>
#include<mutex>
#include<queue>
#include<signal.h>
#include<stdexcept>
#include<string.h>
#include<thread>
#include<unistd.h>
#include<vector>

namespace {

/* Blocks all signals in the current thread while alive,
 * so threads spawned meanwhile inherit a full mask and
 * signals are only ever delivered to the main thread.
 */
class SigBlocker {
private:
	sigset_t old_set;
public:
	SigBlocker(SigBlocker const&) =delete;
	SigBlocker() {
		sigset_t all;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &old_set);
	}
	~SigBlocker() {
		pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
	}
};

}

namespace Ev {

class ThreadPool::Impl {
private:
	typedef std::function<std::function<void()>()> Work;

	/* Main thread only.  */
	std::vector<std::thread> threads;
	std::size_t in_flight;
	ev_io waker;
	bool waker_active;
	int pipe_read;
	int pipe_write;

	/* Shared; hold mtx.  */
	std::mutex mtx;
	std::condition_variable cnd;
	bool stopping;
	std::queue<Work> work_queue;
	std::queue<std::function<void()>> done_queue;

	void worker() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			cnd.wait(lock, [this]() {
				return stopping || !work_queue.empty();
			});
			if (stopping)
				return;
			auto work = std::move(work_queue.front());
			work_queue.pop();
			lock.unlock();

			auto done = work();
			work = nullptr;

			lock.lock();
			done_queue.emplace(std::move(done));
			auto c = char(1);
			while (write(pipe_write, &c, 1) < 0 && errno == EINTR)
				;
		}
	}

	void on_wake() {
		char buf[64];
		while (read(pipe_read, buf, sizeof(buf)) > 0)
			;

		auto ready = std::queue<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			std::swap(ready, done_queue);
		}
		in_flight -= ready.size();
		if (in_flight == 0 && waker_active) {
			/* An idle pool must not keep the loop alive.  */
			ev_io_stop(EV_DEFAULT_ &waker);
			waker_active = false;
		}
		while (!ready.empty()) {
			auto done = std::move(ready.front());
			ready.pop();
			done();
		}
	}

	static
	void on_wake_static(EV_P_ ev_io* w, int) {
		((Impl*) w->data)->on_wake();
	}

public:
	explicit
	Impl(std::size_t num_threads)
		: in_flight(0)
		, waker_active(false)
		, stopping(false)
		{
		int fds[2];
		if (pipe(fds) < 0)
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Ev::ThreadPool: pipe: ") +
				strerror(errno)
			);
		pipe_read = fds[0];
		pipe_write = fds[1];
		fcntl(pipe_read, F_SETFL, fcntl(pipe_read, F_GETFL) | O_NONBLOCK);

		ev_io_init(&waker, &on_wake_static, pipe_read, EV_READ);
		waker.data = this;

		SigBlocker blocker;
		for (auto i = std::size_t(0); i < num_threads; ++i)
			threads.emplace_back([this]() { worker(); });
	}

	void add(Work work) {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			work_queue.emplace(std::move(work));
		}
		cnd.notify_one();
		++in_flight;
		if (!waker_active) {
			ev_io_start(EV_DEFAULT_ &waker);
			waker_active = true;
		}
	}

	~Impl() {
		if (waker_active)
			ev_io_stop(EV_DEFAULT_ &waker);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		cnd.notify_all();
		for (auto& t : threads)
			t.join();
		close(pipe_read);
		close(pipe_write);
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(Util::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() { }

void ThreadPool::add(std::function<std::function<void()>()> work) {
	pimpl->add(std::move(work));
}

}
