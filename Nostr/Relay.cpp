#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Nostr/Event.hpp"
#include"Nostr/Relay.hpp"
#include"Util/make_unique.hpp"
#include<chrono>
#include<curl/curl.h>
#include<errno.h>
#include<poll.h>
#include<vector>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace {

typedef std::chrono::steady_clock Clock;

Nostr::PublishResult transient(std::string msg) {
	return Nostr::PublishResult{Nostr::PublishResult::Transient, std::move(msg)};
}

/* One WebSocket session to one relay.  */
class WsSession {
private:
	CURL* curl;
	std::vector<char> errbuf;
	Clock::time_point deadline;

	int remaining_ms() const {
		auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
			deadline - Clock::now()
		).count();
		return left < 0 ? 0 : int(left);
	}

	std::string curl_error(CURLcode ret) const {
		auto msg = std::string(curl_easy_strerror(ret));
		if (errbuf[0] != 0)
			msg += std::string(": ") + &errbuf[0];
		return msg;
	}

	/* Return false on timeout.  */
	bool wait_socket(short events) {
		auto sock = curl_socket_t();
		if (curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK)
			return false;
		auto pfd = pollfd();
		pfd.fd = sock;
		pfd.events = events;
		auto res = int();
		do {
			res = poll(&pfd, 1, remaining_ms());
		} while (res < 0 && errno == EINTR);
		return res > 0;
	}

public:
	explicit
	WsSession(double timeout)
		: curl(curl_easy_init())
		, errbuf(CURL_ERROR_SIZE, 0)
		, deadline( Clock::now()
			  + std::chrono::milliseconds(long(timeout * 1000))
			  ) { }
	~WsSession() {
		if (curl)
			curl_easy_cleanup(curl);
	}
	WsSession(WsSession const&) =delete;

	/* Return empty string on success, else an error message.  */
	std::string connect(std::string const& url) {
		if (!curl)
			return "curl_easy_init failed";
		curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
		/* WebSocket mode: perform only does the upgrade.  */
		curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, long(remaining_ms()));
		curl_easy_setopt( curl, CURLOPT_USERAGENT
				, "clzap/" PACKAGE_VERSION
				);
		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK)
			return curl_error(ret);
		return "";
	}

	std::string send_text(std::string const& text) {
		auto offset = std::size_t(0);
		while (offset < text.size()) {
			auto sent = std::size_t(0);
			auto ret = curl_ws_send( curl
					       , text.data() + offset
					       , text.size() - offset
					       , &sent
					       , 0
					       , CURLWS_TEXT
					       );
			if (ret == CURLE_AGAIN) {
				if (!wait_socket(POLLOUT))
					return "timed out sending";
				continue;
			}
			if (ret != CURLE_OK)
				return curl_error(ret);
			offset += sent;
		}
		return "";
	}

	/* Receive one complete text message into `msg`.
	 * Return empty string on success, else an error.  */
	std::string recv_text(std::string& msg) {
		msg.clear();
		char buf[4096];
		for (;;) {
			auto rlen = std::size_t(0);
			auto meta = (curl_ws_frame*) nullptr;
			auto ret = curl_ws_recv(curl, buf, sizeof(buf), &rlen, &meta);
			if (ret == CURLE_AGAIN) {
				if (!wait_socket(POLLIN))
					return "timed out waiting for OK";
				continue;
			}
			if (ret != CURLE_OK)
				return curl_error(ret);
			if (meta->flags & CURLWS_CLOSE)
				return "relay closed connection";
			if (!(meta->flags & (CURLWS_TEXT | CURLWS_CONT)))
				/* ping, pong or binary: not for us.  */
				continue;
			msg.append(buf, rlen);
			if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT))
				return "";
		}
	}
};

}

namespace Nostr {

bool Relay::interpret_reply( std::string const& frame
			   , std::string const& id
			   , PublishResult& result
			   ) {
	auto js = Jsmn::Object();
	try {
		js = Jsmn::Object::parse_json(frame);
	} catch (Jsmn::ParseError const&) {
		return false;
	}
	if (!js.is_array() || js.size() < 3)
		return false;
	if (!js[0].is_string() || std::string(js[0]) != "OK")
		return false;
	if (!js[1].is_string() || std::string(js[1]) != id)
		return false;
	if (!js[2].is_boolean())
		return false;

	auto message = std::string();
	if (js.size() >= 4 && js[3].is_string())
		message = std::string(js[3]);

	if (bool(js[2])) {
		result = PublishResult{PublishResult::Accepted, message};
		return true;
	}
	/* Machine-readable prefixes; these may clear up.  */
	if ( message.compare(0, 13, "rate-limited:") == 0
	  || message.compare(0, 6, "error:") == 0
	   )
		result = PublishResult{PublishResult::Transient, message};
	else
		result = PublishResult{PublishResult::Rejected, message};
	return true;
}

class Relay::Impl {
private:
	Ev::ThreadPool& threadpool;
	double timeout;
	bool wait_ok;

	PublishResult publish_blocking( std::string const& url
				      , std::string const& id
				      , std::string const& frame
				      ) const {
		auto session = WsSession(timeout);
		auto err = session.connect(url);
		if (err != "")
			return transient("connect: " + err);
		err = session.send_text(frame);
		if (err != "")
			return transient("send: " + err);
		if (!wait_ok)
			return PublishResult{PublishResult::Accepted, "sent"};

		auto notice = std::string();
		for (;;) {
			auto msg = std::string();
			err = session.recv_text(msg);
			if (err != "") {
				if (notice != "")
					err += " (NOTICE " + notice + ")";
				return transient(err);
			}
			auto result = PublishResult();
			if (interpret_reply(msg, id, result))
				return result;
			/* Keep the last NOTICE for diagnostics.  */
			try {
				auto js = Jsmn::Object::parse_json(msg);
				if ( js.is_array() && js.size() >= 2
				  && js[0].is_string()
				  && std::string(js[0]) == "NOTICE"
				  && js[1].is_string()
				   )
					notice = std::string(js[1]);
			} catch (Jsmn::ParseError const&) {
				/* Not JSON, nothing to keep.  */
			}
		}
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , double timeout_
	    , bool wait_ok_
	    ) : threadpool(threadpool_)
	      , timeout(timeout_)
	      , wait_ok(wait_ok_)
	      { }

	Ev::Io<PublishResult> publish( std::string const& url
				     , Nostr::Event const& event
				     ) {
		auto frame = "[\"EVENT\"," + event.to_json() + "]";
		auto id = event.id;
		return threadpool.background<PublishResult>([ this
							    , url
							    , id
							    , frame
							    ]() {
			return publish_blocking(url, id, frame);
		});
	}
};

Relay::Relay( Ev::ThreadPool& threadpool
	    , double timeout
	    , bool wait_ok
	    ) : pimpl(Util::make_unique<Impl>(threadpool, timeout, wait_ok))
	      { }
Relay::Relay(Relay&&) =default;
Relay::~Relay() =default;

Ev::Io<PublishResult>
Relay::publish(std::string const& url, Nostr::Event const& event) {
	return pimpl->publish(url, event);
}

}
