#include "transport.hpp"
#include "error.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include <cstdio>
#include <map>

extern "C" {
#include <curl/curl.h>
}

namespace Teletext {

std::string expandUrl(std::string const& urlTemplate, PageId id) {
	char page[8], subpage[8];
	snprintf(page, sizeof page, "%03d", id.number());
	snprintf(subpage, sizeof subpage, "%04d", id.subpage());
	std::map<std::string, std::string> const values {
		{ "page", page },
		{ "subpage", subpage },
	};

	size_t i = 0;
	auto empty = [&]() {
		return i >= urlTemplate.size();
	};
	auto pop = [&]() {
		return urlTemplate[i++];
	};

	auto parseVarName = [&]() {
		pop(); // '{'
		std::string name;
		while(!empty() && urlTemplate[i] != '}')
			name += pop();
		if(empty())
			throw std::runtime_error("unexpected end of URL template when parsing variable name");
		pop(); // '}'
		return name;
	};

	std::string r;
	while(!empty()) {
		if(urlTemplate[i] == '{') {
			auto const name = parseVarName();
			auto value = values.find(name);
			if(value == values.end())
				throw std::runtime_error("unknown URL template variable '" + name + "'");
			r += value->second;
		} else {
			r += pop();
		}
	}
	return r;
}

namespace {

struct CurlScope {
	CurlScope() {
		curl_global_init(CURL_GLOBAL_ALL);
	}
	~CurlScope() {
		curl_global_cleanup();
	}
};

struct HttpTransport : ITransport {
	HttpTransport(TransportConfig const& cfg) : cfg(cfg) {
		expandUrl(cfg.urlTemplate, PageId()); // reject broken templates early
	}

	std::string fetch(PageId id) override {
		auto const url = expandUrl(cfg.urlTemplate, id);

		// one handle per request: fetches of different pages run concurrently
		auto curl = std::shared_ptr<CURL>(curl_easy_init(), &curl_easy_cleanup);
		if(!curl)
			throw Error(ErrorKind::Network, "can't init curl");

		struct HttpContext {
			std::string body;

			static size_t curlCallback(void *stream, size_t size, size_t nmemb, void *ptr) {
				auto pThis = (HttpContext*)ptr;
				auto const bytes = size * nmemb;
				pThis->body.append((const char*)stream, bytes);
				return bytes;
			}
		};

		HttpContext ctx;

		curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, cfg.userAgent.c_str());
		curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)cfg.requestTimeoutMs);
		curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, (long)cfg.requestTimeoutMs);
		curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // we run on worker threads
		curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, ""); // any encoding curl supports
		curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &HttpContext::curlCallback);
		curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

		logMsg(Debug, "HttpTransport", "GET %s", url);

		auto const res = curl_easy_perform(curl.get());
		switch(res) {
		case CURLE_OK:
			break;
		case CURLE_OPERATION_TIMEDOUT:
			throw Error(ErrorKind::Timeout, format("%s: no answer within %sms", url, cfg.requestTimeoutMs));
		case CURLE_FILE_COULDNT_READ_FILE:
			throw Error(ErrorKind::NotFound, format("%s: %s", url, curl_easy_strerror(res)));
		case CURLE_WEIRD_SERVER_REPLY:
		case CURLE_BAD_CONTENT_ENCODING:
			throw Error(ErrorKind::MalformedEncoding, format("%s: %s", url, curl_easy_strerror(res)));
		default:
			throw Error(ErrorKind::Network, format("%s: %s", url, curl_easy_strerror(res)));
		}

		long status = 0;
		curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

		// status stays 0 for non-HTTP schemes
		if(status == 404)
			throw Error(ErrorKind::NotFound, format("%s: page doesn't exist", url));
		if(status != 0 && (status < 200 || status >= 300))
			throw Error(ErrorKind::ServerError, format("%s: HTTP status %s", url, status), (int)status);

		logMsg(Debug, "HttpTransport", "%s: %s bytes", url, ctx.body.size());
		return std::move(ctx.body);
	}

	TransportConfig const cfg;
};

struct RetryTransport : ITransport {
	RetryTransport(ITransport* source, std::unique_ptr<ITransport> owned, int retryCount)
		: source(source), owned(std::move(owned)), retryCount(retryCount) {
	}

	std::string fetch(PageId id) override {
		for(int attempt = 0;; ++attempt) {
			try {
				return source->fetch(id);
			} catch(Error const& e) {
				if(!e.isTransient() || attempt >= retryCount)
					throw;
				logMsg(Warning, "Transport", "page %s, attempt %s/%s failed: %s", toString(id), attempt + 1, retryCount + 1, e.what());
			}
		}
	}

	ITransport* const source;
	std::unique_ptr<ITransport> const owned;
	int const retryCount;
};

}

std::unique_ptr<ITransport> createHttpTransport(TransportConfig const& cfg) {
	static CurlScope curlScope;
	return std::make_unique<HttpTransport>(cfg);
}

std::unique_ptr<ITransport> createTransport(TransportConfig const& cfg) {
	if(cfg.retryCount < 0)
		throw std::runtime_error(format("invalid retry count %s", cfg.retryCount));

	std::unique_ptr<ITransport> owned;
	auto source = cfg.source;
	if(!source) {
		owned = createHttpTransport(cfg);
		source = owned.get();
	}
	return std::make_unique<RetryTransport>(source, std::move(owned), cfg.retryCount);
}

}
