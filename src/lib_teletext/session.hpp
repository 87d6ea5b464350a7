#pragma once

#include "config.hpp"
#include "navigator.hpp"
#include "page_cache.hpp"
#include "lib_utils/clock.hpp"
#include "lib_utils/executor.hpp"
#include <memory>

namespace Teletext {

// A complete viewer core built from a configuration: transport, cache and
// navigation. Page completions are delivered through 'completion', which the
// host drains from its own loop. Sessions are independent of each other.
class Session {
	public:
		// 'transport' replaces the HTTP transport when not null, and must outlive the session
		Session(Config const& cfg, IExecutor& completion, ITransport* transport = nullptr,
		    std::shared_ptr<IClock> clock = g_SystemClock);
		~Session();

		Navigator& navigator() {
			return *m_navigator;
		}

		PageCache& cache() {
			return *m_cache;
		}

		Config const& config() const {
			return m_config;
		}

	private:
		Config const m_config;
		std::unique_ptr<ITransport> m_transport;
		std::unique_ptr<PageParser> m_parser;
		std::unique_ptr<PageLoader> m_loader;
		std::unique_ptr<ExecutorThread> m_background;
		std::unique_ptr<PageCache> m_cache;
		std::unique_ptr<Navigator> m_navigator;
};

}
