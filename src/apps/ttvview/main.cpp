#include "lib_appcommon/line_reader.hpp"
#include "lib_appcommon/options.hpp"
#include "lib_teletext/error.hpp"
#include "lib_teletext/session.hpp"
#include "lib_utils/executor.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/utf8.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>

using namespace Teletext;

const char *g_appName = "ttvview";
const char *g_version = "1.0";

namespace {

struct AppConfig {
	Config core;
	std::string configPath;
	bool noColor = false;
	bool help = false;
};

AppConfig parseCommandLine(int argc, char const* argv[]) {
	AppConfig cfg;
	Config cli; // values given on the command line win over the config file

	CmdLineOptions opt;
	opt.add("c", "config", &cfg.configPath, "JSON configuration file.");
	opt.add("u", "url-template", &cli.urlTemplate, "Page URL, {page} and {subpage} are replaced (default: " + cli.urlTemplate + ").");
	opt.add("t", "timeout", &cli.requestTimeoutMs, "Request timeout in ms (default: 5000).");
	opt.add("r", "retries", &cli.retryCount, "Additional attempts after a network failure (default: 2).");
	opt.add("e", "ttl", &cli.cacheTtlSeconds, "Cached page lifetime in seconds (default: 300).");
	opt.add("m", "max-pages", &cli.maxCachedPages, "Maximum number of cached pages (default: 64).");
	opt.add("R", "rows", &cli.rows, "Grid rows (default: 24).");
	opt.add("C", "cols", &cli.cols, "Grid columns (default: 40).");
	opt.add("s", "start", &cli.startPage, "First page shown (default: 100).");
	opt.add("g", "loglevel", &cli.logLevel, "Log level: quiet, error, warning, info, debug (default: warning).");
	opt.addFlag("n", "no-color", &cfg.noColor, "Plain text output.");
	opt.addFlag("h", "help", &cfg.help, "Print usage and exit.");

	auto args = opt.parse(argc, argv);

	if(cfg.help) {
		printf("Usage: %s [options] [page]\nOptions:\n", g_appName);
		opt.printHelp(std::cout);
		printf("\nCommands: <page>[/<subpage>], b(ack), f(orward), n(ext subpage), p(revious subpage),\n"
		    "          + (next page), - (previous page), r(eload), l <n> (follow link n), q(uit)\n");
		return cfg;
	}

	if(args.size() > 1)
		throw std::runtime_error("invalid command line, use --help");

	if(!cfg.configPath.empty())
		loadConfigFile(cfg.core, cfg.configPath);

	if(opt.wasSet("url-template")) cfg.core.urlTemplate = cli.urlTemplate;
	if(opt.wasSet("timeout")) cfg.core.requestTimeoutMs = cli.requestTimeoutMs;
	if(opt.wasSet("retries")) cfg.core.retryCount = cli.retryCount;
	if(opt.wasSet("ttl")) cfg.core.cacheTtlSeconds = cli.cacheTtlSeconds;
	if(opt.wasSet("max-pages")) cfg.core.maxCachedPages = cli.maxCachedPages;
	if(opt.wasSet("rows")) cfg.core.rows = cli.rows;
	if(opt.wasSet("cols")) cfg.core.cols = cli.cols;
	if(opt.wasSet("start")) cfg.core.startPage = cli.startPage;
	if(opt.wasSet("loglevel")) cfg.core.logLevel = cli.logLevel;

	if(args.size() == 1)
		cfg.core.startPage = parsePageId(args[0]).number();

	validate(cfg.core);
	return cfg;
}

class Renderer {
	public:
		explicit Renderer(bool color) : color(color) {
		}

		void show(ViewState const& view) {
			switch(view.state) {
			case NavState::Idle:
				break;
			case NavState::Loading:
				printf("loading %s...\n", toString(view.target).c_str());
				break;
			case NavState::Displaying:
				drawPage(*view.page, view.stale);
				break;
			case NavState::Failed:
				printf("page %s: %s\n", toString(view.target).c_str(), describe(view.error).c_str());
				break;
			}
			fflush(stdout);
		}

		void listLinks(Page const& page) {
			for(size_t i = 0; i < page.links.size(); ++i) {
				auto const& link = page.links[i];
				auto const label = toUtf8(page.grid.rowText(link.row).substr(link.colStart, link.colEnd - link.colStart));
				printf("  %2d: %-7s %s\n", (int)i, toString(link.target).c_str(), label.c_str());
			}
		}

	private:
		static std::string describe(ErrorInfo const& error) {
			switch(error.kind) {
			case ErrorKind::NotFound: return "no such page";
			case ErrorKind::Timeout: return "the server doesn't answer";
			case ErrorKind::ServerError: return format("server error %s", error.status);
			case ErrorKind::MalformedEncoding:
			case ErrorKind::LayoutOverflow: return "malformed page";
			case ErrorKind::NoContent: return "empty page";
			default: return error.message;
			}
		}

		void drawPage(Page const& page, bool stale) {
			auto header = format("P%s", toString(page.id));
			if(page.subpageCount > 1)
				header += format(" (%s/%s)", page.id.subpage(), page.subpageCount);
			if(!page.title.empty())
				header += "  " + page.title;
			if(stale)
				header += "  [old version]";
			printf("\n%s\n", header.c_str());

			for(int row = 0; row < page.grid.rows(); ++row) {
				std::string line;
				Cell previous;
				bool first = true;
				for(int col = 0; col < page.grid.cols(); ++col) {
					auto const& cell = page.grid.at(row, col);
					if(color && (first || !sameStyle(cell, previous)))
						line += escape(cell);
					appendUtf8(line, cell.character);
					previous = cell;
					first = false;
				}
				if(color)
					line += "\x1b[0m";
				printf("%s\n", line.c_str());
			}
		}

		static bool sameStyle(Cell const& a, Cell const& b) {
			return a.foreground == b.foreground && a.background == b.background && a.flags == b.flags;
		}

		// the palette has the ANSI color order
		static std::string escape(Cell const& cell) {
			auto r = format("\x1b[0;%s;%s", 30 + (int)cell.foreground, 40 + (int)cell.background);
			if(hasFlag(cell.flags, CellFlags::Bold))
				r += ";1";
			if(hasFlag(cell.flags, CellFlags::Blink))
				r += ";5";
			return r + "m";
		}

		bool const color;
};

std::atomic<bool> g_stop(false);

void runCommand(std::string const& cmd, Session& session, Renderer& renderer) {
	auto& nav = session.navigator();
	auto report = [&](Nav result) {
		if(result == Nav::NoHistory)
			printf("nothing there\n");
		else if(result == Nav::Unchanged)
			renderer.show(nav.view());
	};

	if(cmd.empty())
		return;
	if(cmd == "q") {
		g_stop = true;
	} else if(cmd == "b") {
		report(nav.back());
	} else if(cmd == "f") {
		report(nav.forward());
	} else if(cmd == "n") {
		report(nav.nextSubpage());
	} else if(cmd == "p") {
		report(nav.prevSubpage());
	} else if(cmd == "+") {
		report(nav.nextPage());
	} else if(cmd == "-") {
		report(nav.prevPage());
	} else if(cmd == "r") {
		report(nav.reload());
	} else if(cmd == "l") {
		if(nav.view().page)
			renderer.listLinks(*nav.view().page);
	} else if(cmd.compare(0, 2, "l ") == 0) {
		auto const page = nav.view().page;
		auto const index = atoi(cmd.c_str() + 2);
		if(!page || index < 0 || index >= (int)page->links.size())
			printf("no such link\n");
		else
			report(nav.follow(page->links[index]));
	} else {
		try {
			report(nav.goTo(parsePageId(cmd)));
		} catch(Teletext::Error const& e) {
			printf("%s\n", e.what());
		}
	}
}

}

void safeMain(int argc, const char* argv[]) {
	auto const cfg = parseCommandLine(argc, argv);
	if(cfg.help)
		return;

	setGlobalLogLevel(parseLogLevel(cfg.core.logLevel.c_str()));

	ExecutorQueue completion;
	Session session(cfg.core, completion);
	Renderer renderer(!cfg.noColor);
	session.navigator().setListener([&](ViewState const& view) {
		renderer.show(view);
	});

	// stdin blocks: it can't be polled from the main loop
	auto commands = startLineReader(std::cin, "q");

	session.navigator().goTo(PageId(cfg.core.startPage));

	while(!g_stop) {
		completion.runFor(std::chrono::milliseconds(50));
		std::string cmd;
		while(!g_stop && commands->lines.tryPop(cmd))
			runCommand(cmd, session, renderer);
	}
	commands->stop = true;
}

void safeStop() {
	g_stop = true;
}
