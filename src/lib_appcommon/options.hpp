#pragma once

#include <memory>
#include <ostream>
#include <queue>
#include <stdexcept>
#include <string>
#include <vector>

typedef std::queue<std::string> ArgQueue;

static inline std::string safePop(ArgQueue& args) {
	if(args.empty())
		throw std::runtime_error("unexpected end of command line");
	auto val = args.front();
	args.pop();
	return val;
}

// numeric values must be complete, "12abc" is rejected
void parseValue(double& var, ArgQueue& args);
void parseValue(int& var, ArgQueue& args);

static inline void parseValue(bool& var, ArgQueue&) {
	var = true;
}

static inline void parseValue(std::string& var, ArgQueue& args) {
	var = safePop(args);
}

static inline void parseValue(std::vector<std::string>& var, ArgQueue& args) {
	var.clear();
	while(!args.empty() && args.front()[0] != '-') {
		var.push_back(safePop(args));
	}
}

// repeatable option, each occurrence appends one value
static inline void parseValue(std::vector<int>& var, ArgQueue& args) {
	int val = 0;
	parseValue(val, args);
	var.push_back(val);
}

struct CmdLineOptions {
		void addFlag(std::string shortName, std::string longName, bool* pVar, std::string desc="") {
			add(shortName, longName, pVar, desc);
		}

		template<typename T>
		void add(std::string shortName, std::string longName, T* pVar, std::string desc="") {
			auto opt = std::make_unique<TypedOption<T>>();
			opt->pVar = pVar;
			opt->shortName = "-" + shortName;
			opt->longName = "--" + longName;
			opt->desc = desc;
			m_Options.push_back(std::move(opt));
		}

		// returns the non-option words, throws on unknown options
		std::vector<std::string> parse(int argc, const char* argv[]);
		void printHelp(std::ostream& out);

		// names of the options seen by the last parse(), long form
		bool wasSet(std::string const& longName) const;

	private:
		struct AbstractOption {
			virtual ~AbstractOption() = default;
			std::string shortName, longName;
			std::string desc;
			bool seen = false;
			virtual void parse(ArgQueue& args) = 0;
		};

		std::vector<std::unique_ptr<AbstractOption>> m_Options;

		template<typename T>
		struct TypedOption : AbstractOption {
			T* pVar;
			void parse(ArgQueue& args) {
				parseValue(*pVar, args);
			}
		};
};
