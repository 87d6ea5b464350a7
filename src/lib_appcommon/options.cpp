#include "options.hpp"
#include <iostream>
#include <sstream>

std::vector<std::string> CmdLineOptions::parse(int argc, const char* argv[]) {

	std::vector<std::string> remaining;

	for(auto& o : m_Options)
		o->seen = false;

	ArgQueue args;
	for(int i = 1; i < argc; ++i) // skip argv[0]
		args.push(argv[i]);

	while(!args.empty()) {
		auto word = args.front();
		args.pop();

		if(word.substr(0, 1) != "-") {
			remaining.push_back(word);
			continue;
		}

		AbstractOption* opt = nullptr;

		for(auto& o : m_Options) {
			if(word == o->shortName || word == o->longName) {
				opt = o.get();
				break;
			}
		}

		if(!opt)
			throw std::runtime_error("unknown option: \"" + word + "\"");

		opt->parse(args);
		opt->seen = true;
	}

	return remaining;
}

void CmdLineOptions::printHelp(std::ostream& out) {
	for(auto& o : m_Options) {
		auto s = o->shortName + ", " + o->longName;
		while(s.size()< 40)
			s += " ";
		out << "    " << s << o->desc << std::endl;
	}
}

bool CmdLineOptions::wasSet(std::string const& longName) const {
	for(auto& o : m_Options)
		if(o->longName == "--" + longName)
			return o->seen;
	return false;
}

template<typename T>
static void parseNumber(T& var, ArgQueue& args) {
	auto const word = safePop(args);
	std::stringstream ss(word);
	ss >> var;
	if(ss.fail() || !ss.eof())
		throw std::runtime_error("invalid number: \"" + word + "\"");
}

void parseValue(double& var, ArgQueue& args) {
	parseNumber(var, args);
}

void parseValue(int& var, ArgQueue& args) {
	parseNumber(var, args);
}
