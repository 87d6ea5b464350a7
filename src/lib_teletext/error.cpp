#include "error.hpp"

namespace Teletext {

const char* toString(ErrorKind kind) {
	switch(kind) {
	case ErrorKind::InvalidPage: return "InvalidPage";
	case ErrorKind::Network: return "Network";
	case ErrorKind::Timeout: return "Timeout";
	case ErrorKind::NotFound: return "NotFound";
	case ErrorKind::ServerError: return "ServerError";
	case ErrorKind::MalformedEncoding: return "MalformedEncoding";
	case ErrorKind::LayoutOverflow: return "LayoutOverflow";
	case ErrorKind::NoContent: return "NoContent";
	}
	return "Unknown";
}

static std::string describe(ErrorKind kind, std::string const& msg, int status) {
	std::string r = "[";
	r += toString(kind);
	if(kind == ErrorKind::ServerError)
		r += "(" + std::to_string(status) + ")";
	r += "] " + msg;
	return r;
}

Error::Error(ErrorKind kind, std::string const& msg, int status)
	: std::runtime_error(describe(kind, msg, status)), m_kind(kind), m_status(status) {
}

ErrorInfo Error::info() const {
	ErrorInfo r;
	r.kind = m_kind;
	r.status = m_status;
	r.message = what();
	return r;
}

}
