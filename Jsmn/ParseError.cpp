#include"Jsmn/ParseError.hpp"

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, unsigned int i) {
	if (i >= input.size())
		return "Parse error at end of input";
	/* Show a little of the context after the error point.  */
	auto context = input.substr(i, 16);
	return std::string("Parse error near '") + context
	     + std::string("'")
	     ;
}

}
