#ifndef TIZENCTL_ENCODING_HPP
#define TIZENCTL_ENCODING_HPP

#include <string>

namespace util {

std::string base64Encode(const std::string& input);

std::string toUpper(std::string value);

std::string trim(const std::string& value);

}

#endif
