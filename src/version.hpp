#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

std::string get_version_str();

#endif
