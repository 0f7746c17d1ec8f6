#include "scan_source.hpp"

ScanUnavailable::ScanUnavailable(const std::string &what):
std::runtime_error(what)
{
}
