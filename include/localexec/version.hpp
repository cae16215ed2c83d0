#ifndef LOCALEXEC_VERSION_HPP
#define LOCALEXEC_VERSION_HPP

#include <string>

namespace localexec
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace localexec

#endif // LOCALEXEC_VERSION_HPP
