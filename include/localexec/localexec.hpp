#ifndef LOCALEXEC_HPP
#define LOCALEXEC_HPP

// Main header that includes everything

#include <localexec/connection.hpp>
#include <localexec/encoding.hpp>
#include <localexec/errors.hpp>
#include <localexec/runner.hpp>
#include <localexec/types.hpp>
#include <localexec/version.hpp>

#endif // LOCALEXEC_HPP
