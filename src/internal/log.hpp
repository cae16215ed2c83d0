#ifndef LOCALEXEC_INTERNAL_LOG_HPP
#define LOCALEXEC_INTERNAL_LOG_HPP

#include <iostream>
#include <localexec/types.hpp>
#include <optional>
#include <string>

namespace localexec::internal
{

// Routes a diagnostic to the configured callback; warnings fall back to std::cerr
inline void log_message(const std::optional<LogCallback>& callback, LogLevel level,
                        const std::string& message)
{
    if (callback.has_value())
    {
        (*callback)(level, message);
        return;
    }
    if (level == LogLevel::Warning)
        std::cerr << "Warning: " << message << std::endl;
}

} // namespace localexec::internal

#endif // LOCALEXEC_INTERNAL_LOG_HPP
