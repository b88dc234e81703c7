#pragma once

#include <stdexcept>
#include <string>

namespace mdns_client
{

// Thrown by the Client constructor when interfaces or sockets cannot be set up
class SetupError : public std::runtime_error
{
public:
    SetupError(const std::string& what, int error_code = 0)
    : std::runtime_error(what)
    , m_errorCode(error_code)
    {}

    // errno value of the failing system call, 0 if there was none
    [[nodiscard]] int ErrorCode() const noexcept { return m_errorCode; }

private:
    int m_errorCode;
};

}
