#pragma once

#include <stdexcept>
#include <string>

namespace mdns_session
{

enum class ErrorCode
{
    EngineUnavailable,   // socket open/bind failed or the worker could not start
    MulticastBlocked,    // sockets bound but the mDNS group could not be joined
    NameConflict,
    InvalidServiceType,
    InvalidInstanceName,
    InvalidPort,
    InvalidTxtKey,
    EntryTooLong,
    QueueOverflow
};
std::string ToString(ErrorCode code);

// Both kinds mean the engine could not get at the network.
[[nodiscard]] bool IsEngineUnavailable(ErrorCode code);

class Error : public std::runtime_error
{
public:
    // context names the failing call and its subject, e.g. "StartBrowse(_mygame._tcp.local.)"
    Error(ErrorCode code, std::string context, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    std::string m_context;
};

}
