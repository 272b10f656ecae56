#include "mdns_session/errors.hpp"

#include <fmt/format.h>

namespace mdns_session
{

std::string ToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::EngineUnavailable: return "engine unavailable";
        case ErrorCode::MulticastBlocked: return "multicast blocked";
        case ErrorCode::NameConflict: return "name conflict";
        case ErrorCode::InvalidServiceType: return "invalid service type";
        case ErrorCode::InvalidInstanceName: return "invalid instance name";
        case ErrorCode::InvalidPort: return "invalid port";
        case ErrorCode::InvalidTxtKey: return "invalid TXT key";
        case ErrorCode::EntryTooLong: return "TXT entry too long";
        case ErrorCode::QueueOverflow: return "event queue overflow";
    }
    return "";
}

bool IsEngineUnavailable(ErrorCode code)
{
    return code == ErrorCode::EngineUnavailable || code == ErrorCode::MulticastBlocked;
}

Error::Error(ErrorCode code, std::string context, const std::string& message)
: std::runtime_error(fmt::format("{}: {} ({})", context, message, ToString(code)))
, m_code(code)
, m_context(std::move(context))
{}

}
