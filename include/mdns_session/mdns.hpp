#pragma once

#include "mdns_session/errors.hpp"
#include "mdns_session/log.hpp"
#include "mdns_session/mdns_engine.hpp"
#include "mdns_session/service.hpp"
#include "mdns_session/session_registry.hpp"
#include "mdns_session/txt_codec.hpp"
