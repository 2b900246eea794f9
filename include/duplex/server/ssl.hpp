#pragma once

#include "identity.hpp"

#include <netcore/netcore>

namespace duplex::server {
    auto make_server_ssl(const identity& id) -> netcore::ssl::context;
}
