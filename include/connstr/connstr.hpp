#pragma once

/**
 * @file
 * @brief Umbrella include for the complete connstr public API.
 */

#include "connstr/core/error.hpp"
#include "connstr/core/result.hpp"
#include "connstr/endpoint/endpoint.hpp"
#include "connstr/endpoint/format.hpp"
#include "connstr/endpoint/host_addr.hpp"
#include "connstr/endpoint/parse.hpp"
#include "connstr/endpoint/resolve.hpp"
#include "connstr/endpoint/scheme.hpp"
#include "connstr/ip/address.hpp"
#include "connstr/ip/socket_address.hpp"
