/**
 * netsdr-client
 */

#pragma once

#include "definitions.hpp"

#define NETSDR_CLIENT_VERSION_MAJOR 1
#define NETSDR_CLIENT_VERSION_MINOR 0

#define NETSDR_CLIENT_VERSION STRING(NETSDR_CLIENT_VERSION_MAJOR) "." STRING(NETSDR_CLIENT_VERSION_MINOR)
