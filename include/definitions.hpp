/**
 * netsdr-client
 */

#pragma once

#define STRING_IMPL(x) #x
#define STRING(x) STRING_IMPL(x)
