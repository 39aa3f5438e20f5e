#pragma once

#define PIACP_VERSION_MAJOR 0
#define PIACP_VERSION_MINOR 3
#define PIACP_VERSION_PATCH 0
#define PIACP_VERSION_STRING "0.3.0"

// ACP protocol version advertised in the initialize response
#define PIACP_PROTOCOL_VERSION 1
