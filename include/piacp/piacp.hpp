#pragma once

// Core types
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/time.hpp"
#include "core/types.hpp"
#include "core/uuid.hpp"
#include "core/version.hpp"

// pi session files
#include "session/session_directory.hpp"
#include "session/session_record.hpp"

// pi subprocess
#include "pi/pi_process.hpp"
#include "pi/rpc_process.hpp"

// ACP
#include "acp/bridge.hpp"
#include "acp/connection.hpp"
#include "acp/jsonrpc.hpp"
#include "acp/protocol.hpp"

// Transport
#include "net/connection_registry.hpp"
#include "net/message_channel.hpp"
#include "net/ws_frame.hpp"
#include "net/ws_server.hpp"
