#pragma once

/// Umbrella header for the mcpguard proxy library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "line_framer.hpp"
#include "message.hpp"
#include "codec.hpp"
#include "server_identity.hpp"
#include "trust_store.hpp"
#include "audit_log.hpp"
#include "decision_channel.hpp"
#include "guard_rails.hpp"
#include "policy_engine.hpp"
#include "secret_store.hpp"
#include "environment.hpp"
#include "config.hpp"
#include "message_log.hpp"
#include "child_process.hpp"
#include "stdio_proxy.hpp"
#include "http_proxy.hpp"
#include "runtime.hpp"
