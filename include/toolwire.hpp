#pragma once
#include "toolwire/agent/loop.hpp"
#include "toolwire/builtin/report_tools.hpp"
#include "toolwire/client/client.hpp"
#include "toolwire/content.hpp"
#include "toolwire/exceptions.hpp"
#include "toolwire/llm/conversation.hpp"
#include "toolwire/llm/dialect.hpp"
#include "toolwire/protocol/jsonrpc.hpp"
#include "toolwire/protocol/lifecycle.hpp"
#include "toolwire/server/server.hpp"
#include "toolwire/server/stdio_server.hpp"
#include "toolwire/settings.hpp"
#include "toolwire/tools/command.hpp"
#include "toolwire/tools/registry.hpp"
#include "toolwire/tools/source.hpp"
#include "toolwire/tools/tool.hpp"
#include "toolwire/types.hpp"
#include "toolwire/util/log.hpp"
#include "toolwire/version.hpp"
