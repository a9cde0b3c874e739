#pragma once

#include "backend.hpp"
#include "codec.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "execution.hpp"
#include "initiator.hpp"
#include "protocol.hpp"
#include "reconnect.hpp"
#include "registry.hpp"
#include "responder.hpp"
#include "transport.hpp"
#include "watchdog.hpp"
#include "worker_pool.hpp"
