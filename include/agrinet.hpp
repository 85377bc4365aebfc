#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "agrinet/core/bus_config.hpp"
#include "agrinet/core/constants.hpp"
#include "agrinet/core/error.hpp"
#include "agrinet/core/frame.hpp"
#include "agrinet/core/identifier.hpp"
#include "agrinet/core/message.hpp"
#include "agrinet/core/types.hpp"
#include "agrinet/pgn_defs.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "agrinet/util/crc.hpp"
#include "agrinet/util/event.hpp"
#include "agrinet/util/state_machine.hpp"
#include "agrinet/util/timer.hpp"

// ─── Network ─────────────────────────────────────────────────────────────────
#include "agrinet/network/bus.hpp"
#include "agrinet/network/bus_load.hpp"
#include "agrinet/network/can_bridge.hpp"
#include "agrinet/network/filter.hpp"
#include "agrinet/network/node.hpp"

// ─── Addressing ──────────────────────────────────────────────────────────────
#include "agrinet/addressing/registry.hpp"

// ─── Application protocol ────────────────────────────────────────────────────
#include "agrinet/app/device_registry.hpp"
#include "agrinet/app/engine.hpp"
#include "agrinet/app/implement.hpp"
#include "agrinet/app/operator_router.hpp"
#include "agrinet/app/process_data.hpp"
#include "agrinet/app/protocol.hpp"
#include "agrinet/app/task.hpp"

// ─── Domain ──────────────────────────────────────────────────────────────────
#include "agrinet/domain/sensor_channels.hpp"
