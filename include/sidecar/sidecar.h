#pragma once
// ═══════════════════════════════════════════════════════════════════
//  sidecar/sidecar.h — Umbrella header for the sidecar supervisor
// ═══════════════════════════════════════════════════════════════════
//
//  #include "sidecar/sidecar.h"
//
//    • ProcessSupervisor: start(), stop(), "start"/"restarting"/"error"
//    • SignalRelay: exit, uncaughtException and signal hooks
//    • StartupChannel, StreamRelay: the child's pipes
//    • console::info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "errors.h"
#include "events.h"
#include "options.h"

#include "child_process.h"
#include "lifecycle.h"
#include "startup_channel.h"
#include "stream_relay.h"
#include "supervisor.h"
