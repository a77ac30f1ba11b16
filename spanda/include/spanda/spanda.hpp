#pragma once
// Spanda: the pulse engine
//
// An internal-state simulation that sits between input and a language model:
// - Types: timestamps, bounds, awareness reasons
// - Config: validated engine and driver parameters
// - Engine: rhythm, attention, echo, drift, acts of awareness
// - Core: one engine behind one lock
// - LifeLoop: periodic autonomous ticks
// - InputChannel: attended ticks on demand, with pluggable SignalMappers
// - SnapshotLog: JSONL record of snapshots
// - LineReader: newline-framed stimuli from a descriptor

#include "version.hpp"
#include "types.hpp"
#include "config.hpp"
#include "random.hpp"
#include "snapshot.hpp"
#include "engine.hpp"
#include "core.hpp"
#include "signal_mapper.hpp"
#include "life_loop.hpp"
#include "input_channel.hpp"
#include "snapshot_log.hpp"
#include "line_reader.hpp"
