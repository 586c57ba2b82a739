// Copyright 2024 PerFlow Authors
// Licensed under the Apache License, Version 2.0

#ifndef PERFSCOPE_PERFSCOPE_H_
#define PERFSCOPE_PERFSCOPE_H_

// All public APIs of perfscope

#include "common/config.h"
#include "common/log.h"
#include "sampling/event_catalog.h"
#include "sampling/event_descriptor.h"
#include "sampling/event_parser.h"
#include "sampling/perf_backend.h"
#include "sampling/ring_buffer.h"
#include "sampling/rotation_schedule.h"
#include "sampling/sample_decoder.h"
#include "sampling/session.h"
#include "analysis/aggregator.h"
#include "analysis/process_maps.h"
#include "analysis/profile.h"
#include "analysis/profiler.h"
#include "analysis/stack_unwinder.h"
#include "analysis/symbol_resolver.h"

#endif  // PERFSCOPE_PERFSCOPE_H_
