#pragma once

// Primary public header for svcwatch.
// Most users should include this header only.

// Error & result model
#include <svcwatch/error.hpp>
#include <svcwatch/expected.hpp>
#include <svcwatch/result.hpp>
#include <svcwatch/log.hpp>

// Execution & lifetime
#include <svcwatch/event_loop.hpp>
#include <svcwatch/executor.hpp>
#include <svcwatch/thread_pool.hpp>
#include <svcwatch/timer_handle.hpp>
#include <svcwatch/work_guard.hpp>

// Building blocks
#include <svcwatch/debounced_set.hpp>
#include <svcwatch/notification_coalescer.hpp>
#include <svcwatch/resolve_queue.hpp>
#include <svcwatch/resolve_worker.hpp>

// Discovery
#include <svcwatch/discovery_event.hpp>
#include <svcwatch/discovery_listener.hpp>
#include <svcwatch/discovery_options.hpp>
#include <svcwatch/discovery_platform.hpp>
#include <svcwatch/discovery_resolver.hpp>
#include <svcwatch/service_record.hpp>
#include <svcwatch/service_resolver.hpp>
