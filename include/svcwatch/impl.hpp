#pragma once

// Out-of-line definitions. Compiled exactly once, by src/svcwatch.cpp.

#include <svcwatch/impl/assert.ipp>
#include <svcwatch/impl/error.ipp>
#include <svcwatch/impl/log.ipp>

#include <svcwatch/impl/event_loop_impl.ipp>

#include <svcwatch/impl/resolve_queue.ipp>
#include <svcwatch/impl/resolve_worker.ipp>
#include <svcwatch/impl/service_record.ipp>

#include <svcwatch/impl/discovery_event.ipp>
#include <svcwatch/impl/discovery_options.ipp>
#include <svcwatch/impl/lifecycle.ipp>
#include <svcwatch/impl/discovery_core.ipp>
#include <svcwatch/impl/discovery_resolver.ipp>
