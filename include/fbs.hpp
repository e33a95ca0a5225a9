/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs.hpp
 * @brief Convenience umbrella header for the Facility Booking Service (FBS).
 *
 * This header aggregates the public headers of the fbs library and is
 * provided as a single include for the executables. Translation units of the
 * library itself include only the headers they need.
 */

#ifndef FBS_HPP_
#define FBS_HPP_

#include "fbs-async.hpp"
#include "fbs-buffer.hpp"
#include "fbs-client.hpp"
#include "fbs-codec.hpp"
#include "fbs-config.hpp"
#include "fbs-debug.hpp"
#include "fbs-facility.hpp"
#include "fbs-io.hpp"
#include "fbs-message.hpp"
#include "fbs-monitor.hpp"
#include "fbs-pipe.hpp"
#include "fbs-proc.hpp"
#include "fbs-reply-cache.hpp"
#include "fbs-runtime.hpp"
#include "fbs-server.hpp"
#include "fbs-sim-transport.hpp"
#include "fbs-socket.hpp"
#include "fbs-time.hpp"
#include "fbs-timer.hpp"
#include "fbs-util.hpp"

#endif // FBS_HPP_
