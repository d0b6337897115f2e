///////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2025 libbitcoin-tracker developers (see COPYING).
//
//        GENERATED SOURCE CODE, DO NOT EDIT EXCEPT EXPERIMENTALLY
//
///////////////////////////////////////////////////////////////////////////////
#ifndef LIBBITCOIN_TRACKER_HPP
#define LIBBITCOIN_TRACKER_HPP

/**
 * API Users: Include only this header. Direct use of other headers is fragile
 * and unsupported as header organization is subject to change.
 *
 * Maintainers: Do not include this header internal to this library.
 */

#include <bitcoin/network.hpp>
#include <bitcoin/tracker/chain_event.hpp>
#include <bitcoin/tracker/configuration.hpp>
#include <bitcoin/tracker/define.hpp>
#include <bitcoin/tracker/error.hpp>
#include <bitcoin/tracker/events.hpp>
#include <bitcoin/tracker/logging.hpp>
#include <bitcoin/tracker/outcome.hpp>
#include <bitcoin/tracker/parser.hpp>
#include <bitcoin/tracker/settings.hpp>
#include <bitcoin/tracker/transaction_tracker.hpp>
#include <bitcoin/tracker/version.hpp>
#include <bitcoin/tracker/interfaces/chain_oracle.hpp>
#include <bitcoin/tracker/interfaces/interfaces.hpp>
#include <bitcoin/tracker/interfaces/notification_sink.hpp>
#include <bitcoin/tracker/utility/arrival_queue.hpp>
#include <bitcoin/tracker/utility/block_tree.hpp>
#include <bitcoin/tracker/utility/outcome_cache.hpp>

#endif
