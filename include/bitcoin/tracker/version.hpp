///////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2014-2025 libbitcoin-tracker developers (see COPYING).
//
//        GENERATED SOURCE CODE, DO NOT EDIT EXCEPT EXPERIMENTALLY
//
///////////////////////////////////////////////////////////////////////////////
#ifndef LIBBITCOIN_TRACKER_VERSION_HPP
#define LIBBITCOIN_TRACKER_VERSION_HPP

/**
 * The semantic version of this repository as: [major].[minor].[patch]
 * For interpretation of the versioning scheme see: http://semver.org
 */

#define LIBBITCOIN_TRACKER_VERSION "4.0.0"
#define LIBBITCOIN_TRACKER_MAJOR_VERSION 4
#define LIBBITCOIN_TRACKER_MINOR_VERSION 0
#define LIBBITCOIN_TRACKER_PATCH_VERSION 0

#endif
