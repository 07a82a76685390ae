// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef GOVCHAIN_VERSION_H
#define GOVCHAIN_VERSION_H

/**
 * serialization versioning
 */

static const int PROTOCOL_VERSION = 70001;

//! version of the block-test oracle JSON document written by govchain-blockgen
static const int ORACLE_FORMAT_VERSION = 1;

#endif // GOVCHAIN_VERSION_H
