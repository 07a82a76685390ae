// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2019 The PIVX Core developers
// Copyright (c) 2026 The GOVCHAIN developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef GOVCHAIN_UTILMONEYSTR_H
#define GOVCHAIN_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** Render an amount in whole coins with eight decimals, trailing zeros trimmed to two. */
std::string FormatMoney(const CAmount& n, bool fPlus = false);

#endif // GOVCHAIN_UTILMONEYSTR_H
