/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

/**
 * @file
 * Compile-time parameters of the collection platform
 */

/// Number of high-order bits of a token identifier that carry the item identifier
#define NFTCORE_TOKEN_ITEM_ID_BITS                  40
/// Number of low-order bits of a token identifier that carry the issued identifier
#define NFTCORE_TOKEN_ISSUED_ID_BITS                216
/// Largest item identifier that can be packed into a token identifier (2^40 - 1)
#define NFTCORE_MAX_ITEM_ID                         (uint64_t(0xFFFFFFFFFFULL))

/// Seconds that must elapse after completion before a collection may issue tokens
#define NFTCORE_COLLECTION_GRACE_PERIOD             (60*60*24)

/// Chain identifier embedded in token URIs when none is configured
#define NFTCORE_DEFAULT_CHAIN_ID                    1

/// EIP-1167 minimal proxy code, split around the 20-byte implementation address
#define NFTCORE_MINIMAL_PROXY_CODE_PREFIX           "3d602d80600a3d3981f3363d3d373d3d3d363d73"
#define NFTCORE_MINIMAL_PROXY_CODE_SUFFIX           "5af43d82803e903d91602b57fd5bf3"

/// Leading byte of the deterministic address pre-image
#define NFTCORE_CREATE2_PREFIX_BYTE                 char(0xff)

/// Maximum supply of each rarity tier
#define NFTCORE_RARITY_COMMON_SUPPLY                100000
#define NFTCORE_RARITY_UNCOMMON_SUPPLY              10000
#define NFTCORE_RARITY_RARE_SUPPLY                  5000
#define NFTCORE_RARITY_EPIC_SUPPLY                  1000
#define NFTCORE_RARITY_LEGENDARY_SUPPLY             100
#define NFTCORE_RARITY_MYTHIC_SUPPLY                5
#define NFTCORE_RARITY_UNIQUE_SUPPLY                1
