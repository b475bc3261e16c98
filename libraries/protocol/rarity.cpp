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
#include <nftcore/protocol/rarity.hpp>
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      namespace {
         const uint64_t rarity_supply[rarity_count] = {
            NFTCORE_RARITY_COMMON_SUPPLY,
            NFTCORE_RARITY_UNCOMMON_SUPPLY,
            NFTCORE_RARITY_RARE_SUPPLY,
            NFTCORE_RARITY_EPIC_SUPPLY,
            NFTCORE_RARITY_LEGENDARY_SUPPLY,
            NFTCORE_RARITY_MYTHIC_SUPPLY,
            NFTCORE_RARITY_UNIQUE_SUPPLY
         };

         collection_rarity get_tier( uint8_t rarity ) {
            NFTCORE_ASSERT( is_valid_rarity( rarity ), invalid_rarity_exception,
                            "Unknown rarity ${r}", ("r", rarity) );
            return static_cast<collection_rarity>( rarity );
         }
      }

      uint64_t get_rarity_value( uint8_t rarity ) {
         return rarity_supply[static_cast<uint8_t>( get_tier( rarity ) )];
      }

      std::string get_rarity_name( uint8_t rarity ) {
         return fc::reflector<collection_rarity>::to_string( get_tier( rarity ) );
      }
   }
} // nftcore::protocol
