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

#include <nftcore/protocol/types.hpp>

namespace nftcore {
   namespace protocol {
      /// Rarity tiers, ordered from most to least abundant
      enum class collection_rarity : uint8_t {
         common    = 0,
         uncommon  = 1,
         rare      = 2,
         epic      = 3,
         legendary = 4,
         mythic    = 5,
         unique    = 6
      };

      /// Number of defined rarity tiers; any rarity code at or above this is invalid
      constexpr uint8_t rarity_count = static_cast<uint8_t>( collection_rarity::unique ) + 1;

      inline bool is_valid_rarity( uint8_t rarity ) { return rarity < rarity_count; }

      /**
       * @brief Maximum supply an item of the given rarity may reach
       * @throws invalid_rarity_exception for an unknown tier
       */
      uint64_t get_rarity_value( uint8_t rarity );

      /// Lower-case name of a rarity tier
      std::string get_rarity_name( uint8_t rarity );
   }
} // nftcore::protocol

FC_REFLECT_ENUM( nftcore::protocol::collection_rarity, (common)(uncommon)(rare)(epic)(legendary)(mythic)(unique) )
