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
      /**
       * @brief The two components packed into a token identifier
       *
       * The item identifier occupies the high-order NFTCORE_TOKEN_ITEM_ID_BITS bits and the
       * issued identifier the remaining NFTCORE_TOKEN_ISSUED_ID_BITS bits.
       */
      struct token_id_parts {
         uint64_t  item_id = 0;
         uint256_t issued_id;
      };

      /// Largest issued identifier that fits into a token identifier (2^216 - 1)
      const uint256_t& max_issued_id();

      /**
       * @brief Pack an item identifier and an issued identifier into one token identifier
       * @throws invalid_item_id_exception if @p item_id does not fit into 40 bits
       * @throws invalid_issued_id_exception if @p issued_id does not fit into 216 bits
       */
      token_id_type encode_token_id( const uint256_t& item_id, const uint256_t& issued_id );

      /// Split a token identifier into its item and issued identifiers.  Total for every input.
      token_id_parts decode_token_id( const token_id_type& token_id );
   }
} // nftcore::protocol

FC_REFLECT( nftcore::protocol::token_id_parts, (item_id)(issued_id) )
