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
#include <nftcore/protocol/token_id.hpp>
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      const uint256_t& max_issued_id() {
         static const uint256_t max_value = ( uint256_t( 1 ) << NFTCORE_TOKEN_ISSUED_ID_BITS ) - 1;
         return max_value;
      }

      token_id_type encode_token_id( const uint256_t& item_id, const uint256_t& issued_id ) {
         NFTCORE_ASSERT( item_id <= NFTCORE_MAX_ITEM_ID, invalid_item_id_exception,
                         "Item id ${id} exceeds ${bits} bits (INVALID_ITEM_ID)",
                         ("id", item_id)("bits", NFTCORE_TOKEN_ITEM_ID_BITS) );
         NFTCORE_ASSERT( issued_id <= max_issued_id(), invalid_issued_id_exception,
                         "Issued id ${id} exceeds ${bits} bits (INVALID_ISSUED_ID)",
                         ("id", issued_id)("bits", NFTCORE_TOKEN_ISSUED_ID_BITS) );
         return ( item_id << NFTCORE_TOKEN_ISSUED_ID_BITS ) | issued_id;
      }

      token_id_parts decode_token_id( const token_id_type& token_id ) {
         token_id_parts parts;
         parts.item_id = ( token_id >> NFTCORE_TOKEN_ISSUED_ID_BITS ).convert_to<uint64_t>();
         parts.issued_id = token_id & max_issued_id();
         return parts;
      }
   }
} // nftcore::protocol
