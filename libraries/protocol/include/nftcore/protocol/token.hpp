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

#include <nftcore/protocol/base.hpp>

namespace nftcore {
   namespace protocol {
      /**
       * @brief Move a collection token between holders
       *
       * The caller must be the holder, the token's approved address or an operator of the holder.
       */
      struct token_transfer_operation : public base_operation {
         address caller;
         address collection;
         address from;
         address to;
         token_id_type token_id;

         void validate()const;
      };

      /// Move several tokens of one holder to a single receiver, all or nothing
      struct token_batch_transfer_operation : public base_operation {
         address caller;
         address collection;
         address from;
         address to;
         vector<token_id_type> token_ids;

         void validate()const;
      };

      /// Approve one address to transfer a single token.  A zero @ref approved clears the approval.
      struct token_approve_operation : public base_operation {
         address caller;
         address collection;
         address approved;
         token_id_type token_id;

         void validate()const;
      };

      /// Grant or revoke an operator over all of the caller's tokens in a collection
      struct token_set_approval_for_all_operation : public base_operation {
         address caller;
         address collection;
         address operator_;
         bool approved = false;

         void validate()const;
      };
   }
} // nftcore::protocol

FC_REFLECT( nftcore::protocol::token_transfer_operation, (caller)(collection)(from)(to)(token_id) )
FC_REFLECT( nftcore::protocol::token_batch_transfer_operation, (caller)(collection)(from)(to)(token_ids) )
FC_REFLECT( nftcore::protocol::token_approve_operation, (caller)(collection)(approved)(token_id) )
FC_REFLECT( nftcore::protocol::token_set_approval_for_all_operation, (caller)(collection)(operator_)(approved) )
