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
#include <nftcore/protocol/token.hpp>
#include <nftcore/protocol/exceptions.hpp>

namespace nftcore {
   namespace protocol {
      void token_transfer_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !to.is_zero(), transfer_to_zero_address_exception,
                         "ERC721: transfer to the zero address", ("token_id", token_id) );
      }

      void token_batch_transfer_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( !to.is_zero(), transfer_to_zero_address_exception,
                         "ERC721: transfer to the zero address", ("token_ids", token_ids) );
      }

      void token_approve_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
      }

      void token_set_approval_for_all_operation::validate()const {
         FC_ASSERT( !caller.is_zero(), "The caller may not be the zero address" );
         NFTCORE_ASSERT( operator_ != caller, approve_to_caller_exception,
                         "ERC721: approve to caller", ("operator", operator_) );
      }
   }
} // nftcore::protocol
