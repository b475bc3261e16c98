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
#include <nftcore/chain/database.hpp>
#include <nftcore/chain/contract_evaluator.hpp>

namespace nftcore {
   namespace chain {
      void_result contract_transfer_ownership_evaluator::do_evaluate(const contract_transfer_ownership_operation &op) {
         try {
            const database& d = db();
            _contract = &d.get_contract( op.contract );

            NFTCORE_ASSERT( op.caller == _contract->owner, caller_is_not_owner_exception,
                            "Ownable: caller is not the owner", ("caller", op.caller)("owner", _contract->owner) );

            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }

      void_result contract_transfer_ownership_evaluator::do_apply(const contract_transfer_ownership_operation &op) {
         try {
            db().transfer_contract_ownership( *_contract, op.new_owner );
            return void_result();
         } FC_CAPTURE_AND_RETHROW((op))
      }
   }
} // nftcore::chain
