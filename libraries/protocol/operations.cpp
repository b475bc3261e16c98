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
#include <nftcore/protocol/operations.hpp>

namespace nftcore {
   namespace protocol {
      namespace {
         struct operation_validator {
            typedef void result_type;

            template<typename T>
            void operator()( const T& v )const { v.validate(); }
         };

         struct forwarded_operation_builder {
            typedef operation result_type;

            address caller;

            template<typename Op>
            operation operator()( const Op& call )const {
               Op forwarded = call;
               forwarded.caller = caller;
               return operation( forwarded );
            }
         };
      }

      void operation_validate( const operation& op ) {
         op.visit( operation_validator() );
      }

      operation make_forwarded_operation( const forwardable_operation& call, const address& caller ) {
         forwarded_operation_builder builder;
         builder.caller = caller;
         return call.visit( builder );
      }
   }
} // nftcore::protocol
