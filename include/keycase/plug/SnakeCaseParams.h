// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <utility>

#include <keycase/core/Value.h>
#include <keycase/core/convert.h>
#include <keycase/support/logging.h>

namespace keycase::plug {

//////////////////////////////////////////////////////////////////////////////
/// Inbound request, as seen by middleware.
/// - `query_params` and `body_params` are the parsed query string and body.
/// - `params` is the merged parameter tree that handlers read.
//////////////////////////////////////////////////////////////////////////////
struct Request
{
    String method = "GET";
    String path = "/";
    Value query_params = Map{};
    Value body_params = Map{};
    Value params = Map{};
};

//////////////////////////////////////////////////////////////////////////////
/// Middleware that converts the keys of `Request::params` to snake_case.
/// - Keys are converted at every depth, including maps inside lists.
/// - Values are not changed, and records such as uploads are kept as is.
/// - `query_params` and `body_params` are left as received.
//////////////////////////////////////////////////////////////////////////////
class SnakeCaseParams
{
  public:
    Request call(Request request) const {
        request.params = convert_keys(request.params, to_snake_case);
        DEBUG("{} {} params={}", request.method, request.path, request.params.to_str());
        return request;
    }

    Request operator () (Request request) const { return call(std::move(request)); }
};

} // namespace keycase::plug
