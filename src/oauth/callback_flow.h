// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "provider_client.h"
#include "store/user_store.h"

namespace oauthlink::oauth {

struct CallbackSuccess {
  std::string user_id;
  std::string display_name;
};

struct CallbackFailure {
  std::string code;
  std::string message;
};

using CallbackResult = std::variant<CallbackSuccess, CallbackFailure>;

/// Query parameters of the provider redirect that the flow reads.
struct CallbackParams {
  std::optional<std::string> code;
  std::optional<std::string> error;
  std::optional<std::string> error_description;
};

/// "username#discriminator" for legacy accounts, otherwise the bare username.
std::string DisplayName(const std::string& username,
                        const std::optional<std::string>& discriminator,
                        bool legacy_discriminator);

/// Drives one authorization-code callback: exchange, profile fetch, upsert.
///
/// Each failing step short-circuits to a CallbackFailure with its own code. A
/// store failure is logged and does not change the outcome.
class CallbackFlow {
 public:
  using Clock = std::function<int64_t()>;

  CallbackFlow(ProviderClient& provider, store::UserStore& store,
               bool legacy_discriminator = true, Clock now_seconds = {});

  CallbackResult Run(const CallbackParams& params);

 private:
  CallbackFailure Fail(std::string code, std::string message) const;

  ProviderClient& provider_;
  store::UserStore& store_;
  bool legacy_discriminator_;
  Clock now_seconds_;
};

}  // namespace oauthlink::oauth
