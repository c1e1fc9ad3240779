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
#include <optional>
#include <string>
#include <vector>

namespace oauthlink::store {

/// One external-identity user linked through the OAuth callback.
/// Written as a whole on every link; `processed` and `pulled_resources` belong to
/// the downstream consumer and are reset by each upsert.
struct UserRecord {
  std::string id;  // Provider-issued id, stored verbatim
  std::string username;
  std::optional<std::string> discriminator;
  std::optional<std::string> avatar_hash;
  int64_t connected_at = 0;  // Seconds since epoch
  bool processed = false;
  std::vector<std::string> pulled_resources;
};

}  // namespace oauthlink::store
