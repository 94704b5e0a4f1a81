// Copyright 2025 The edgeclient Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License is distributed on
// an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the License for the
// specific language governing permissions and limitations under the License.

#pragma once

namespace edgeclient::utils {

// Only T can create a PassKey<T>, so a function taking one by value can only
// be called from T.
template <typename T>
class PassKey {
  friend T;

 private:
  // user-provided, `= default` would leave PassKey an aggregate and let
  // anyone create one with `{}`
  PassKey() {}
};

}  // namespace edgeclient::utils
