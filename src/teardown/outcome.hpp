// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __TEARDOWN_OUTCOME_HPP__
#define __TEARDOWN_OUTCOME_HPP__

#include <ostream>

namespace unchroot {
namespace internal {
namespace teardown {

// How the teardown of a single environment ended.
enum Outcome
{
  CLEARED,          // Nothing is mounted in the environment anymore.
  NOT_FOUND,        // The environment does not exist.
  INACCESSIBLE,     // Its path could not be resolved.
  IN_USE,           // Processes use the environment; nothing was done.
  RACE_DETECTED,    // Someone started using it while tearing it down.
  USER_DECLINED,    // The operator chose not to signal its processes.
  BUDGET_EXHAUSTED, // Mounts stayed busy and nobody could decide.
  UNGUARDED         // A shared bind point could not be made a slave;
                    // nothing was unmounted.
};


inline std::ostream& operator<<(std::ostream& stream, const Outcome& outcome)
{
  switch (outcome) {
    case CLEARED:          return stream << "CLEARED";
    case NOT_FOUND:        return stream << "NOT_FOUND";
    case INACCESSIBLE:     return stream << "INACCESSIBLE";
    case IN_USE:           return stream << "IN_USE";
    case RACE_DETECTED:    return stream << "RACE_DETECTED";
    case USER_DECLINED:    return stream << "USER_DECLINED";
    case BUDGET_EXHAUSTED: return stream << "BUDGET_EXHAUSTED";
    case UNGUARDED:        return stream << "UNGUARDED";
  }

  return stream << "UNKNOWN";
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_OUTCOME_HPP__
