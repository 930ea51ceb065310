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

#ifndef __UNCHROOT_DECIDER_HPP__
#define __UNCHROOT_DECIDER_HPP__

#include <stddef.h>

#include <string>
#include <vector>

namespace unchroot {

// What a decider is told when an environment's mounts are still busy
// after the retry budget is used up.
struct DecisionContext
{
  // Name and canonical path of the environment being torn down.
  std::string name;
  std::string path;

  // Name of the signal that would be sent, e.g., "SIGTERM".
  std::string signal;

  // Number of consecutive failed unmount passes.
  size_t attempts;

  // One "<pid> <command line>" line per process still running
  // inside the environment.
  std::vector<std::string> processes;
};


// Decides what to do about processes holding an environment busy.
// Implementations may block, e.g., to ask an operator.
class Decider
{
public:
  enum Decision
  {
    PROCEED,   // Send the current signal.
    ESCALATE,  // Send the strongest signal, now and from now on.
    LIST_ONLY, // Show the processes but send nothing.
    ABORT      // Give up on this environment.
  };

  virtual ~Decider() {}

  virtual Decision decide(const DecisionContext& context) = 0;

  // Whether decisions come from an operator. An ABORT from an
  // interactive decider means the operator declined; from any other
  // decider it means no decision could be made.
  virtual bool interactive() const = 0;
};

} // namespace unchroot {

#endif // __UNCHROOT_DECIDER_HPP__
