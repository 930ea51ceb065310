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

#ifndef __TEARDOWN_DECIDER_HPP__
#define __TEARDOWN_DECIDER_HPP__

#include <istream>
#include <ostream>

#include <unchroot/decider.hpp>

namespace unchroot {
namespace internal {
namespace teardown {

// Always gives the same answer. Used when nobody can be asked.
class PolicyDecider : public Decider
{
public:
  explicit PolicyDecider(Decision decision) : decision(decision) {}

  Decision decide(const DecisionContext& context) override;

  bool interactive() const override { return false; }

private:
  const Decision decision;
};


// Asks an operator. The question is written to `out` and one line is
// read from `in`:
//   'y'  sends the current signal,
//   'k'  sends SIGKILL (and keeps doing so),
//   'l'  lists the processes and sends nothing,
// anything else, including end of input, gives up.
class InteractiveDecider : public Decider
{
public:
  InteractiveDecider(std::istream& in, std::ostream& out);

  Decision decide(const DecisionContext& context) override;

  bool interactive() const override { return true; }

private:
  std::istream& in;
  std::ostream& out;
};

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {

#endif // __TEARDOWN_DECIDER_HPP__
