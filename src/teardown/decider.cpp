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

#include "teardown/decider.hpp"

#include <string>

#include <stout/foreach.hpp>
#include <stout/strings.hpp>

using std::endl;
using std::istream;
using std::ostream;
using std::string;

namespace unchroot {
namespace internal {
namespace teardown {

Decider::Decision PolicyDecider::decide(const DecisionContext&)
{
  return decision;
}


InteractiveDecider::InteractiveDecider(istream& _in, ostream& _out)
  : in(_in),
    out(_out) {}


Decider::Decision InteractiveDecider::decide(const DecisionContext& context)
{
  out << "Failed to unmount " << context.path << " after "
      << context.attempts << " attempts; "
      << context.processes.size() << " process(es) still running in '"
      << context.name << "'." << endl
      << "Send " << context.signal << " to them?"
      << " [y(es)/N(o)/k(ill)/l(ist)] " << std::flush;

  string answer;
  if (!std::getline(in, answer)) {
    out << endl;
    return ABORT;
  }

  answer = strings::lower(strings::trim(answer));

  if (strings::startsWith(answer, "y")) {
    return PROCEED;
  } else if (strings::startsWith(answer, "k")) {
    return ESCALATE;
  } else if (strings::startsWith(answer, "l")) {
    foreach (const string& process, context.processes) {
      out << "  " << process << endl;
    }
    return LIST_ONLY;
  }

  return ABORT;
}

} // namespace teardown {
} // namespace internal {
} // namespace unchroot {
