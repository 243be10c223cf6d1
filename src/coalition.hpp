/*
 * Copyright (c) 2023 Jordi Pereira, Marcus Ritt
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#pragma once

#include <string>
#include <vector>

#include "instance.hpp"

enum class CoalitionStatus { Empty, Found, Infeasible };

std::string to_string(CoalitionStatus);

// a team of robots for one task
struct Coalition {
  CoalitionStatus status = CoalitionStatus::Empty;
  std::vector<unsigned> robots; // member ids, in order of selection

  bool feasible() const { return status!=CoalitionStatus::Infeasible; }
  size_t size() const { return robots.size(); }
  BitVector skills(const std::vector<Robot>&) const; // union of member skills
};

/*
  Find a sufficient coalition for `task`:
  - no requirement: the empty coalition;
  - otherwise the first robot (by id) whose skills dominate the requirements;
  - otherwise a greedy set cover: repeatedly add the robot that covers most
    of the uncovered requirements (ties to the lowest id), until everything
    is covered, or no remaining robot covers anything (infeasible).

  The coalition is not necessarily minimal. Time O(R^2 K).
*/
Coalition findCoalition(const Task& task, const std::vector<Robot>& robots);
