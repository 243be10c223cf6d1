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

#include "instance.hpp"

struct GeneratorParams {
  unsigned tasks = 10;	  // number of real tasks
  unsigned robots = 4;	  // number of robots
  unsigned skills = 3;	  // skill dimension
  double density = 0.2;	  // probability of a precedence between two real tasks
  unsigned grid = 100;	  // locations are drawn from [0,grid]^2
  double speed = 10.0;	  // distance per time unit
  double preq = 0.3;	  // probability that a task requires a skill
  double pskill = 0.5;	  // probability that a robot has a skill
  unsigned tmax = 10;	  // execution times are drawn from [1,tmax]
};

/*
  Random feasible instance (uses crta::rng):
  - task 0 (depot) and task n+1 (end) share a location and need nothing;
  - every real task requires at least one skill, every skill is owned by some robot;
  - precedences between real tasks i<j with probability `density`, plus arcs
    from the depot to tasks without predecessor and from tasks without
    successor to the end task;
  - travel times are Euclidean distances divided by `speed`.
*/
ProblemData generateInstance(const GeneratorParams&);
