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
#include "schedule.hpp"

// file names of instance `id` below dataset root `base`
std::string problemFile(const std::string& base, int id);
std::string solutionFile(const std::string& base, int id);
std::string scheduleFile(const std::string& dir, int id);

// optimal makespan from a solution file
Time readOptimal(std::istream&);

// load instance `id` and its optimal makespan; false (with a message) if some file is missing or invalid
bool loadInstance(int id, const std::string& base, Instance& I, Time& optimal);

// heuristic over optimal makespan; 1 if both are 0, infinite if only the optimal one is 0
double makespanRatio(Time heuristic, Time optimal);

void writeSchedule(const Schedule&, const std::string& filename);

struct Record {
  int id;
  Time optimal, heuristic;
  double ratio;
  double duration;	// seconds
  bool complete;	// heuristic scheduled all tasks
};

struct Benchmark {
  std::vector<Record> records;
  double total_time = 0.0;

  // run the heuristic on `I`, record and return the result
  Record run(int id, const Instance& I, Time optimal, Schedule* out = nullptr);

  size_t size() const { return records.size(); }
  double averageRatio() const;
  double averageDuration() const;
  std::string summary() const;
};
