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
#include "benchmark.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>
using namespace std;

#include "util.hpp"
#include "scheduler.hpp"

string problemFile(const string& base, int id) {
  return fmt::format("{}/problem_instances/problem_instance_1p_{:06d}.json",base,id);
}

string solutionFile(const string& base, int id) {
  return fmt::format("{}/solutions/optimal_schedule_1p_{:06d}.json",base,id);
}

string scheduleFile(const string& dir, int id) {
  return fmt::format("{}/heuristic_schedule_1p_{:06d}.json",dir,id);
}

Time readOptimal(istream& in) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs))
    throw runtime_error("Invalid JSON: "+errs);
  if (!root.isObject() || !root["makespan"].isNumeric())
    throw runtime_error("Solution has no numeric \"makespan\".");
  return root["makespan"].asDouble();
}

bool loadInstance(int id, const string& base, Instance& I, Time& optimal) {
  string pname = problemFile(base,id), sname = solutionFile(base,id);

  ifstream pin(pname);
  if (!pin.is_open()) {
    fmt::print(cerr,"Error: Problem file not found at {}\n",pname);
    return false;
  }
  ifstream sin(sname);
  if (!sin.is_open()) {
    fmt::print(cerr,"Error: Solution file not found at {}\n",sname);
    return false;
  }

  try {
    I.readJSON(pin);
  } catch (const exception& e) {
    fmt::print(cerr,"Error: Failed to read {}: {}\n",pname,e.what());
    return false;
  }
  try {
    optimal = readOptimal(sin);
  } catch (const exception& e) {
    fmt::print(cerr,"Error: Failed to read {}: {}\n",sname,e.what());
    return false;
  }
  return true;
}

double makespanRatio(Time heuristic, Time optimal) {
  if (optimal>0)
    return heuristic/optimal;
  return heuristic>0 ? numeric_limits<double>::infinity() : 1.0;
}

void writeSchedule(const Schedule& S, const string& filename) {
  ofstream out(filename);
  if (!out.is_open())
    throw runtime_error(fmt::format("Cannot write schedule to {}.",filename));
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  out << Json::writeString(builder, S.toJSON()) << endl;
}

Record Benchmark::run(int id, const Instance& I, Time optimal, Schedule* out) {
  timer T;
  Schedule S = greedyHeuristic(I);
  double duration = T.elapsed_secs();
  total_time += duration;

  Record r{id, optimal, S.makespan, makespanRatio(S.makespan,optimal), duration, S.complete()};
  records.push_back(r);
  if (out!=nullptr)
    *out = S;
  return r;
}

double Benchmark::averageRatio() const {
  if (records.size()==0)
    return 0.0;
  double sum = 0.0;
  for(const auto& r : records)
    sum += r.ratio;
  return sum/records.size();
}

double Benchmark::averageDuration() const {
  return records.size()>0 ? total_time/records.size() : 0.0;
}

string Benchmark::summary() const {
  if (records.size()==0)
    return "\nNo instances were processed.\n";
  string s = "\n--- Benchmark Summary ---\n";
  s += fmt::format("Processed {} instances.\n",records.size());
  s += fmt::format("Average Heuristic/Optimal Ratio: {:.4f}\n",averageRatio());
  s += fmt::format("Average Time per Instance: {:.4f}s\n",averageDuration());
  s += "-------------------------\n";
  return s;
}
