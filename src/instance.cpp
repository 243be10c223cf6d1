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
#include "instance.hpp"

#include <algorithm>
#include <stdexcept>
using namespace std;
using namespace boost;

#include "util.hpp"

namespace {
  // a missing field is an empty sequence
  const Json::Value& field(const Json::Value& root, const char* key) {
    static const Json::Value empty(Json::arrayValue);
    if (!root.isMember(key))
      return empty;
    const Json::Value& v = root[key];
    if (!v.isArray())
      throw runtime_error(fmt::format("Field \"{}\" is not an array.",key));
    return v;
  }

  double number(const Json::Value& v, const char* key, unsigned i) {
    if (!v.isNumeric())
      throw runtime_error(fmt::format("Field \"{}\", entry {}: not a number.",key,i));
    return v.asDouble();
  }

  unsigned taskId(const Json::Value& v, const char* key, unsigned i) {
    if (!v.isIntegral() || v.asInt64()<0)
      throw runtime_error(fmt::format("Field \"{}\", entry {}: not a task id.",key,i));
    return v.asUInt();
  }

  vector<int> binary(const Json::Value& v, const char* key, unsigned i) {
    if (!v.isArray())
      throw runtime_error(fmt::format("Field \"{}\", entry {}: not an array.",key,i));
    vector<int> result;
    for(const auto& b : v) {
      if (!b.isIntegral())
	throw runtime_error(fmt::format("Field \"{}\", entry {}: not a binary vector.",key,i));
      result.push_back(b.asInt());
    }
    return result;
  }

  BitVector toBits(const vector<int>& v, const char* key, unsigned i) {
    BitVector result(v.size());
    for(unsigned k=0, ke=v.size(); k!=ke; k++) {
      if (v[k]!=0 && v[k]!=1)
	throw runtime_error(fmt::format("{} of {}: value {} at skill {} is not binary.",key,i,v[k],k));
      result[k]=v[k];
    }
    return result;
  }

  Json::Value toArray(const vector<int>& v) {
    Json::Value result(Json::arrayValue);
    for(int b : v)
      result.append(b);
    return result;
  }
}

void ProblemData::readJSON(istream& in) {
  Json::CharReaderBuilder builder;
  Json::Value root;
  string errs;
  if (!Json::parseFromStream(builder, in, &root, &errs))
    throw runtime_error("Invalid JSON: "+errs);
  readJSON(root);
}

void ProblemData::readJSON(const Json::Value& root) {
  if (!root.isObject())
    throw runtime_error("Problem data is not a JSON object.");

  const auto& tt = field(root,"T_t");
  T_t.assign(tt.size(),{});
  for(unsigned i=0; i!=tt.size(); i++) {
    if (!tt[i].isArray())
      throw runtime_error(fmt::format("Field \"T_t\", row {}: not an array.",i));
    for(const auto& v : tt[i])
      T_t[i].push_back(number(v,"T_t",i));
  }

  precedence.clear();
  const auto& pc = field(root,"precedence_constraints");
  for(unsigned i=0; i!=pc.size(); i++) {
    if (!pc[i].isArray() || pc[i].size()!=2)
      throw runtime_error(fmt::format("Field \"precedence_constraints\", entry {}: not a pair.",i));
    precedence.emplace_back(taskId(pc[i][0],"precedence_constraints",i),taskId(pc[i][1],"precedence_constraints",i));
  }

  T_e.clear();
  const auto& te = field(root,"T_e");
  for(unsigned i=0; i!=te.size(); i++)
    T_e.push_back(number(te[i],"T_e",i));

  locations.clear();
  const auto& tl = field(root,"task_locations");
  for(unsigned i=0; i!=tl.size(); i++) {
    if (!tl[i].isArray() || tl[i].size()!=2)
      throw runtime_error(fmt::format("Field \"task_locations\", entry {}: not a coordinate.",i));
    locations.emplace_back(number(tl[i][0],"task_locations",i),number(tl[i][1],"task_locations",i));
  }

  R.clear();
  const auto& r = field(root,"R");
  for(unsigned i=0; i!=r.size(); i++)
    R.push_back(binary(r[i],"R",i));

  Q.clear();
  const auto& q = field(root,"Q");
  for(unsigned i=0; i!=q.size(); i++)
    Q.push_back(binary(q[i],"Q",i));
}

Json::Value ProblemData::toJSON() const {
  Json::Value root(Json::objectValue);

  Json::Value tt(Json::arrayValue);
  for(const auto& row : T_t) {
    Json::Value r(Json::arrayValue);
    for(Time t : row)
      r.append(t);
    tt.append(r);
  }
  root["T_t"] = tt;

  Json::Value pc(Json::arrayValue);
  for(const auto& [p,s] : precedence) {
    Json::Value c(Json::arrayValue);
    c.append(p);
    c.append(s);
    pc.append(c);
  }
  root["precedence_constraints"] = pc;

  Json::Value te(Json::arrayValue);
  for(Time t : T_e)
    te.append(t);
  root["T_e"] = te;

  Json::Value tl(Json::arrayValue);
  for(const auto& [x,y] : locations) {
    Json::Value c(Json::arrayValue);
    c.append(x);
    c.append(y);
    tl.append(c);
  }
  root["task_locations"] = tl;

  Json::Value r(Json::arrayValue), q(Json::arrayValue);
  for(const auto& v : R)
    r.append(toArray(v));
  for(const auto& v : Q)
    q.append(toArray(v));
  root["R"] = r;
  root["Q"] = q;
  return root;
}

void Instance::build(const ProblemData& D) {
  // (1) dimensions
  n = D.T_e.size();
  m = D.Q.size();
  if (D.locations.size()!=n)
    throw runtime_error(fmt::format("Number of task locations {} inconsistent with number of tasks {}.",D.locations.size(),n));
  if (D.R.size()!=n)
    throw runtime_error(fmt::format("Number of requirement vectors {} inconsistent with number of tasks {}.",D.R.size(),n));
  if (D.T_t.size()!=n)
    throw runtime_error(fmt::format("Travel time matrix has {} rows, expected {}.",D.T_t.size(),n));
  K = n>0 ? D.R[0].size() : (m>0 ? D.Q[0].size() : 0);

  // (2) tasks: the first is the depot, the last one (if any other) the end task
  tasks.clear();
  for(unsigned i=0; i!=n; i++) {
    if (D.R[i].size()!=K)
      throw runtime_error(fmt::format("Requirements of task {} have length {}, expected {}.",i,D.R[i].size(),K));
    if (D.T_e[i]<0)
      throw runtime_error(fmt::format("Task {} has negative execution time {}.",i,D.T_e[i]));
    bool is_dummy = i==0 || (i==n-1 && n>1);
    tasks.push_back({i,D.T_e[i],D.locations[i],toBits(D.R[i],"Requirements",i),is_dummy});
  }
  if (n>0 && tasks[depot].requirements.any())
    warn("The depot has requirements; they are ignored.\n");

  // (3) robots
  robots.clear();
  for(unsigned r=0; r!=m; r++) {
    if (D.Q[r].size()!=K)
      throw runtime_error(fmt::format("Skills of robot {} have length {}, expected {}.",r,D.Q[r].size(),K));
    robots.push_back({r,toBits(D.Q[r],"Skills",r)});
  }

  // (4) travel times
  tt.resize(extents[n][n]);
  for(unsigned i=0; i!=n; i++) {
    if (D.T_t[i].size()!=n)
      throw runtime_error(fmt::format("Travel time matrix row {} has {} columns, expected {}.",i,D.T_t[i].size(),n));
    for(unsigned j=0; j!=n; j++) {
      if (D.T_t[i][j]<0)
	throw runtime_error(fmt::format("Negative travel time {} from task {} to task {}.",D.T_t[i][j],i,j));
      tt[i][j]=D.T_t[i][j];
    }
  }

  // (5) precedences: successor -> predecessors
  pred.assign(n,{});
  for(const auto& [p,s] : D.precedence) {
    if (p>=n || s>=n)
      throw runtime_error(fmt::format("Precedence ({},{}) refers to an unknown task.",p,s));
    if (p==s)
      throw runtime_error(fmt::format("Precedence ({},{}) is a self-loop.",p,s));
    pred[s].push_back(p);
  }
  for(auto& P : pred) {
    sort(P.begin(),P.end());
    P.erase(unique(P.begin(),P.end()),P.end());
  }

  vprint(2,"Instance with {} tasks ({} real), {} robots and {} skills.\n",n,numRealTasks(),m,K);
}

void Instance::readJSON(istream& in) {
  ProblemData D;
  D.readJSON(in);
  build(D);
}

vector<unsigned> Instance::realTasks() const {
  vector<unsigned> result;
  for(const auto& t : tasks)
    if (!t.is_dummy)
      result.push_back(t.id);
  return result;
}

unsigned Instance::numRealTasks() const {
  return count_if(tasks.begin(),tasks.end(),[](const Task& t) { return !t.is_dummy; });
}

ostream& operator<<(ostream& o, const Instance& I) {
  fmt::print(o,"{} tasks, {} robots, {} skills\n",I.n,I.m,I.K);
  for(const auto& t : I.tasks) {
    fmt::print(o,"task {:3} {:8.2f} ({:.1f},{:.1f}) [{}]{}",t.id,t.execution_time,t.location.first,t.location.second,
	       t.requirements.to_string(),t.is_dummy?" dummy":"");
    if (I.pred[t.id].size()>0)
      fmt::print(o," after {}",fmt::join(I.pred[t.id],","));
    fmt::print(o,"\n");
  }
  for(const auto& r : I.robots)
    fmt::print(o,"robot {:3} [{}]\n",r.id,r.skills.to_string());
  return o;
}
