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
#include "generator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
using namespace std;

#include "util.hpp"
#include "random.hpp"
using namespace crta;

ProblemData generateInstance(const GeneratorParams& P) {
  if (P.robots==0 || P.skills==0)
    throw runtime_error("Need at least one robot and one skill.");
  if (P.speed<=0)
    throw runtime_error(fmt::format("Invalid speed {}.",P.speed));
  if (P.grid>unsigned(numeric_limits<int>::max()) || P.tmax>unsigned(numeric_limits<int>::max()))
    throw runtime_error(fmt::format("Grid size {} or maximum execution time {} too large.",P.grid,P.tmax));

  ProblemData D;
  const unsigned n = P.tasks+2, end = n-1;

  // (1) locations and execution times
  auto point = [&]() { return Location(getRandom(0,P.grid),getRandom(0,P.grid)); };
  D.locations.resize(n);
  D.locations[depot] = point();
  for(unsigned i=1; i!=end; i++)
    D.locations[i] = point();
  D.locations[end] = D.locations[depot];

  D.T_e.assign(n,0.0);
  for(unsigned i=1; i!=end; i++)
    D.T_e[i] = getRandom(1,max(1u,P.tmax));

  // (2) requirements: at least one per real task
  D.R.assign(n,vector<int>(P.skills,0));
  for(unsigned i=1; i!=end; i++) {
    bool any = false;
    for(unsigned k=0; k!=P.skills; k++)
      if (getRandom()<P.preq)
	D.R[i][k] = 1, any = true;
    if (!any)
      D.R[i][getRandom(0,P.skills-1)] = 1;
  }

  // (3) skills: every skill owned by some robot
  D.Q.assign(P.robots,vector<int>(P.skills,0));
  for(unsigned k=0; k!=P.skills; k++) {
    bool owned = false;
    for(unsigned r=0; r!=P.robots; r++)
      if (getRandom()<P.pskill)
	D.Q[r][k] = 1, owned = true;
    if (!owned)
      D.Q[getRandom(0,P.robots-1)][k] = 1;
  }

  // (4) precedences
  vector<bool> haspred(n,false), hassucc(n,false);
  for(unsigned i=1; i!=end; i++)
    for(unsigned j=i+1; j!=end; j++)
      if (getRandom()<P.density) {
	D.precedence.emplace_back(i,j);
	hassucc[i] = haspred[j] = true;
      }
  for(unsigned i=1; i!=end; i++) {
    if (!haspred[i])
      D.precedence.emplace_back(depot,i);
    if (!hassucc[i])
      D.precedence.emplace_back(i,end);
  }
  if (P.tasks==0)
    D.precedence.emplace_back(depot,end);

  // (5) travel times
  D.T_t.assign(n,vector<Time>(n,0.0));
  for(unsigned i=0; i!=n; i++)
    for(unsigned j=0; j!=n; j++) {
      double dx = D.locations[i].first-D.locations[j].first, dy = D.locations[i].second-D.locations[j].second;
      D.T_t[i][j] = sqrt(dx*dx+dy*dy)/P.speed;
    }

  vprint(2,cerr,"Generated {} tasks, {} robots, {} skills, {} precedences.\n",n,P.robots,P.skills,D.precedence.size());
  return D;
}
