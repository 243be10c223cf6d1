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

#include <algorithm>
#include <string>
#include <vector>
#include <cstddef>

// Flag vector used for skill vectors (robots), requirement vectors (tasks),
// and the uncovered-skill and robot-pool sets of the coalition search.
struct BitVector : public std::vector<char> {
  BitVector() {}
  BitVector(size_t n) : std::vector<char>(n) {}
  BitVector(size_t n, bool v) : std::vector<char>(n,v) {}
  size_t count() const {
    size_t result = 0;
    for(size_t i=0, ie=size(); i!=ie; i++)
      if (operator[](i))
	result++;
    return result;
  }
  bool any() const {
    for(size_t i=0, ie=size(); i!=ie; i++)
      if (operator[](i))
	return true;
    return false;
  }
  // true if we have a 1 wherever `r` has a 1
  bool covers(const BitVector& r) const {
    for(size_t i=0, ie=r.size(); i!=ie; i++)
      if (r[i] && (i>=size() || !operator[](i)))
	return false;
    return true;
  }
  // number of positions where both `r` and we have a 1
  size_t overlap(const BitVector& r) const {
    size_t result = 0;
    for(size_t i=0, ie=std::min(size(),r.size()); i!=ie; i++)
      if (r[i] && operator[](i))
	result++;
    return result;
  }
  // clear every position where `r` has a 1
  void remove(const BitVector& r) {
    for(size_t i=0, ie=std::min(size(),r.size()); i!=ie; i++)
      if (r[i])
	operator[](i)=false;
  }
  std::string to_string() const {
    std::string s;
    for(size_t i=0, ie=size(); i!=ie; i++)
      s += operator[](i) ? '1' : '0';
    return s;
  }
  void merge(const BitVector& r) {
    if (r.size()>size())
      resize(r.size(),false);
    for(size_t i=0, ie=r.size(); i!=ie; i++)
      if (r[i])
	operator[](i)=true;
  }
};
