/*
  Trail-coverage determines which trail segments were covered by GPS tracks.
  Copyright (C) 2018  Florian Barth

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/
#ifndef WORKERS_H
#define WORKERS_H

#include <algorithm>
#include <future>
#include <thread>
#include <vector>

// 0 requests one worker per hardware thread.
inline size_t workerCount(size_t requested = 0)
{
  if (requested > 0) {
    return requested;
  }
  return std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;
}

/*
  Calls body(i) for every i in [0, count). The range is split into one contiguous chunk per
  worker. Callers write results into disjoint slots indexed by i. The first exception thrown by
  a worker is rethrown after all workers finished.
*/
template <typename Body> void parallelFor(size_t count, size_t threads, Body body)
{
  const size_t workers = std::min(workerCount(threads), std::max<size_t>(count, 1));
  if (workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      body(i);
    }
    return;
  }

  const size_t chunk = (count + workers - 1) / workers;
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t begin = 0; begin < count; begin += chunk) {
    const size_t end = std::min(count, begin + chunk);
    futures.push_back(std::async(std::launch::async, [&body, begin, end]() {
      for (size_t i = begin; i < end; ++i) {
        body(i);
      }
    }));
  }
  for (auto& future : futures) {
    future.wait();
  }
  for (auto& future : futures) {
    future.get();
  }
}

#endif /* WORKERS_H */
