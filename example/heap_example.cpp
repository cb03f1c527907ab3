#include <prio/prio.hpp>

#include <cstdio>
#include <iostream>
#include <string>

struct Job {
  int priority;
  std::string name;
};

auto main() -> int
{
  auto jobs = prio::BinaryHeap<Job>([](Job const& a, Job const& b) { return a.priority - b.priority; });
  jobs.insert({3, "compact"});
  jobs.insert({1, "flush"});
  jobs.insert({2, "checkpoint"});

  for (auto&& job : jobs.drain()) {
    std::printf("preview: %d %s\n", job.priority, job.name.c_str());
  }
  while (!jobs.empty()) {
    auto job = jobs.poll();
    std::printf("run: %s (capacity %zu)\n", job.name.c_str(), jobs.capacity());
  }

  auto top = prio::BinaryHeap<int>::reversed();
  for (auto v : {5, 3, 8, 1, 9}) {
    top.insert(v);
  }
  std::cout << top << '\n';

  // Job has no operator<, so without a comparator the second insert cannot order keys.
  auto unordered = prio::BinaryHeap<Job>();
  unordered.insert({1, "only"});
  try {
    unordered.insert({2, "second"});
  } catch (prio::Error const& e) {
    std::printf("error: %s (%s)\n", e.what(), e.code().message().c_str());
  }
  return 0;
}
