#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "warden/models.hpp"

namespace {
warden::Clock::time_point At(std::int64_t seconds) {
  return warden::Clock::time_point(std::chrono::seconds(seconds));
}
}  // namespace

TEST(ModelsTest, IsoStringIsUtc) {
  EXPECT_EQ(warden::ToIsoString(At(0)), "1970-01-01T00:00:00Z");
  EXPECT_EQ(warden::ToIsoString(At(1700000000)), "2023-11-14T22:13:20Z");
}

TEST(ModelsTest, IsoStringIsStableAcrossThreads) {
  const std::vector<std::pair<std::int64_t, std::string>> cases = {
      {0, "1970-01-01T00:00:00Z"}, {1700000000, "2023-11-14T22:13:20Z"}, {951782400, "2000-02-29T00:00:00Z"}};
  std::vector<int> mismatches(cases.size(), 0);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < cases.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 2000; ++i) {
        if (warden::ToIsoString(At(cases[t].first)) != cases[t].second) {
          ++mismatches[t];
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (std::size_t t = 0; t < cases.size(); ++t) {
    EXPECT_EQ(mismatches[t], 0) << cases[t].second;
  }
}
