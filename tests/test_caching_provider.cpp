/**
 * @file test_caching_provider.cpp
 * @brief Caching provider tests: memoization, shared in-flight fetches, failure handling.
 * @author Watosn
 */

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "bridgecast/records/caching_provider.hpp"

namespace {

constexpr const char* kKnown = "5d0e6a1b-7c2f-4e39-a8d4-91b3c6f2e07a";
constexpr const char* kFaulty = "5d0e6a1b-7c2f-4e39-a8d4-91b3c6f2e07b";

class SlowCountingProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  SlowCountingProvider() {
    auto r = std::make_shared<bridgecast::core::BridgeRecord>();
    r->uuid = kKnown;
    r->geometry = {{0.0, 5.0}, {10.0, 0.0}, {20.0, 5.0}};
    r->rating_curve = {{0.0, 0.0}, {100.0, 2.0}};
    r->low_chord_elevation = 3.0;
    r->deck_elevation = 4.0;
    record_ = std::move(r);
  }

  bridgecast::core::BridgeLookup get(std::string_view uuid) const override {
    ++calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (uuid == kFaulty) {
      throw std::runtime_error("object store connection reset");
    }
    if (uuid != kKnown) {
      return bridgecast::core::BridgeLookup{.status = bridgecast::core::Status::UnknownBridge};
    }
    return bridgecast::core::BridgeLookup{.record = record_};
  }

  mutable std::atomic<int> calls{0};

 private:
  std::shared_ptr<const bridgecast::core::BridgeRecord> record_{};
};

class ThrowsOnceProvider final : public bridgecast::core::IBridgeRecordProvider {
 public:
  bridgecast::core::BridgeLookup get(std::string_view uuid) const override {
    if (calls.fetch_add(1) == 0) {
      throw 42;
    }
    auto r = std::make_shared<bridgecast::core::BridgeRecord>();
    r->uuid = std::string(uuid);
    return bridgecast::core::BridgeLookup{.record = std::move(r)};
  }

  mutable std::atomic<int> calls{0};
};

}  // namespace

int main() {
  using namespace bridgecast;

  SlowCountingProvider upstream;
  const records::CachingBridgeProvider cache(upstream);

  constexpr int kThreads = 16;
  std::vector<core::BridgeLookup> results(kThreads);
  std::vector<std::thread> pool;
  pool.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    pool.emplace_back([&cache, &results, t]() { results[static_cast<std::size_t>(t)] = cache.get(kKnown); });
  }
  for (auto& t : pool) {
    t.join();
  }

  if (upstream.calls.load() != 1) {
    spdlog::error("concurrent misses fetched {} times", upstream.calls.load());
    return 1;
  }
  for (const auto& r : results) {
    if (r.status != core::Status::Ok || !r.record || r.record.get() != results.front().record.get()) {
      spdlog::error("concurrent callers did not share one record");
      return 2;
    }
  }

  const auto again = cache.get(kKnown);
  if (again.status != core::Status::Ok || upstream.calls.load() != 1 || cache.size() != 1U) {
    spdlog::error("cached record was fetched again");
    return 3;
  }

  const std::string unknown = "00000000-0000-4000-8000-000000000000";
  if (cache.get(unknown).status != core::Status::UnknownBridge || cache.get(unknown).status != core::Status::UnknownBridge) {
    spdlog::error("unknown bridge status not passed through");
    return 4;
  }
  if (upstream.calls.load() != 3 || cache.size() != 1U) {
    spdlog::error("failed lookup was cached");
    return 5;
  }

  if (cache.get(kFaulty).status != core::Status::ProviderUnavailable) {
    spdlog::error("upstream exception not mapped to provider_unavailable");
    return 6;
  }
  if (cache.get(kFaulty).status != core::Status::ProviderUnavailable || upstream.calls.load() != 5) {
    spdlog::error("failed fetch was not retried on the next lookup");
    return 7;
  }

  const auto shouting = cache.get("5D0E6A1B-7C2F-4E39-A8D4-91B3C6F2E07A");
  if (shouting.status != core::Status::Ok || shouting.record.get() != results.front().record.get() ||
      upstream.calls.load() != 5 || cache.size() != 1U) {
    spdlog::error("identifier letter case produced a separate cache entry");
    return 8;
  }

  ThrowsOnceProvider flaky;
  const records::CachingBridgeProvider flaky_cache(flaky);
  if (flaky_cache.get(kKnown).status != core::Status::ProviderUnavailable) {
    spdlog::error("non-standard upstream exception not mapped to provider_unavailable");
    return 9;
  }
  const auto recovered = flaky_cache.get(kKnown);
  if (recovered.status != core::Status::Ok || !recovered.record || flaky.calls.load() != 2 || flaky_cache.size() != 1U) {
    spdlog::error("identifier stayed unusable after a failed fetch");
    return 10;
  }

  return 0;
}
