// D4.2 — Persistence: key-value stores and per-instrument repository

#include "cm/persistence/DrawingRepository.hpp"
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

namespace {

class ReadOnlyStore : public cm::KeyValueStore {
public:
  bool get(const std::string&, std::string&) const override { return false; }
  bool set(const std::string&, const std::string&) override { return false; }
  bool remove(const std::string&) override { return false; }
};

std::vector<cm::Drawing> sampleSet() {
  cm::Drawing a;
  a.id = 1;
  a.type = cm::DrawingType::Segment;
  a.points = {{10, 100}, {20, 110}};
  cm::Drawing b;
  b.id = 2;
  b.type = cm::DrawingType::Fibonacci;
  b.points = {{30, 80}, {40, 60}};
  b.config = cm::FibonacciConfig{};
  return {a, b};
}

} // namespace

int main() {
  // ---- Test 1: Memory store ----
  {
    cm::MemoryKeyValueStore store;
    std::string v;
    requireTrue(!store.get("k", v), "absent key");
    requireTrue(store.set("k", "payload"), "set");
    requireTrue(store.get("k", v) && v == "payload", "get");
    requireTrue(store.remove("k"), "remove");
    requireTrue(!store.remove("k"), "second remove");
    requireTrue(store.size() == 0, "empty");

    std::printf("  Test 1 (memory store): PASS\n");
  }

  // ---- Test 2: Repository keys and reload ----
  {
    cm::MemoryKeyValueStore store;
    cm::DrawingRepository repo(store);
    requireTrue(cm::DrawingRepository::storageKey("BTCUSD") == "drawings_BTCUSD", "key format");

    auto set = sampleSet();
    requireTrue(repo.save("BTCUSD", set), "save");
    std::string raw;
    requireTrue(store.get("drawings_BTCUSD", raw) && !raw.empty(), "stored under key");

    std::vector<cm::Drawing> loaded;
    requireTrue(repo.load("BTCUSD", loaded), "load");
    requireTrue(loaded == set, "same drawings");

    requireTrue(!repo.load("ETHUSD", loaded), "missing instrument");
    requireTrue(loaded.empty(), "empty set for missing");

    std::printf("  Test 2 (repository): PASS\n");
  }

  // ---- Test 3: Corrupt payload ----
  {
    cm::MemoryKeyValueStore store;
    store.set("drawings_X", "[{\"id\":1,");
    cm::DrawingRepository repo(store);
    std::vector<cm::Drawing> loaded = sampleSet();
    requireTrue(!repo.load("X", loaded), "corrupt fails");
    requireTrue(loaded.empty(), "empty set for corrupt");

    std::printf("  Test 3 (corrupt payload): PASS\n");
  }

  // ---- Test 4: Failing store ----
  {
    ReadOnlyStore store;
    cm::DrawingRepository repo(store);
    requireTrue(!repo.save("X", sampleSet()), "save reports failure");

    std::printf("  Test 4 (failing store): PASS\n");
  }

  // ---- Test 5: File store ----
  {
    cm::FileKeyValueStore store(".");
    requireTrue(store.pathForKey("drawings_a/b c") == "./drawings_a_b_c.json", "sanitized path");
    requireTrue(cm::FileKeyValueStore("out/").pathForKey("k") == "out/k.json", "trailing slash");

    cm::DrawingRepository repo(store);
    auto set = sampleSet();
    requireTrue(repo.save("cm_test/instrument", set), "file save");
    std::vector<cm::Drawing> loaded;
    requireTrue(repo.load("cm_test/instrument", loaded), "file load");
    requireTrue(loaded == set, "file round trip");
    requireTrue(store.remove("drawings_cm_test/instrument"), "file removed");
    requireTrue(!repo.load("cm_test/instrument", loaded), "gone after remove");

    cm::FileKeyValueStore missing("./cm_no_such_dir_for_tests");
    requireTrue(!missing.set("k", "v"), "write into missing directory fails");

    std::printf("  Test 5 (file store): PASS\n");
  }

  std::printf("D4.2 persistence: ALL PASS\n");
  return 0;
}
