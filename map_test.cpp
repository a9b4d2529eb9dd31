// map_test.cpp
// Correctness tests for CoarseMap and StripedMap
// -------------------------------------------------------------------
// Sequential equivalence against std::unordered_map, configuration
// handling, resize accounting, the concurrent put scenarios, removes
// racing lookups, exception neutrality and linearizability of recorded
// histories.

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "syncds/syncds.hpp"

#include "history.hpp"
#include "print.hpp"
#include "test_case.hpp"
#include "thread/start_gate.hpp"

namespace {

using syncds::MapConfig;
using util::outcome;
using IntCoarseMap = syncds::CoarseMap<int, int>;
using IntStripedMap = syncds::StripedMap<int, int>;

MapConfig small_config(size_t buckets, size_t stripes, double load = 0.75) {
    MapConfig config;
    config.initial_bucket_count = buckets;
    config.stripe_count = stripes;
    config.load_factor_threshold = load;
    return config;
}

// std::hash<int> that throws for the key `poisoned` while armed.
struct PoisonHash {
    std::shared_ptr<std::atomic<bool>> armed = std::make_shared<std::atomic<bool>>(false);
    int poisoned = 0;

    size_t operator()(int key) const {
        if (key == poisoned && armed->load())
            throw std::runtime_error("poisoned hash");
        return std::hash<int>{}(key);
    }
};

// Value whose move assignment may throw; maps refuse to store it.
struct ThrowingAssign {
    int v = 0;
    ThrowingAssign() = default;
    ThrowingAssign(ThrowingAssign&&) noexcept = default;
    ThrowingAssign& operator=(ThrowingAssign&& other) {
        if (other.v < 0)
            throw std::runtime_error("assign");
        v = other.v;
        return *this;
    }
};

static_assert(syncds::nothrow_entry_v<int, int>);
static_assert(syncds::nothrow_entry_v<std::string, std::unique_ptr<int>>);
static_assert(!syncds::nothrow_entry_v<int, ThrowingAssign>);
static_assert(!syncds::nothrow_entry_v<ThrowingAssign, int>);

template <typename Map>
void test_put_overwrite_returns_previous(outcome& out) {
    auto map = Map::make();
    out.expect(!map->put("a", 1).has_value(), "first put returns none");
    out.expect(map->put("a", 2) == std::optional<int>(1), "overwrite returns previous");
    out.expect(map->get("a") == std::optional<int>(2), "get sees overwrite");
    out.expect(map->size() == 1, "overwrite does not grow size");

    out.expect(!map->get("b").has_value(), "absent get");
    out.expect(!map->remove("b").has_value(), "absent remove");
    out.expect(map->remove("a") == std::optional<int>(2), "remove returns value");
    out.expect(!map->contains("a") && map->empty(), "empty after remove");
    out.expect(map->validate(), "validate");
}

// Overwrite and remove hand back the stored object itself, never a copy,
// and leave the new value in place.
template <template <typename, typename, typename, typename> class MapT>
void test_move_only_values(outcome& out) {
    MapT<int, std::unique_ptr<int>, std::hash<int>, std::equal_to<int>> map(small_config(2, 2));
    for (int k = 0; k < 8; ++k)
        map.put(k, std::make_unique<int>(k));

    auto fresh = std::make_unique<int>(70);
    const int* fresh_address = fresh.get();
    std::optional<std::unique_ptr<int>> previous = map.put(7, std::move(fresh));
    out.expect(previous && *previous && **previous == 7, "overwrite returns the old object");

    std::optional<std::unique_ptr<int>> removed = map.remove(7);
    out.expect(removed && removed->get() == fresh_address, "remove returns the stored object");
    out.expect(map.remove(0) && map.size() == 6, "remove keeps the other entries");
    for (int k = 1; k < 7; ++k)
        out.expect(map.contains(k), util::format("key {} survives neighbouring removes", k));
    out.expect(map.validate(), "validate");
}

// Single-threaded runs match std::unordered_map exactly, across resizes.
template <typename Map>
void test_sequential_equivalence(outcome& out) {
    Map map(small_config(2, 2));
    std::unordered_map<int, int> reference;
    std::mt19937 rng(11);
    std::uniform_int_distribution<int> key(0, 999);
    std::uniform_int_distribution<int> op(0, 3);

    auto as_optional = [&reference](int k) -> std::optional<int> {
        auto it = reference.find(k);
        if (it == reference.end())
            return std::nullopt;
        return it->second;
    };

    size_t mismatches = 0;
    for (int i = 0; i < 40000; ++i) {
        const int k = key(rng);
        switch (op(rng)) {
        case 0:
        case 1:
            mismatches += map.put(k, i) != as_optional(k);
            reference[k] = i;
            break;
        case 2:
            mismatches += map.remove(k) != as_optional(k);
            reference.erase(k);
            break;
        default:
            mismatches += map.get(k) != as_optional(k);
            mismatches += map.contains(k) != (reference.count(k) == 1);
            break;
        }
    }
    out.expect(mismatches == 0, util::format("{} results differ from std::unordered_map", mismatches));
    out.expect(map.size() == reference.size(), "size matches");
    size_t wrong = 0;
    for (const auto& [k, v] : reference)
        wrong += map.get(k) != std::optional<int>(v);
    out.expect(wrong == 0, util::format("{} final values differ", wrong));
    out.expect(map.resize_count() > 0, "the table grew");
    out.expect(map.validate(), "validate");
}

void test_config_rejected(outcome& out) {
    using std::invalid_argument;
    out.expect(util::throws<invalid_argument>([] { IntCoarseMap m(small_config(0, 4)); }), "coarse: 0 buckets");
    out.expect(util::throws<invalid_argument>([] { IntStripedMap m(small_config(0, 4)); }), "striped: 0 buckets");
    out.expect(util::throws<invalid_argument>([] { IntStripedMap m(small_config(16, 0)); }), "striped: 0 stripes");
    out.expect(util::throws<invalid_argument>([] { IntStripedMap m(small_config(16, 4, 0.0)); }),
               "zero threshold");
    out.expect(util::throws<invalid_argument>([] { IntCoarseMap m(small_config(16, 4, -1.0)); }),
               "negative threshold");
    out.expect(util::throws<invalid_argument>([] {
                   IntStripedMap m(small_config(16, 4, std::numeric_limits<double>::quiet_NaN()));
               }),
               "NaN threshold");
    out.expect(util::throws<invalid_argument>([] {
                   IntCoarseMap m(small_config(16, 4, std::numeric_limits<double>::infinity()));
               }),
               "infinite threshold");
    out.expect(util::throws<invalid_argument>([] { MapConfig::for_capacity(100, 0.0); }),
               "for_capacity with zero threshold");

    IntCoarseMap coarse(small_config(8, 1, 2.0));
    out.expect(coarse.bucket_count() == 8, "coarse keeps its bucket count");
    out.expect(coarse.config().load_factor_threshold == 2.0, "threshold kept");
}

// Capacities no size_t bucket count can hold are refused instead of
// doubling forever.
void test_for_capacity_limits(outcome& out) {
    const size_t max = std::numeric_limits<size_t>::max();
    out.expect(util::throws<std::length_error>([&] { MapConfig::for_capacity(max); }), "SIZE_MAX entries");
    out.expect(util::throws<std::length_error>([&] { MapConfig::for_capacity(max / 2); }), "SIZE_MAX/2 entries");
    out.expect(util::throws<std::length_error>([] { MapConfig::for_capacity(1000, 1e-300); }),
               "vanishing threshold");

    out.expect(MapConfig::for_capacity(0).initial_bucket_count == MapConfig::DEFAULT_BUCKETS, "empty");
    out.expect(MapConfig::for_capacity(size_t{1} << 40).initial_bucket_count == size_t{1} << 41,
               "2^40 entries need 2^41 buckets");
    out.expect(MapConfig::for_capacity(size_t{1} << 40, 1.0).initial_bucket_count == size_t{1} << 40,
               "threshold 1.0 fits exactly");
}

void test_striped_bucket_rounding(outcome& out) {
    IntStripedMap uneven(small_config(12, 8));
    out.expect(uneven.stripe_count() == 8, "stripe count fixed");
    out.expect(uneven.bucket_count() == 16, "12 buckets round up to 16");
    out.expect(uneven.config().initial_bucket_count == 16, "effective config reports 16");

    IntStripedMap few(small_config(4, 8));
    out.expect(few.bucket_count() == 8, "4 buckets round up to 8");

    IntStripedMap defaults;
    out.expect(defaults.bucket_count() == MapConfig::DEFAULT_BUCKETS, "default buckets");
    out.expect(defaults.stripe_count() == MapConfig::DEFAULT_STRIPES, "default stripes");
}

// Each threshold crossing doubles the table exactly once; removes never
// shrink it; every key survives every resize.
template <typename Map>
void test_resize_once_per_crossing(outcome& out) {
    constexpr int KEYS = 3000;
    Map map(small_config(16, 4));

    size_t expected_buckets = 16;
    size_t expected_resizes = 0;
    int off_track = 0;
    for (int k = 0; k < KEYS; ++k) {
        if (static_cast<double>(k + 1) > 0.75 * static_cast<double>(expected_buckets)) {
            expected_buckets *= 2;
            ++expected_resizes;
        }
        map.put(k, k * 2);
        if (map.bucket_count() != expected_buckets || map.resize_count() != expected_resizes ||
            map.load_factor() > 0.75)
            ++off_track;
    }
    out.expect(off_track == 0, util::format("{} inserts left the expected growth curve", off_track));

    // Overwrites are not insertions.
    for (int k = 0; k < KEYS; ++k)
        map.put(k, k * 3);
    out.expect(map.resize_count() == expected_resizes, "overwrites never resize");

    int wrong = 0;
    for (int k = 0; k < KEYS; ++k)
        wrong += map.get(k) != std::optional<int>(k * 3);
    out.expect(wrong == 0, util::format("{} keys lost across resizes", wrong));
    for (int k = 0; k < KEYS; k += 2)
        map.remove(k);
    out.expect(map.bucket_count() == expected_buckets, "removes never shrink");
    out.expect(map.size() == KEYS / 2, "half the keys remain");
    out.expect(map.validate(), "validate");
}

template <typename Map>
void test_for_capacity_avoids_resize(outcome& out) {
    const MapConfig config = MapConfig::for_capacity(1000);
    out.expect(config.initial_bucket_count == 2048, "1000 entries need 2048 buckets");

    Map map(config);
    for (int k = 0; k < 1000; ++k)
        map.put(k, k);
    out.expect(map.resize_count() == 0 && map.bucket_count() == 2048, "no resize");
}

// 8 threads put disjoint key ranges through cloned handles.
template <typename Map>
void test_disjoint_puts(outcome& out) {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 2000;

    auto map = Map::make(small_config(16, 8));
    std::atomic<int> replaced{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([map, t, &replaced] {
            for (int k = t * PER_THREAD; k < (t + 1) * PER_THREAD; ++k)
                if (map->put(k, -k))
                    replaced++;
        });
    }
    for (auto& th : threads)
        th.join();

    out.expect(replaced.load() == 0, "no disjoint put saw a previous value");
    out.expect(map->size() == THREADS * PER_THREAD, "size 16000");
    int wrong = 0;
    for (int k = 0; k < THREADS * PER_THREAD; ++k)
        wrong += map->get(k) != std::optional<int>(-k);
    out.expect(wrong == 0, util::format("{} keys missing or wrong", wrong));
    out.expect(map->validate(), "validate");
}

// Entries a striped table may hold between resizes: the threshold plus
// one racing insertion on each other stripe.
bool within_overshoot(const IntStripedMap& map) {
    const double limit = std::floor(map.config().load_factor_threshold *
                                    static_cast<double>(map.bucket_count())) +
                         static_cast<double>(map.stripe_count() - 1);
    return static_cast<double>(map.size()) <= limit;
}

// 16 threads x 6250 random puts over 10 000 shared keys, S = 8, 16 buckets.
// Value t * 10000 + i identifies put number i of thread t, so every
// returned previous value can be traced to the put that wrote it.
template <typename Map>
void test_shared_key_space_puts(outcome& out) {
    constexpr int THREADS = 16;
    constexpr int PUTS = 6250;
    constexpr int KEY_SPACE = 10000;

    auto map = Map::make(small_config(16, 8));
    std::vector<std::vector<int>> keys(THREADS, std::vector<int>(PUTS));
    std::vector<std::vector<std::optional<int>>> previous(THREADS, std::vector<std::optional<int>>(PUTS));
    for (int t = 0; t < THREADS; ++t) {
        std::mt19937 rng(1000 + t);
        std::uniform_int_distribution<int> key(0, KEY_SPACE - 1);
        for (int& k : keys[t])
            k = key(rng);
    }

    util::start_gate gate;
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, map, t] {
            gate.wait();
            for (int i = 0; i < PUTS; ++i)
                previous[t][i] = map->put(keys[t][i], t * 10000 + i);
        });
    }
    gate.open_when(THREADS);
    for (auto& th : threads)
        th.join();

    // Last value each thread wrote to each key.
    std::unordered_map<int, std::vector<int>> last_writes;
    std::unordered_set<int> distinct;
    for (int t = 0; t < THREADS; ++t) {
        std::unordered_map<int, int> last;
        for (int i = 0; i < PUTS; ++i)
            last[keys[t][i]] = t * 10000 + i;
        for (const auto& [k, v] : last) {
            last_writes[k].push_back(v);
            distinct.insert(k);
        }
    }

    size_t first_writes = 0;
    size_t foreign = 0;
    for (int t = 0; t < THREADS; ++t) {
        for (int i = 0; i < PUTS; ++i) {
            if (!previous[t][i]) {
                ++first_writes;
                continue;
            }
            const int v = *previous[t][i];
            foreign += keys[v / 10000][v % 10000] != keys[t][i];
        }
    }
    out.expect(foreign == 0, util::format("{} puts returned a value written to another key", foreign));

    out.expect(first_writes == distinct.size(), "exactly one first write per key");
    out.expect(map->size() == distinct.size(), "size equals distinct keys");
    size_t stale = 0;
    for (const auto& [k, candidates] : last_writes) {
        const std::optional<int> got = map->get(k);
        stale += !got || std::find(candidates.begin(), candidates.end(), *got) == candidates.end();
    }
    out.expect(stale == 0, util::format("{} keys do not hold a last write", stale));
    out.expect(map->validate(), "validate");
    util::println("    {} distinct keys, {} buckets after {} resizes", distinct.size(),
                  map->bucket_count(), map->resize_count());
}

// Readers sampling bucket_count() during concurrent growth only ever see
// initial * 2^k, never a smaller value than before.  At rest the entry
// count stays within the threshold plus one racing insert per other stripe.
void test_resize_snapshots_are_legal(outcome& out) {
    constexpr int WRITERS = 8;
    constexpr int PER_WRITER = 2500;
    constexpr size_t INITIAL = 4;

    IntStripedMap map(small_config(INITIAL, 4));
    std::atomic<bool> done{false};
    std::atomic<int> illegal{0};
    std::atomic<int> overshoot{0};
    std::atomic<long> samples{0};

    std::thread poller([&] {
        size_t last = INITIAL;
        while (!done.load(std::memory_order_acquire)) {
            const size_t now = map.bucket_count();
            const bool power_multiple = now % INITIAL == 0 && ((now / INITIAL) & (now / INITIAL - 1)) == 0;
            if (!power_multiple || now < last)
                illegal++;
            last = now;
            samples++;
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < WRITERS; ++w) {
        writers.emplace_back([&, w] {
            for (int k = w; k < WRITERS * PER_WRITER; k += WRITERS) {
                map.put(k, k);
                if (k % 7 == 0 && map.get(k) != std::optional<int>(k))
                    illegal++;
            }
        });
    }
    for (auto& th : writers)
        th.join();
    done.store(true, std::memory_order_release);
    poller.join();

    // 20 000 entries at 0.75 need 32 768 buckets: 13 doublings from 4.
    out.expect(illegal.load() == 0, "bucket counts seen were legal and monotonic");
    out.expect(map.size() == WRITERS * PER_WRITER, "size 20000");
    out.expect(map.bucket_count() == 32768, "32768 buckets");
    out.expect(map.resize_count() == 13, "13 resizes");
    out.expect(within_overshoot(map), "entry count within threshold + S - 1");
    int missing = 0;
    for (int k = 0; k < WRITERS * PER_WRITER; ++k)
        missing += !map.contains(k);
    out.expect(missing == 0, util::format("{} keys missing", missing));
    out.expect(map.validate(), "validate");
    util::println("    {} bucket_count samples taken", samples.load());

    // Racing inserts straddling a threshold on a 4-stripe, 4-bucket table.
    for (int trial = 0; trial < 200; ++trial) {
        IntStripedMap racing(small_config(4, 4));
        util::start_gate gate;
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t] {
                gate.wait();
                for (int k = t; k < 64; k += 4)
                    racing.put(k, k);
            });
        }
        gate.open_when(4);
        for (auto& th : threads)
            th.join();
        if (!within_overshoot(racing) || racing.size() != 64)
            overshoot++;
    }
    out.expect(overshoot.load() == 0, "racing inserts overshoot by at most S - 1");
}

// Owners cycle put/remove on their own keys while readers get everything.
// A reader may see a key absent or holding a value its owner wrote.
template <typename Map>
void test_remove_get_race(outcome& out) {
    constexpr int OWNERS = 4;
    constexpr int READERS = 4;
    constexpr int KEYS = 512;
    constexpr int ROUNDS = 200;

    Map map(small_config(4, 4));
    std::atomic<bool> stop{false};
    std::atomic<long> foreign{0};
    std::vector<std::thread> readers;
    for (int r = 0; r < READERS; ++r) {
        readers.emplace_back([&] {
            while (!stop.load(std::memory_order_acquire)) {
                for (int k = 0; k < KEYS; ++k) {
                    const std::optional<int> v = map.get(k);
                    if (v && *v / 1000 != k)
                        foreign++;
                }
            }
        });
    }

    std::vector<std::thread> owners;
    for (int o = 0; o < OWNERS; ++o) {
        owners.emplace_back([&, o] {
            size_t wrong = 0;
            for (int round = 0; round < ROUNDS; ++round) {
                for (int k = o; k < KEYS; k += OWNERS)
                    wrong += map.put(k, k * 1000 + round).has_value();
                for (int k = o; k < KEYS; k += OWNERS)
                    wrong += map.get(k) != std::optional<int>(k * 1000 + round);
                for (int k = o; k < KEYS; k += OWNERS)
                    wrong += map.remove(k) != std::optional<int>(k * 1000 + round);
            }
            out.expect(wrong == 0, util::format("owner {}: {} wrong results", o, wrong));
        });
    }
    for (auto& th : owners)
        th.join();
    stop.store(true, std::memory_order_release);
    for (auto& th : readers)
        th.join();

    out.expect(foreign.load() == 0, "readers only saw values written to their key");
    out.expect(map.empty(), "empty afterwards");
    out.expect(map.validate(), "validate");
}

// A throwing Hash, either on the caller's key or midway through a rehash,
// leaves the map exactly as it was and every lock released.
template <template <typename, typename, typename, typename> class MapT>
void test_throwing_hash_leaves_map_intact(outcome& out) {
    PoisonHash hash;
    hash.poisoned = 0;
    MapT<int, int, PoisonHash, std::equal_to<int>> map(small_config(16, 4), hash);

    for (int k = 0; k < 12; ++k)
        map.put(k, k);
    out.expect(map.bucket_count() == 16, "12 entries fit 16 buckets");

    hash.armed->store(true);
    out.expect(util::throws<std::runtime_error>([&] { map.get(0); }), "get throws");
    out.expect(util::throws<std::runtime_error>([&] { map.put(0, 100); }), "put throws");
    // The 13th entry crosses 0.75 * 16; rehashing key 0 throws.
    out.expect(util::throws<std::runtime_error>([&] { map.put(100, 100); }), "rehash throws");
    out.expect(!map.get(100).has_value(), "failed insert left nothing behind");
    out.expect(map.size() == 12 && map.bucket_count() == 16 && map.resize_count() == 0,
               "size and table unchanged");

    hash.armed->store(false);
    std::thread other([&] { out.expect(!map.put(100, 100).has_value(), "put from another thread"); });
    other.join();
    out.expect(map.bucket_count() == 32, "grown once the hash recovers");
    int wrong = 0;
    for (int k = 0; k < 12; ++k)
        wrong += map.get(k) != std::optional<int>(k);
    out.expect(wrong == 0, "original entries intact");
    out.expect(map.validate(), "validate");
}

// Short concurrent histories over 4 keys on a 2-bucket table, so resizes
// happen inside the recorded window.
template <typename Map>
void test_linearizable_histories(outcome& out) {
    constexpr int HISTORIES = 150;
    constexpr int THREADS = 3;
    constexpr int OPS = 6;
    constexpr int KEYS = 4;

    auto optional_to_int = [](const std::optional<int>& v) { return v ? *v : -1; };

    int rejected = 0;
    for (int h = 0; h < HISTORIES; ++h) {
        Map map(small_config(2, 2));
        util::history_recorder recorder;
        util::start_gate gate;
        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; ++t) {
            threads.emplace_back([&, t] {
                std::mt19937 rng(h * THREADS + t);
                std::uniform_int_distribution<int> key(0, KEYS - 1);
                std::uniform_int_distribution<int> value(0, 99);
                std::uniform_int_distribution<int> op(0, 2);
                gate.wait();
                for (int i = 0; i < OPS; ++i) {
                    const int k = key(rng);
                    const int v = value(rng);
                    switch (op(rng)) {
                    case util::map_model::PUT:
                        recorder.call(util::map_model::PUT, k, v,
                                      [&] { return optional_to_int(map.put(k, v)); });
                        break;
                    case util::map_model::GET:
                        recorder.call(util::map_model::GET, k, 0,
                                      [&] { return optional_to_int(map.get(k)); });
                        break;
                    default:
                        recorder.call(util::map_model::REMOVE, k, 0,
                                      [&] { return optional_to_int(map.remove(k)); });
                        break;
                    }
                }
            });
        }
        gate.open_when(THREADS);
        for (auto& th : threads)
            th.join();

        if (!util::linearizable(recorder.events(), util::map_model{}))
            ++rejected;
    }
    out.expect(rejected == 0, util::format("{} of {} histories not linearizable", rejected, HISTORIES));
}

template <typename IntMap, typename StringMap>
size_t run_map_suite(const std::string& name) {
    size_t failures = 0;
    failures += !util::run_case(name + " put returns previous", test_put_overwrite_returns_previous<StringMap>);
    failures += !util::run_case(name + " sequential equivalence", test_sequential_equivalence<IntMap>);
    failures += !util::run_case(name + " resize once per crossing", test_resize_once_per_crossing<IntMap>);
    failures += !util::run_case(name + " for_capacity avoids resize", test_for_capacity_avoids_resize<IntMap>);
    failures += !util::run_case(name + " disjoint puts", test_disjoint_puts<IntMap>);
    failures += !util::run_case(name + " shared key space puts (16x6250)", test_shared_key_space_puts<IntMap>);
    failures += !util::run_case(name + " remove vs get race", test_remove_get_race<IntMap>);
    failures += !util::run_case(name + " linearizable histories", test_linearizable_histories<IntMap>);
    return failures;
}

}  // namespace

int main() {
    util::println("==== syncds map tests ({} hardware threads) ====",
                  std::thread::hardware_concurrency());

    size_t failures = 0;
    failures += !util::run_case("MapConfig rejects unusable settings", test_config_rejected);
    failures += !util::run_case("MapConfig::for_capacity limits", test_for_capacity_limits);

    failures += run_map_suite<IntCoarseMap, syncds::CoarseMap<std::string, int>>("CoarseMap");
    failures += !util::run_case("CoarseMap move-only values", test_move_only_values<syncds::CoarseMap>);
    failures += !util::run_case("CoarseMap throwing hash", test_throwing_hash_leaves_map_intact<syncds::CoarseMap>);

    failures += run_map_suite<IntStripedMap, syncds::StripedMap<std::string, int>>("StripedMap");
    failures += !util::run_case("StripedMap move-only values", test_move_only_values<syncds::StripedMap>);
    failures += !util::run_case("StripedMap bucket rounding", test_striped_bucket_rounding);
    failures += !util::run_case("StripedMap resize snapshots", test_resize_snapshots_are_legal);
    failures += !util::run_case("StripedMap throwing hash",
                                test_throwing_hash_leaves_map_intact<syncds::StripedMap>);

    if (failures == 0) {
        util::println("==== MAP TESTS PASSED ====");
        return 0;
    }
    util::eprintln("==== MAP TESTS FAILED: {} cases ====", failures);
    return 1;
}
