#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <tbb/concurrent_queue.h>

#include "bytecache.h"

static const std::string TRACE_PATH_ENV_VAR = "BYTECACHE_IO_TRACE_PATH";

// Number of requests replayed when no trace file is provided.
static constexpr size_t SYNTHETIC_REQUEST_COUNT = 100000;
static constexpr size_t SYNTHETIC_OBJECT_COUNT  = 20000;

std::optional<std::string> get_trace_path()
{
    const char* trace_path = std::getenv(TRACE_PATH_ENV_VAR.c_str());
    if (trace_path == nullptr || *trace_path == '\0') {
        return std::nullopt;
    }
    return std::string{trace_path};
}

/// Object fetched from the backing store on a cache miss.
/// Its size and fetch latency are derived from its URI, so that replays are reproducible.
struct Article {
    explicit Article(const std::string& uri)
    {
        std::minstd_rand rng{static_cast<std::minstd_rand::result_type>(std::hash<std::string>()(uri))};

        std::gamma_distribution<double> size_distribution{3, 0.8};
        std::gamma_distribution<double> latency_distribution{3, 0.5};

        m_size = static_cast<uint64_t>(size_distribution(rng) * 200 * 1024);

        // A few objects live on a much slower backend.
        std::bernoulli_distribution is_slow{0.01};
        m_latency_ms = static_cast<uint64_t>(latency_distribution(rng) * (is_slow(rng) ? 1000 : 100));
    }

    [[nodiscard]] uint64_t size() const
    {
        return m_size;
    }

    uint64_t m_size;
    uint64_t m_latency_ms;
};

using ArticleCache = bytecache::MemCache<std::string, std::shared_ptr<Article>, bytecache::measurement::Size<Article>, absl::Hash<std::string>, true>;

/// Load the URIs of a trace file, one request per line, the URI being the third whitespace-separated column.
std::vector<std::string> load_trace(const std::string& path)
{
    std::vector<std::string> requests;

    std::ifstream infile{path};
    if (!infile) {
        std::cerr << "Could not open trace " << path << std::endl;
        return requests;
    }

    std::string line;
    while (std::getline(infile, line)) {
        std::istringstream       iss{line};
        std::vector<std::string> columns{std::istream_iterator<std::string>(iss), {}};

        if (columns.size() < 3) {
            std::cerr << "Skipping malformed trace line: " << line << std::endl;
            continue;
        }
        requests.push_back(std::move(columns[2]));
    }

    return requests;
}

/// Generate a skewed workload where a small set of popular objects receives most requests.
std::vector<std::string> synthetic_trace()
{
    std::vector<std::string> requests;
    requests.reserve(SYNTHETIC_REQUEST_COUNT);

    std::minstd_rand                    rng{42};
    std::geometric_distribution<size_t> popularity{8.0 / SYNTHETIC_OBJECT_COUNT};

    for (size_t i = 0; i < SYNTHETIC_REQUEST_COUNT; ++i) {
        const size_t object_id = std::min(popularity(rng), SYNTHETIC_OBJECT_COUNT - 1);
        requests.push_back("/articles/" + std::to_string(object_id));
    }

    return requests;
}

const std::vector<std::string>& trace()
{
    static const std::vector<std::string> requests = [] {
        const auto path = get_trace_path();
        return path ? load_trace(*path) : synthetic_trace();
    }();
    return requests;
}

struct ReplayStats {
    std::atomic<uint64_t> operations{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> refused{0};
    std::atomic<uint64_t> total_latency_ms{0};
};

void replay(ArticleCache& cache, const std::vector<std::string>& requests, ReplayStats& stats)
{
    // At least one worker besides the main thread.
    const uint32_t nb_workers = std::max(std::thread::hardware_concurrency(), 2u) - 1;

    std::atomic<bool>                  is_feeding{true};
    tbb::concurrent_queue<std::string> work_queue;

    auto worker = [&]() {
        std::string uri;
        while (is_feeding || !work_queue.empty()) {
            if (!work_queue.try_pop(uri)) {
                std::this_thread::yield();
                continue;
            }

            ++stats.operations;
            if (cache.find(uri)) {
                continue;
            }

            auto article = std::make_shared<Article>(uri);
            stats.total_latency_ms += article->m_latency_ms;
            ++stats.misses;

            if (cache.insert(uri, std::move(article)) == bytecache::StoreResult::OutOfMemory) {
                ++stats.refused;
            }
        }
    };

    std::vector<std::thread> workers;
    for (uint32_t i = 0; i < nb_workers; ++i) {
        workers.emplace_back(worker);
    }

    for (const auto& uri : requests) {
        work_queue.push(uri);
    }
    is_feeding = false;

    for (auto& thread : workers) {
        thread.join();
    }
}

void report(const ArticleCache& cache, const ReplayStats& stats)
{
    const auto operations = static_cast<double>(std::max<uint64_t>(stats.operations.load(), 1));
    const auto misses     = static_cast<double>(std::max<uint64_t>(stats.misses.load(), 1));
    const auto latency    = static_cast<double>(stats.total_latency_ms.load());

    std::cout << "Hit Rate: " << cache.hit_rate() * 100 << "%" << std::endl;
    std::cout << "Byte Hit Rate: " << cache.byte_hit_rate() / 1000 << "kb/request" << std::endl;
    std::cout << "Avg. Latency: " << latency / operations << "ms" << std::endl;
    std::cout << "Avg. Miss Latency: " << latency / misses << "ms" << std::endl;
    std::cout << "Refused Insertions: " << stats.refused.load() << std::endl;

    std::cout << "Bands:";
    for (const auto band_usage : cache.simple_usage()) {
        std::cout << " " << band_usage;
    }
    std::cout << std::endl;
}

class CacheSizeFixture : public testing::TestWithParam<uint64_t>
{
public:
    static std::vector<uint64_t> get_tested_sizes()
    {
        std::vector<uint64_t> sizes;

        // From 1mb to 512mb.
        for (uint64_t i = 1; i <= 512; i *= 2) {
            sizes.push_back(1024 * 1024 * i);
        }

        return sizes;
    }

protected:
    void run(ArticleCache& cache)
    {
        ReplayStats stats;
        replay(cache, trace(), stats);
        report(cache, stats);

        EXPECT_EQ(stats.operations.load(), trace().size());
        EXPECT_LE(cache.usage(), cache.limit());

        uint64_t stored_bytes = 0;
        cache.for_each([&](const std::string& /* uri */, const std::shared_ptr<Article>& article) { stored_bytes += article->size(); });
        EXPECT_EQ(cache.usage(), stored_bytes);
    }
};

INSTANTIATE_TEST_SUITE_P(AccuracyBenchmark, CacheSizeFixture, testing::ValuesIn(CacheSizeFixture::get_tested_sizes()));

TEST_P(CacheSizeFixture, IO_DEFAULT_GENERATIONS)
{
    ArticleCache cache{GetParam()};
    run(cache);
}

TEST_P(CacheSizeFixture, IO_FINE_GENERATIONS)
{
    // Smaller generations approximate recency more closely, at the cost of more frequent rotations.
    const uint64_t limit = GetParam();
    ArticleCache   cache{limit, std::max<uint64_t>(limit / 11, 1), 8};
    run(cache);
}

TEST_P(CacheSizeFixture, IO_SINGLE_GENERATION)
{
    const uint64_t limit = GetParam();
    ArticleCache   cache{limit, std::max<uint64_t>(limit / 2, 1), 1};
    run(cache);
}
