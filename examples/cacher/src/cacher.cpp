#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include "bytecache.h"

namespace po = boost::program_options;

using Bytes     = std::vector<uint8_t>;
using DemoCache = bytecache::MemCache<std::string, Bytes>;

void print_state(const DemoCache& cache)
{
    std::cout << "mem usage: " << cache.usage() << ", buckets: [";

    bool first = true;
    for (const auto& [used, capacity] : cache.detailed_usage()) {
        if (!first) {
            std::cout << ", ";
        }
        first = false;

        std::cout << "(" << used << ", ";
        if (capacity) {
            std::cout << *capacity;
        } else {
            std::cout << "-";
        }
        std::cout << ")";
    }

    std::cout << "]" << std::endl;
}

std::string_view trim_left(std::string_view text)
{
    const auto start = text.find_first_not_of(' ');
    return start == std::string_view::npos ? std::string_view{} : text.substr(start);
}

bool starts_with(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

void handle_set(DemoCache& cache, std::string_view arguments)
{
    const auto separator = arguments.find(' ');
    if (separator == std::string_view::npos) {
        std::cerr << "usage: set <key> <value>" << std::endl;
        return;
    }

    const std::string_view key   = arguments.substr(0, separator);
    const std::string_view value = arguments.substr(separator + 1);

    if (cache.insert(std::string{key}, Bytes{value.begin(), value.end()}) == bytecache::StoreResult::OutOfMemory) {
        std::cout << "out of memory" << std::endl;
    }
}

void handle_get(DemoCache& cache, std::string_view key)
{
    const auto value = cache.find(std::string{key});
    if (value) {
        std::cout << std::string{value->begin(), value->end()} << std::endl;
    } else {
        std::cout << "not found" << std::endl;
    }
}

int main(int argc, char** argv)
{
    po::options_description desc("Expected options");
    desc.add_options()
        ("help", "print this message")
        ("limit", po::value<uint64_t>()->default_value(40), "maximum number of value bytes held by the cache")
        ("generation-threshold", po::value<uint64_t>(), "usage at which a generation is sealed, in bytes (default: limit / 5)")
        ("generation-count", po::value<size_t>()->default_value(DemoCache::DEFAULT_GENERATION_COUNT), "number of sealed generations");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    const auto limit            = vm["limit"].as<uint64_t>();
    const auto generation_count = vm["generation-count"].as<size_t>();
    const auto generation_threshold =
        vm.count("generation-threshold") ? vm["generation-threshold"].as<uint64_t>()
                                         : std::max<uint64_t>(limit / DemoCache::DEFAULT_GENERATION_DIVISOR, 1);

    if (generation_threshold == 0) {
        std::cerr << "generation-threshold must be positive" << std::endl;
        return 1;
    }

    DemoCache cache{limit, generation_threshold, generation_count};

    std::cout << "cache max: " << limit << " bytes" << std::endl;
    std::cout << "commands: set <key> <value>, get <key>" << std::endl;

    print_state(cache);

    std::string line;
    while (std::getline(std::cin, line)) {
        const std::string_view command{line};

        if (starts_with(command, "set")) {
            handle_set(cache, trim_left(command.substr(3)));
        } else if (starts_with(command, "get")) {
            handle_get(cache, trim_left(command.substr(3)));
        }

        print_state(cache);
    }

    return 0;
}
