#include "candidate_hasher.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace app {

std::vector<HashedFile> HashFiles(std::span<const std::filesystem::path> paths, uint32 threadCount) {
    std::vector<HashedFile> results(paths.size());
    if (paths.empty()) {
        return results;
    }

    if (threadCount == 0) {
        threadCount = std::max(1u, std::thread::hardware_concurrency());
    }
    threadCount = std::min<uint32>(threadCount, static_cast<uint32>(paths.size()));

    // Each worker claims the next unhashed file; every slot of results is written by exactly one worker
    std::atomic_size_t next = 0;
    auto worker = [&] {
        for (size_t i = next++; i < paths.size(); i = next++) {
            HashedFile &result = results[i];
            result.path = paths[i];
            if (!cuedat::HashFile(result.path, result.digest, result.error)) {
                result.digest = {};
            }
        }
    };

    std::vector<std::thread> threads{};
    threads.reserve(threadCount);
    for (uint32 i = 0; i < threadCount; i++) {
        threads.emplace_back(worker);
    }
    for (std::thread &thread : threads) {
        thread.join();
    }
    return results;
}

} // namespace app
