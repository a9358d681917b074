#include <gtest/gtest.h>
#include "registration_store.hpp"
#include "logger.hpp"
#include "test_support.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace devroute;
using namespace devroute::testing;

TEST(StressTest, ConcurrentDistinctRegistrations) {
    Logger::set_min_level(Logger::Level::ERROR);
    StoreOptions options;
    options.expiry_delay = std::chrono::seconds(600);
    RegistrationStore store(std::make_unique<MemoryBackend>(), options);

    const int num_threads = 8;
    const int regs_per_thread = 200;
    std::atomic<int> success_count{0};
    
    auto worker = [&](int thread_id) {
        for (int i = 0; i < regs_per_thread; ++i) {
            DeviceId id{static_cast<uint8_t>(thread_id), 0, 0, 0, 0, 0,
                        static_cast<uint8_t>(i >> 8), static_cast<uint8_t>(i & 0xff)};
            store.store(TestRegistration(id, "r" + std::to_string(thread_id) + "_" + std::to_string(i)));
            if (store.lookup(id).recipient == "r" + std::to_string(thread_id) + "_" + std::to_string(i)) {
                success_count++;
            }
        }
    };
    
    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();
    
    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Processed " << success_count << " registrations in " << diff.count() << "s" << std::endl;
    
    EXPECT_EQ(success_count, num_threads * regs_per_thread);
}

TEST(StressTest, ConcurrentDuplicateRegistrationsHaveOneWinner) {
    Logger::set_min_level(Logger::Level::ERROR);
    StoreOptions options;
    options.expiry_delay = std::chrono::seconds(600);
    RegistrationStore store(std::make_unique<MemoryBackend>(), options);

    const int num_threads = 16;
    std::atomic<int> winners{0};
    std::atomic<int> rejected{0};
    DeviceId id = make_device(7);

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&, i] {
            try {
                store.store(TestRegistration(id, "contender_" + std::to_string(i)));
                winners++;
            } catch (const Failure& e) {
                if (e.is(Nature::Structural)) rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners, 1);
    EXPECT_EQ(rejected, num_threads - 1);
    EXPECT_EQ(store.lookup(id).recipient.rfind("contender_", 0), 0u);
}
