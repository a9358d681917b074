#include <gtest/gtest.h>
#include "metrics.hpp"
#include "registration_store.hpp"
#include "memory_backend.hpp"

using namespace devroute;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    
    reg.increment(Counter::RegistrationStored);
    reg.increment(Counter::RegistrationStored, 2);
    EXPECT_EQ(reg.get(Counter::RegistrationStored), 3u);
    EXPECT_EQ(reg.get(Counter::RegistrationExpired), 0u);
    
    std::string prometheus = reg.collect_prometheus();
    EXPECT_TRUE(prometheus.find("devroute_registration_stored_total 3\n") != std::string::npos);
    EXPECT_TRUE(prometheus.find("# TYPE devroute_registration_stored_total counter") != std::string::npos);
}

TEST(MetricsTest, ExportListsEveryCounter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    std::string prometheus = reg.collect_prometheus();
    for (size_t i = 0; i < MetricsRegistry::COUNTER_COUNT; ++i) {
        auto counter = static_cast<Counter>(i);
        std::string line = std::string(MetricsRegistry::name(counter)) + " 0\n";
        EXPECT_NE(prometheus.find(line), std::string::npos) << line;
        EXPECT_NE(prometheus.find(std::string("# HELP ") + MetricsRegistry::name(counter)), std::string::npos);
    }
}

TEST(MetricsTest, StoreConstructionRecordsNothing) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    StoreOptions options;
    options.expiry_delay = std::chrono::seconds(300);
    RegistrationStore store(std::make_unique<MemoryBackend>(), options);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_EQ(prometheus.find("gauge"), std::string::npos);
    EXPECT_EQ(prometheus.find("expiry_delay"), std::string::npos);
}

TEST(MetricsTest, Reset) {
    auto& reg = MetricsRegistry::instance();
    reg.increment(Counter::PacketsDropped);
    reg.reset();
    EXPECT_EQ(reg.get(Counter::PacketsDropped), 0u);
}
