#include <gtest/gtest.h>
#include "entry.hpp"
#include "errors.hpp"
#include "http_recipient.hpp"
#include <string>
#include <vector>
#include <random>

using namespace devroute;

TEST(FuzzTest, EntryDecoderOnlyFailsStructurally) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> len_dist(0, 40);
    std::uniform_int_distribution<int> byte_dist(0, 255);

    for (int round = 0; round < 5000; ++round) {
        std::string input;
        int len = len_dist(rng);
        for (int i = 0; i < len; ++i) {
            input += static_cast<char>(byte_dist(rng));
        }
        try {
            Entry entry = EntryCodec::decode(input);
            EXPECT_LE(entry.recipient.size(), input.size());
        } catch (const Failure& e) {
            EXPECT_EQ(e.nature(), Nature::Structural);
        }
    }
}

TEST(FuzzTest, RecipientParserHardening) {
    std::vector<std::string> malicious_inputs = {
        "{", 
        "}", 
        "{\"url\":", 
        "{\"url\":" + std::string(1000, '[') + std::string(1000, ']') + "}", 
        "null",
        "\"string\"",
        "",
        std::string(1, '\0'),
        "{\"url\": \"\\u0000\", \"method\": \"POST\"}", 
        "{\"url\": 1e1000, \"method\": \"POST\"}", 
    };
    
    for (const auto& input : malicious_inputs) {
        try {
            HttpRecipient::unmarshal_binary(input);
        } catch (const Failure& e) {
            EXPECT_EQ(e.nature(), Nature::Structural);
        }
    }
}
