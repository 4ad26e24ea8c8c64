#include <gtest/gtest.h>
#include "../src/transfer.hpp"
#include "support/fake_transport.hpp"
#include "support/test_env.hpp"
#include <sstream>
#include <vector>

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_localization();
    }
};

TEST_F(TransferTest, CopiesEverythingInBoundedChunks) {
    const std::string data(20000, 'a');
    MemoryReadStream source(data);
    std::ostringstream sink;
    std::vector<std::uint64_t> totals;

    auto total = drain(source, sink, 8192, 0, [&](std::uint64_t bytes) { totals.push_back(bytes); });

    EXPECT_EQ(total, 20000u);
    EXPECT_EQ(sink.str(), data);
    EXPECT_EQ(totals, (std::vector<std::uint64_t>{8192, 16384, 20000}));
}

TEST_F(TransferTest, TotalsIncludeInitialOffset) {
    MemoryReadStream source(std::string(300, 'b'));
    std::ostringstream sink;
    std::vector<std::uint64_t> totals;

    auto total = drain(source, sink, 100, 4096, [&](std::uint64_t bytes) { totals.push_back(bytes); });

    EXPECT_EQ(total, 4396u);
    EXPECT_EQ(sink.str().size(), 300u);
    EXPECT_EQ(totals, (std::vector<std::uint64_t>{4196, 4296, 4396}));
}

TEST_F(TransferTest, EmptySourceNeverReportsProgress) {
    MemoryReadStream source("");
    std::ostringstream sink;
    int calls = 0;

    EXPECT_EQ(drain(source, sink, 16, 7, [&](std::uint64_t) { ++calls; }), 7u);
    EXPECT_EQ(calls, 0);
}

TEST_F(TransferTest, ZeroChunkSizeIsRejected) {
    MemoryReadStream source("abc");
    std::ostringstream sink;
    EXPECT_THROW(drain(source, sink, 0, 0), InvalidRequestError);
}

TEST_F(TransferTest, ReadFailureKeepsWrittenBytes) {
    MemoryReadStream source(std::string(10000, 'c'), std::nullopt, 5000);
    std::ostringstream sink;

    try {
        drain(source, sink, 4096, 0);
        FAIL() << "Expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.bytes_transferred(), 5000u);
        EXPECT_NE(std::string(e.what()).find("connection reset by peer"), std::string::npos);
    }
    EXPECT_EQ(sink.str().size(), 5000u);
}

TEST_F(TransferTest, WriteFailureIsReported) {
    MemoryReadStream source("payload");
    std::ostringstream sink;
    sink.setstate(std::ios::badbit);

    try {
        drain(source, sink, 4, 10);
        FAIL() << "Expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.bytes_transferred(), 10u);
    }
}
