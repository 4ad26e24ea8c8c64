#include <gtest/gtest.h>
#include "../src/hash.hpp"
#include "../src/exception.hpp"
#include "support/test_env.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class HashTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        init_test_localization();
        suite_work_dir = fs::absolute("tmp_hash_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }

    fs::path create_dummy_file(const std::string& name, const std::string& content) {
        fs::path p = suite_work_dir / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p;
    }
};

TEST_F(HashTest, CalculateSHA256) {
    auto path = create_dummy_file("test.txt", "hello world");
    // echo -n "hello world" | sha256sum
    EXPECT_EQ(calculate_sha256(path), "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(HashTest, CalculateMD5) {
    auto path = create_dummy_file("test.txt", "hello world");
    // echo -n "hello world" | md5sum
    EXPECT_EQ(calculate_md5(path), "5eb63bbbe01eeed093cb22bb8f5acdc3");
}

TEST_F(HashTest, EmptyFile) {
    auto path = create_dummy_file("empty", "");
    EXPECT_EQ(calculate_md5(path), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(HashTest, AlgorithmFollowsDigestLength) {
    EXPECT_EQ(digest_algorithm_for(std::string(32, 'a')), DigestAlgorithm::MD5);
    EXPECT_EQ(digest_algorithm_for(std::string(64, 'F')), DigestAlgorithm::SHA256);
    EXPECT_THROW(digest_algorithm_for(std::string(40, 'a')), InvalidRequestError);
    EXPECT_THROW(digest_algorithm_for(std::string(32, 'g')), InvalidRequestError);
    EXPECT_THROW(digest_algorithm_for(""), InvalidRequestError);
}

TEST_F(HashTest, VerifyIsCaseInsensitive) {
    auto path = create_dummy_file("data.bin", "hello world");
    EXPECT_TRUE(verify_checksum(path, "5EB63BBBE01EEED093CB22BB8F5ACDC3"));
    EXPECT_TRUE(verify_checksum(path, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9"));
}

TEST_F(HashTest, VerifyDetectsMismatch) {
    auto path = create_dummy_file("data.bin", "hello world!");
    EXPECT_FALSE(verify_checksum(path, "5eb63bbbe01eeed093cb22bb8f5acdc3"));
}

TEST_F(HashTest, MissingFileThrows) {
    EXPECT_THROW(calculate_sha256(suite_work_dir / "missing"), FilesystemError);
}
