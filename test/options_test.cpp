#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "../include/logger.hpp"
#include "../include/options.hpp"
#include "test_util.hpp"

using namespace mgen;

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = test::CreateTestDir();
    }

    void TearDown() override {
        if (!test_dir_.empty()) {
            test::RemoveTestDir(test_dir_);
        }
    }

    std::string WriteFile(const std::string& name, const std::string& content) {
        std::string path = test_dir_ + "/" + name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::string test_dir_;
};

TEST_F(OptionsTest, DefaultsAreValid) {
    GeneratorOptions options;
    EXPECT_NO_THROW(options.Validate());
    EXPECT_EQ(options.num_buckets, 3);
    EXPECT_EQ(options.mem_table_capacity, 3);
    EXPECT_FALSE(options.seed.has_value());
    EXPECT_EQ(options.manifest_size_per_entry, 100);
}

TEST_F(OptionsTest, FromJsonOverridesGivenKeys) {
    auto options = GeneratorOptions::FromJson(nlohmann::json::parse(R"({
        "num_buckets": 8,
        "seed": 42,
        "log_level": "debug",
        "unknown_key": true
    })"));

    EXPECT_EQ(options.num_buckets, 8);
    ASSERT_TRUE(options.seed.has_value());
    EXPECT_EQ(*options.seed, 42);
    EXPECT_EQ(options.log_level, "debug");
    EXPECT_EQ(options.mem_table_capacity, 3);
    EXPECT_EQ(options.manifest_size_per_entry, 100);
}

TEST_F(OptionsTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(GeneratorOptions::FromJson(nlohmann::json::parse(R"({"num_buckets": "three"})")),
                 std::invalid_argument);
    EXPECT_THROW(GeneratorOptions::FromJson(nlohmann::json::parse("[1, 2]")), std::invalid_argument);
}

TEST_F(OptionsTest, FromJsonRejectsNegativeAndFractionalNumbers) {
    for (const char* text : {R"({"mem_table_capacity": -1})", R"({"mem_table_capacity": 2.5})",
                             R"({"manifest_size_per_entry": -100})", R"({"seed": -7})",
                             R"({"seed": 1.5})", R"({"num_buckets": 2.5})",
                             R"({"num_buckets": 4294967296})"}) {
        EXPECT_THROW(GeneratorOptions::FromJson(nlohmann::json::parse(text)), std::invalid_argument)
            << text;
    }

    // A negative bucket count parses and is then rejected by Validate().
    auto options = GeneratorOptions::FromJson(nlohmann::json::parse(R"({"num_buckets": -2})"));
    EXPECT_EQ(options.num_buckets, -2);
    EXPECT_THROW(options.Validate(), std::invalid_argument);
}

TEST_F(OptionsTest, ToJsonParsesBack) {
    GeneratorOptions options;
    options.num_buckets = 5;
    options.seed = 7;
    options.log_to_stdout = true;

    auto parsed = GeneratorOptions::FromJson(options.ToJson());
    EXPECT_EQ(parsed.num_buckets, 5);
    EXPECT_EQ(parsed.seed, std::optional<uint64_t>(7));
    EXPECT_TRUE(parsed.log_to_stdout);

    GeneratorOptions unseeded;
    EXPECT_TRUE(unseeded.ToJson().at("seed").is_null());
    EXPECT_FALSE(GeneratorOptions::FromJson(unseeded.ToJson()).seed.has_value());
}

TEST_F(OptionsTest, ValidateRejectsBadValues) {
    GeneratorOptions options;
    options.num_buckets = 0;
    EXPECT_THROW(options.Validate(), std::invalid_argument);

    options = GeneratorOptions();
    options.mem_table_capacity = 1;
    EXPECT_THROW(options.Validate(), std::invalid_argument);

    options = GeneratorOptions();
    options.manifest_size_per_entry = 0;
    EXPECT_THROW(options.Validate(), std::invalid_argument);

    options = GeneratorOptions();
    options.log_level = "verbose";
    EXPECT_THROW(options.Validate(), std::invalid_argument);
}

TEST_F(OptionsTest, FromFile) {
    auto path = WriteFile("options.json", R"({"num_buckets": 2, "mem_table_capacity": 4})");
    auto options = GeneratorOptions::FromFile(path);
    EXPECT_EQ(options.num_buckets, 2);
    EXPECT_EQ(options.mem_table_capacity, 4);
}

TEST_F(OptionsTest, FromFileErrors) {
    EXPECT_THROW(GeneratorOptions::FromFile(test_dir_ + "/missing.json"), std::invalid_argument);

    auto path = WriteFile("broken.json", R"({"num_buckets": )");
    EXPECT_THROW(GeneratorOptions::FromFile(path), std::invalid_argument);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(logger::ParseLevel("debug"), logger::Level::DEBUG);
    EXPECT_EQ(logger::ParseLevel("error"), logger::Level::ERROR);
    EXPECT_THROW(logger::ParseLevel("loud"), std::invalid_argument);
}

TEST(LoggerTest, ConfigureLoggingAppliesLevel) {
    GeneratorOptions options;
    options.log_level = "error";
    options.log_to_stdout = true;
    options.ConfigureLogging();
    EXPECT_EQ(logger::Logger::instance().min_level(), logger::Level::ERROR);

    testing::internal::CaptureStdout();
    MGEN_LOG_WARNING("filtered %d", 1);
    MGEN_LOG_ERROR("kept %d", 2);
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(output.find("filtered"), std::string::npos);
    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
    EXPECT_NE(output.find("kept 2"), std::string::npos);
}

TEST(LoggerTest, FilteredArgumentsAreNotEvaluated) {
    GeneratorOptions options;
    options.log_level = "warning";
    options.log_to_stdout = true;
    options.ConfigureLogging();

    int evaluated = 0;
    auto describe = [&evaluated]() {
        ++evaluated;
        return std::string("expensive");
    };

    testing::internal::CaptureStdout();
    MGEN_LOG_DEBUG("%s", describe().c_str());
    MGEN_LOG_INFO("%s", describe().c_str());
    EXPECT_EQ(evaluated, 0);
    MGEN_LOG_WARNING("%s", describe().c_str());
    std::string output = testing::internal::GetCapturedStdout();
    EXPECT_EQ(evaluated, 1);
    EXPECT_NE(output.find("expensive"), std::string::npos);
}

TEST(LoggerTest, ConfigureWhileLogging) {
    logger::LogConfig quiet;
    quiet.min_level = logger::Level::ERROR;
    quiet.use_stdout = true;
    logger::Logger::instance().configure(quiet);

    std::atomic<bool> done{false};
    std::thread reader([&done]() {
        while (!done.load()) {
            MGEN_LOG_DEBUG("never shown %d", 0);
        }
    });
    for (int i = 0; i < 1000; ++i) {
        quiet.min_level = (i % 2 == 0) ? logger::Level::ERROR : logger::Level::WARNING;
        logger::Logger::instance().configure(quiet);
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(logger::Logger::instance().min_level(), logger::Level::WARNING);
    EXPECT_FALSE(logger::Logger::instance().enabled(logger::Level::DEBUG));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
