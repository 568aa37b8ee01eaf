#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/key_value_generator.hpp"
#include "../include/manifest_generator.hpp"
#include "../include/options.hpp"
#include "test_util.hpp"

using namespace mgen;

class ManifestGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.num_buckets = 3;
        options_.mem_table_capacity = 3;
        options_.seed = 20211110;
        partition_ = test::Partition("20211110", 8);
    }

    // Generator over a stub supplier; `stub` stays valid while the generator lives.
    std::unique_ptr<ManifestTestDataGenerator> StubGenerator(test::StubDataFileSupplier*& stub) {
        auto supplier = std::make_unique<test::StubDataFileSupplier>();
        stub = supplier.get();
        return std::make_unique<ManifestTestDataGenerator>(options_, std::move(supplier));
    }

    DataFile NewFile(const std::string& name, int bucket = 0, size_t records = 1) {
        return test::MakeFile(name, partition_, bucket, 0, test::MakeRecords(records, next_seq_));
    }

    // Calls Next() until the current step's buffer is drained.
    static std::vector<ManifestEntry> DrainStep(ManifestTestDataGenerator& gen) {
        std::vector<ManifestEntry> entries;
        do {
            entries.push_back(gen.Next());
        } while (gen.PendingEntries() > 0);
        return entries;
    }

    static std::string Describe(const ManifestEntry& e) {
        return std::string(ValueKindName(e.kind)) + " " + e.file->file_name;
    }

    GeneratorOptions options_;
    Row partition_;
    uint64_t next_seq_ = 0;
};

TEST_F(ManifestGeneratorTest, StepEntriesAreReturnedNewestFirst) {
    test::StubDataFileSupplier* stub = nullptr;
    auto gen = StubGenerator(stub);
    for (const char* name : {"f1", "f2", "f3", "f4"}) {
        stub->new_files.push_back(NewFile(name));
    }

    EXPECT_EQ(Describe(gen->Next()), "ADD f1");
    EXPECT_EQ(gen->PendingEntries(), 0);
    EXPECT_EQ(Describe(gen->Next()), "ADD f2");
    EXPECT_EQ(Describe(gen->Next()), "ADD f3");

    // The fourth file overflows level 0; the step pushes
    // ADD f4, DELETE f1..f4, ADD merged and hands them out in reverse.
    std::vector<std::string> returned;
    for (const auto& e : DrainStep(*gen)) {
        returned.push_back(Describe(e));
    }
    std::vector<std::string> expected = {
        "ADD merged-L1-0", "DELETE f4", "DELETE f3", "DELETE f2", "DELETE f1", "ADD f4"};
    EXPECT_EQ(returned, expected);
    EXPECT_EQ(gen->NumSteps(), 4);
    EXPECT_EQ(gen->NumMerges(), 1);

    const auto& levels = gen->State().LevelsFor(0, partition_);
    ASSERT_EQ(levels.size(), 2);
    EXPECT_TRUE(levels[0].empty());
    ASSERT_EQ(levels[1].size(), 1);
    EXPECT_EQ(levels[1][0].content.size(), 4);
}

TEST_F(ManifestGeneratorTest, EntriesCarryConfiguredBucketCount) {
    test::StubDataFileSupplier* stub = nullptr;
    auto gen = StubGenerator(stub);
    stub->new_files.push_back(NewFile("a", 2));

    ManifestEntry entry = gen->Next();
    EXPECT_EQ(entry.kind, ValueKind::kAdd);
    EXPECT_EQ(entry.partition, partition_);
    EXPECT_EQ(entry.bucket, 2);
    EXPECT_EQ(entry.total_buckets, 3);
    EXPECT_EQ(entry.file->level, 0);
}

TEST_F(ManifestGeneratorTest, NewFileOutsideBucketRangeThrows) {
    test::StubDataFileSupplier* stub = nullptr;
    auto gen = StubGenerator(stub);
    stub->new_files.push_back(NewFile("bad", 3));

    EXPECT_THROW(gen->Next(), std::logic_error);
    EXPECT_EQ(gen->State().NumLiveFiles(), 0);
    EXPECT_EQ(gen->PendingEntries(), 0);
}

TEST_F(ManifestGeneratorTest, NewFileAboveLevelZeroThrows) {
    test::StubDataFileSupplier* stub = nullptr;
    auto gen = StubGenerator(stub);
    stub->new_files.push_back(test::MakeFile("deep", partition_, 0, 1, test::MakeRecords(1, next_seq_)));

    EXPECT_THROW(gen->Next(), std::logic_error);
    EXPECT_EQ(gen->State().NumLiveFiles(), 0);
}

TEST_F(ManifestGeneratorTest, RejectsMissingSupplierAndBadOptions) {
    EXPECT_THROW(ManifestTestDataGenerator(options_, nullptr), std::invalid_argument);

    GeneratorOptions no_buckets = options_;
    no_buckets.num_buckets = 0;
    EXPECT_THROW(ManifestTestDataGenerator gen(no_buckets), std::invalid_argument);
}

TEST_F(ManifestGeneratorTest, LevelsStayWithinCapacity) {
    ManifestTestDataGenerator gen(options_);

    for (int step = 0; step < 1000; ++step) {
        DrainStep(gen);
        ASSERT_LE(gen.State().MaxLevelSize(), LevelMerger::kLevelCapacity) << "after step " << step;
    }
    EXPECT_EQ(gen.NumSteps(), 1000);
    EXPECT_GT(gen.NumMerges(), 0);
}

TEST_F(ManifestGeneratorTest, EntriesMatchLiveFiles) {
    ManifestTestDataGenerator gen(options_);

    std::vector<ManifestEntry> all;
    for (int step = 0; step < 500; ++step) {
        // Back to emission order: a step's ADD comes after its DELETE in Next() order.
        auto entries = DrainStep(gen);
        all.insert(all.end(), entries.rbegin(), entries.rend());
    }

    std::vector<ManifestEntry::Identifier> from_entries;
    for (const auto& e : ManifestEntry::MergeEntries(all)) {
        // Starting from nothing, every DELETE cancels an earlier ADD.
        ASSERT_EQ(e.kind, ValueKind::kAdd);
        from_entries.push_back(e.GetIdentifier());
    }
    auto live = test::LiveFiles(gen.State());
    std::sort(live.begin(), live.end());

    EXPECT_EQ(from_entries.size(), gen.State().NumLiveFiles());
    EXPECT_TRUE(from_entries == live);
}

TEST_F(ManifestGeneratorTest, MergeNeedsStepsInEmissionOrder) {
    test::StubDataFileSupplier* stub = nullptr;
    auto gen = StubGenerator(stub);
    for (const char* name : {"f1", "f2", "f3", "f4"}) {
        stub->new_files.push_back(NewFile(name));
    }

    std::vector<ManifestEntry> as_returned;
    std::vector<ManifestEntry> emission_order;
    for (int step = 0; step < 4; ++step) {
        auto entries = DrainStep(*gen);
        as_returned.insert(as_returned.end(), entries.begin(), entries.end());
        emission_order.insert(emission_order.end(), entries.rbegin(), entries.rend());
    }

    // The last step returns DELETE f4 before ADD f4.
    EXPECT_THROW(ManifestEntry::MergeEntries(as_returned), std::logic_error);

    auto merged = ManifestEntry::MergeEntries(emission_order);
    ASSERT_EQ(merged.size(), 1);
    EXPECT_EQ(Describe(merged[0]), "ADD merged-L1-0");
}

TEST_F(ManifestGeneratorTest, FixedSeedReproducesStream) {
    ManifestTestDataGenerator first(options_);
    ManifestTestDataGenerator second(options_);

    for (int i = 0; i < 300; ++i) {
        ASSERT_EQ(first.Next().ToJson().dump(), second.Next().ToJson().dump()) << "at entry " << i;
    }
}

TEST_F(ManifestGeneratorTest, StubSupplierReproducesStream) {
    auto run = [this]() {
        test::StubDataFileSupplier* stub = nullptr;
        auto gen = StubGenerator(stub);
        stub->merge_file_records[1] = 2;
        next_seq_ = 0;
        for (int i = 0; i < 10; ++i) {
            stub->new_files.push_back(NewFile("f" + std::to_string(i), i % 2));
        }
        std::vector<std::string> described;
        while (!stub->new_files.empty() || gen->PendingEntries() > 0) {
            described.push_back(gen->Next().ToJson().dump());
        }
        return described;
    };

    auto a = run();
    auto b = run();
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.empty());
}

TEST_F(ManifestGeneratorTest, SummaryCountsEntries) {
    ManifestTestDataGenerator gen(options_);

    auto meta = std::make_shared<DataFileMeta>();
    meta->file_name = "sst-1";
    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 5; ++i) {
        entries.emplace_back(ValueKind::kAdd, test::Partition("20211110", 8 + i % 3), 0, 3, meta);
    }
    entries.emplace_back(ValueKind::kDelete, test::Partition("20211112", 9), 1, 3, meta);
    entries.emplace_back(ValueKind::kDelete, test::Partition("20211111", 10), 2, 3, meta);

    ManifestFileMeta summary = gen.CreateManifestFileMeta(entries);
    EXPECT_EQ(summary.num_added_files, 5);
    EXPECT_EQ(summary.num_deleted_files, 2);
    EXPECT_EQ(summary.file_size, 700);
    EXPECT_EQ(summary.file_name.rfind("manifest-", 0), 0);

    ASSERT_EQ(summary.partition_stats.size(), 2);
    EXPECT_EQ(summary.partition_stats[0].min_value, FieldValue(std::string("20211110")));
    EXPECT_EQ(summary.partition_stats[0].max_value, FieldValue(std::string("20211112")));
    EXPECT_EQ(summary.partition_stats[1].min_value, FieldValue(int32_t{8}));
    EXPECT_EQ(summary.partition_stats[1].max_value, FieldValue(int32_t{10}));
    EXPECT_EQ(summary.partition_stats[1].null_count, 0);

    // Fresh identifier per call.
    EXPECT_NE(gen.CreateManifestFileMeta(entries).file_name, summary.file_name);
}

TEST_F(ManifestGeneratorTest, SummaryUsesConfiguredSizePerEntry) {
    options_.manifest_size_per_entry = 64;
    ManifestTestDataGenerator gen(options_);

    std::vector<ManifestEntry> entries;
    for (int i = 0; i < 3; ++i) {
        entries.push_back(gen.Next());
    }
    EXPECT_EQ(gen.CreateManifestFileMeta(entries).file_size, 192);
}

TEST_F(ManifestGeneratorTest, SummaryOfGeneratedBatch) {
    ManifestTestDataGenerator gen(options_);

    std::vector<ManifestEntry> entries;
    uint64_t adds = 0;
    for (int i = 0; i < 200; ++i) {
        entries.push_back(gen.Next());
        if (entries.back().kind == ValueKind::kAdd) ++adds;
    }

    ManifestFileMeta summary = gen.CreateManifestFileMeta(entries);
    EXPECT_EQ(summary.num_added_files, adds);
    EXPECT_EQ(summary.num_added_files + summary.num_deleted_files, 200);
    EXPECT_EQ(summary.file_size, 200 * 100);
    ASSERT_EQ(summary.partition_stats.size(), KeyValueGenerator::PartitionType().Arity());
}

TEST_F(ManifestGeneratorTest, EmptySummaryThrows) {
    ManifestTestDataGenerator gen(options_);
    EXPECT_THROW(gen.CreateManifestFileMeta({}), std::invalid_argument);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
