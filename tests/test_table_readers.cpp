#include <gtest/gtest.h>

#include "trophdiv/io/TableReaders.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace trophdiv;
namespace fs = std::filesystem;

namespace {

class TableReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("trophdiv_readers_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& text) {
        const fs::path p = dir_ / name;
        std::ofstream ofs(p);
        ofs << text;
        return p;
    }

    fs::path dir_;
};

}  // namespace

TEST_F(TableReaderTest, ReadsAbundanceTableWithMissingCells) {
    const auto p = write("ab.csv",
                         "# sampled 2007\n"
                         "community,sp1,sp2,sp3\n"
                         "com1,10,0,NA\n"
                         "\n"
                         "\"com2\", 1.5 ,,3\n");
    const AbundanceTable ab = read_abundance_csv(p);
    ASSERT_EQ(ab.n_communities(), 2u);
    ASSERT_EQ(ab.n_species(), 3u);
    EXPECT_EQ(ab.communities()[1], "com2");
    EXPECT_EQ(ab.species()[2], "sp3");
    EXPECT_DOUBLE_EQ(ab.at(0, 0), 10.0);
    EXPECT_DOUBLE_EQ(ab.at(0, 1), 0.0);
    EXPECT_TRUE(is_missing(ab.at(0, 2)));
    EXPECT_DOUBLE_EQ(ab.at(1, 0), 1.5);
    EXPECT_TRUE(is_missing(ab.at(1, 1)));
    EXPECT_DOUBLE_EQ(ab.at(1, 2), 3.0);
}

TEST_F(TableReaderTest, CustomSeparatorAndMissingToken) {
    TableReadOptions opts;
    opts.separator = ';';
    opts.missing_tokens = {"-"};
    const auto p = write("ab.csv", "id;a;b\nc1;-;2\n");
    const AbundanceTable ab = read_abundance_csv(p, opts);
    EXPECT_TRUE(is_missing(ab.at(0, 0)));
    EXPECT_DOUBLE_EQ(ab.at(0, 1), 2.0);

    // "NA" is not missing under these options.
    const auto q = write("ab2.csv", "id;a;b\nc1;NA;2\n");
    EXPECT_THROW(read_abundance_csv(q, opts), std::runtime_error);
}

TEST_F(TableReaderTest, RejectsNegativeAbundance) {
    const auto p = write("ab.csv", "id,sp1,sp2\nc1,1,-2\n");
    try {
        read_abundance_csv(p);
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("negative abundance"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find(":2]"), std::string::npos);
    }
}

TEST_F(TableReaderTest, RejectsMalformedTables) {
    EXPECT_THROW(read_abundance_csv(write("a.csv", "id,sp1,sp2\nc1,1\n")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(write("b.csv", "id,sp1,sp1\nc1,1,2\n")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(write("c.csv", "id,sp1\nc1,1\nc1,2\n")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(write("d.csv", "id,sp1\nc1,abc\n")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(write("e.csv", "id,sp1\n")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(write("f.csv", "")), std::runtime_error);
    EXPECT_THROW(read_abundance_csv(dir_ / "does_not_exist.csv"), std::runtime_error);
}

TEST_F(TableReaderTest, ReadsTrophicLevels) {
    const auto p = write("tl.csv", "species,tl\nsp1,2.5\nsp2,3.1\nsp3,NA\n");
    const TrophicLevels tl = read_trophic_levels_csv(p);
    ASSERT_EQ(tl.size(), 3u);
    EXPECT_EQ(tl.species[0], "sp1");
    EXPECT_DOUBLE_EQ(tl.levels[1], 3.1);
    // Missing levels are left for the engine to reject.
    EXPECT_TRUE(is_missing(tl.levels[2]));
}

TEST_F(TableReaderTest, RejectsMalformedTrophicLevels) {
    EXPECT_THROW(read_trophic_levels_csv(write("a.csv", "species,tl\nsp1,2,3\n")), std::runtime_error);
    EXPECT_THROW(read_trophic_levels_csv(write("b.csv", "species,tl\nsp1,2\nsp1,3\n")), std::runtime_error);
    EXPECT_THROW(read_trophic_levels_csv(write("c.csv", "species,tl\nsp1,high\n")), std::runtime_error);
    EXPECT_THROW(read_trophic_levels_csv(write("d.csv", "species,tl\n")), std::runtime_error);
}
