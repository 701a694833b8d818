#include "file_readers/feeder_reader.h"
#include "util/err_code.h"

#include "testFiles.hpp"

#include <gtest/gtest.h>

namespace pnpc {
namespace gtest {

TEST(FeederReader, ReadsPositionalColumns) {
	FeederReader rdr;
	ASSERT_TRUE(rdr.read_feeders(dataPath("feeders.csv")));

	const FeederMap& fm = rdr.get_map();
	ASSERT_EQ(fm.size(), 2u);

	const FeederParams& c = fm.at("C_0402 100n");
	EXPECT_EQ(c.feeder_, "3");
	EXPECT_EQ(c.nozzle_, "1");
	EXPECT_EQ(c.speed_, "100");
	EXPECT_EQ(c.height_, "0.5");

	const FeederParams& r = fm.at("R_0402 10k");
	EXPECT_EQ(r.feeder_, "5");
	EXPECT_TRUE(r.nozzle_.empty());
	EXPECT_EQ(r.speed_, "80");
	EXPECT_TRUE(r.height_.empty());
}

TEST(FeederReader, FirstLineIsAlwaysSkipped) {
	// no header, the first data row is lost
	const std::string fn = writeTemp("feeders_nohdr.csv",
	                                 "0402 10k,12,1,100,0.5\n"
	                                 "0603 1k,13,2,90,0.6\n");

	FeederReader rdr;
	ASSERT_TRUE(rdr.read_feeders(fn));
	EXPECT_EQ(rdr.get_map().size(), 1u);
	EXPECT_EQ(rdr.get_map().count("0402 10k"), 0u);
	EXPECT_EQ(rdr.get_map().at("0603 1k").feeder_, "13");
}

TEST(FeederReader, ShortRowsAndEmptyKeysAreSkipped) {
	const std::string fn = writeTemp("feeders_short.csv",
	                                 "Component,Feeder,Nozzle,Speed,Height\n"
	                                 "0402 10k,12,1,100\n"
	                                 " ,12,1,100,0.5\n"
	                                 "\n"
	                                 "\"0805, 1k\",14,2,100,0.5,extra\n");

	FeederReader rdr;
	ASSERT_TRUE(rdr.read_feeders(fn));
	ASSERT_EQ(rdr.get_map().size(), 1u);
	EXPECT_EQ(rdr.get_map().at("0805, 1k").feeder_, "14");
	EXPECT_EQ(rdr.num_skipped_, 2u);
}

TEST(FeederReader, QuotedKeySpansLines) {
	const std::string fn = writeTemp("feeders_multiline.csv",
	                                 "Component,Feeder,Nozzle,Speed,Height\n"
	                                 "\"LED\nred\",9,1,100,0.5\n"
	                                 "0402 10k,12,1,100,0.5\n");

	FeederReader rdr;
	ASSERT_TRUE(rdr.read_feeders(fn));
	ASSERT_EQ(rdr.get_map().size(), 2u);
	EXPECT_EQ(rdr.get_map().at("LED\nred").feeder_, "9");
	EXPECT_EQ(rdr.get_map().at("0402 10k").feeder_, "12");
}

TEST(FeederReader, LastRowWins) {
	const std::string fn = writeTemp("feeders_dup.csv",
	                                 "Component,Feeder,Nozzle,Speed,Height\n"
	                                 "0402 10k,12,1,100,0.5\n"
	                                 "0402 10k,20,2,50,1\n");

	FeederReader rdr;
	ASSERT_TRUE(rdr.read_feeders(fn));
	ASSERT_EQ(rdr.get_map().size(), 1u);
	EXPECT_EQ(rdr.get_map().at("0402 10k").feeder_, "20");
	EXPECT_EQ(rdr.num_overwritten_, 1u);
}

TEST(FeederReader, MissingFileFails) {
	clear_err_code();
	FeederReader rdr;
	EXPECT_FALSE(rdr.read_feeders(tempPath("no_such_feeders.csv")));
	EXPECT_EQ(err_code(), "FEEDER_FILE_READ_ERROR");
	EXPECT_EQ(err_file(), tempPath("no_such_feeders.csv"));
	clear_err_code();
}

} // namespace gtest
} // namespace pnpc
