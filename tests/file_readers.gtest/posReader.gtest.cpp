#include "file_readers/pos_reader.h"

#include "testFiles.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace pnpc {
namespace gtest {

using Header = std::vector<std::string>;

static const std::string BOM_UTF8   = "\xEF\xBB\xBF";
static const std::string BOM_LATIN1 = "\xC3\xAF\xC2\xBB\xC2\xBF";

TEST(FormatDetector, KicadPos) {
	EXPECT_EQ(detect_pos_format({"Ref", "Val", "Package", "PosX", "PosY", "Rot", "Side"}), PosFormat::KicadPos);
	EXPECT_EQ(detect_pos_format({"reference", "VAL", "package"}), PosFormat::KicadPos);
	EXPECT_EQ(detect_pos_format({BOM_UTF8 + "Ref", " Val ", "Package"}), PosFormat::KicadPos);
	EXPECT_EQ(detect_pos_format({BOM_LATIN1 + "REF", "val", "PACKAGE", "x"}), PosFormat::KicadPos);
}

TEST(FormatDetector, Positions) {
	EXPECT_EQ(detect_pos_format({"Designator", "Mid X", "Mid Y", "Rotation", "Layer"}), PosFormat::Positions);
	EXPECT_EQ(detect_pos_format({BOM_UTF8 + "Designator", "Mid X(mm)", "Mid Y(mm)", "Rotation", "Layer"}),
	          PosFormat::Positions);
	EXPECT_EQ(detect_pos_format({"ref", "MID X", "mid y", "ROTATION deg", "layer", "extra"}), PosFormat::Positions);
	EXPECT_EQ(detect_pos_format({BOM_LATIN1 + "designator", "mid x", "mid y", "rotation", "side"}),
	          PosFormat::Positions);
}

TEST(FormatDetector, Unknown) {
	EXPECT_EQ(detect_pos_format({}), PosFormat::Unknown);
	EXPECT_EQ(detect_pos_format({"Ref", "Val"}), PosFormat::Unknown);
	// positions needs at least 5 columns
	EXPECT_EQ(detect_pos_format({"Designator", "Mid X", "Mid Y", "Rotation"}), PosFormat::Unknown);
	EXPECT_EQ(detect_pos_format({"Part", "X", "Y", "Rot", "Side"}), PosFormat::Unknown);
	EXPECT_EQ(detect_pos_format({"Ref", "Value", "Package"}), PosFormat::Unknown);
}

TEST(PositionReader, KicadPosRows) {
	PosReader rdr(dataPath("kicad.pos.csv"));
	ASSERT_TRUE(rdr.open());
	EXPECT_EQ(rdr.format(), PosFormat::KicadPos);
	ASSERT_EQ(rdr.header().size(), 7u);
	EXPECT_EQ(rdr.header()[6], "Side");

	std::vector<PlacementRecord> recs;
	PlacementRecord rec;
	while (rdr.next(rec))
		recs.push_back(rec);

	ASSERT_EQ(recs.size(), 8u);
	const PlacementRecord& r1 = recs[5];
	EXPECT_EQ(r1.ref_, "R1");
	EXPECT_EQ(r1.val_, "10k");
	EXPECT_EQ(r1.package_, "R_0402");
	EXPECT_EQ(r1.x_, "12.5000");
	EXPECT_EQ(r1.y_, "3.2000");
	EXPECT_EQ(r1.rot_, "90.0000");
	EXPECT_EQ(r1.fmt_, PosFormat::KicadPos);
	EXPECT_EQ(r1.line_, 7u);
}

TEST(PositionReader, PositionsRowsHaveNoValueOrPackage) {
	PosReader rdr(dataPath("positions.csv"));
	ASSERT_TRUE(rdr.open());
	EXPECT_EQ(rdr.format(), PosFormat::Positions);

	PlacementRecord rec;
	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "C1");
	EXPECT_EQ(rec.x_, "10.0mm");
	EXPECT_EQ(rec.y_, "5.0mm");
	EXPECT_EQ(rec.rot_, "0");
	EXPECT_TRUE(rec.val_.empty());
	EXPECT_TRUE(rec.package_.empty());

	unsigned count = 1;
	while (rdr.next(rec))
		++count;
	EXPECT_EQ(count, 5u);
}

TEST(PositionReader, ShortAndBlankRowsAreSkipped) {
	const std::string fn = writeTemp("pos_short.csv",
	                                 "Ref,Val,Package,PosX,PosY,Rot\n"
	                                 "\n"
	                                 "R1,10k,R_0402\n"
	                                 "  ,1k,R_0402,1,2,3\n"
	                                 "R2 , 1k , R_0402 , 1.0 , 2.0 , 0\n");

	PosReader full(fn, PosReader::Mode::Full);
	ASSERT_TRUE(full.open());
	PlacementRecord rec;
	ASSERT_TRUE(full.next(rec));
	EXPECT_EQ(rec.ref_, "R2");
	EXPECT_EQ(rec.val_, "1k");
	EXPECT_EQ(rec.x_, "1.0");
	EXPECT_FALSE(full.next(rec));
	EXPECT_EQ(full.numSkipped(), 2u);

	// three columns are enough to enumerate keys
	PosReader keys(fn, PosReader::Mode::Keys);
	ASSERT_TRUE(keys.open());
	ASSERT_TRUE(keys.next(rec));
	EXPECT_EQ(rec.ref_, "R1");
	EXPECT_TRUE(rec.x_.empty());
	ASSERT_TRUE(keys.next(rec));
	EXPECT_EQ(rec.ref_, "R2");
	EXPECT_FALSE(keys.next(rec));
}

TEST(PositionReader, QuotedFieldSpansLines) {
	const std::string fn = writeTemp("pos_multiline.csv",
	                                 "Ref,Val,Package,PosX,PosY,Rot\n"
	                                 "\"R1\",\"10k\n1%\",R_0402,1,2,3\n"
	                                 "R2,1k,R_0402,4,5,6\n");

	PosReader rdr(fn);
	ASSERT_TRUE(rdr.open());

	PlacementRecord rec;
	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "R1");
	EXPECT_EQ(rec.val_, "10k\n1%");
	EXPECT_EQ(rec.x_, "1");
	EXPECT_EQ(rec.line_, 2u);

	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "R2");
	EXPECT_EQ(rec.line_, 4u);
	EXPECT_FALSE(rdr.next(rec));

	rdr.reIterate();
	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "R1");
}

TEST(PositionReader, HeaderSpansLines) {
	const std::string fn = writeTemp("pos_multiline_hdr.csv",
	                                 "Designator,\"Mid X\n(mm)\",Mid Y,Rotation,Layer\n"
	                                 "C1,1,2,0,T\n");

	PosReader rdr(fn);
	ASSERT_TRUE(rdr.open());
	EXPECT_EQ(rdr.format(), PosFormat::Positions);

	PlacementRecord rec;
	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "C1");
	EXPECT_EQ(rec.line_, 3u);
}

TEST(PositionReader, ReIterateRestarts) {
	PosReader rdr(dataPath("positions.csv"));
	ASSERT_TRUE(rdr.open());

	PlacementRecord rec;
	while (rdr.next(rec)) {
	}
	rdr.reIterate();
	ASSERT_TRUE(rdr.next(rec));
	EXPECT_EQ(rec.ref_, "C1");
}

TEST(PositionReader, EmptyFileIsNotAnError) {
	const std::string fn = writeTemp("pos_empty.csv", "");

	PosReader rdr(fn);
	ASSERT_TRUE(rdr.open());
	EXPECT_FALSE(rdr.hasHeader());
	EXPECT_EQ(rdr.format(), PosFormat::Unknown);

	PlacementRecord rec;
	EXPECT_FALSE(rdr.next(rec));
}

TEST(PositionReader, MissingFileFails) {
	PosReader rdr(tempPath("missing.pos.csv"));
	EXPECT_FALSE(rdr.open());
}

TEST(FiducialExtractor, FirstSeenOrderWithoutDuplicates) {
	const std::string fn = writeTemp("pos_fids.csv",
	                                 "Ref,Val,Package,PosX,PosY,Rot\n"
	                                 "fid3,,Fiducial,1,1,0\n"
	                                 "R1,10k,R_0402,1,2,3\n"
	                                 "FID1,,Fiducial,2,2,0\n"
	                                 "fid3,,Fiducial,1,1,0\n"
	                                 "FIDUCIAL_A\n"
	                                 "TP1,,TestPoint,3,3,0\n");

	std::vector<std::string> fids;
	ASSERT_TRUE(collect_fiducials(fn, fids));
	ASSERT_EQ(fids.size(), 3u);
	EXPECT_EQ(fids[0], "fid3");
	EXPECT_EQ(fids[1], "FID1");
	EXPECT_EQ(fids[2], "FIDUCIAL_A");
}

TEST(FiducialExtractor, IsFiducial) {
	EXPECT_TRUE(is_fiducial("FID1"));
	EXPECT_TRUE(is_fiducial("fid02"));
	EXPECT_TRUE(is_fiducial("Fid"));
	EXPECT_FALSE(is_fiducial("FI1"));
	EXPECT_FALSE(is_fiducial("R1"));
	EXPECT_FALSE(is_fiducial(""));
}

} // namespace gtest
} // namespace pnpc
