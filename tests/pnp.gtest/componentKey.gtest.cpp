#include "pnp/component_key.h"

#include <gtest/gtest.h>

namespace pnpc {
namespace gtest {

TEST(ComponentKey, KicadPosUsesPackageAndValue) {
	EXPECT_EQ(resolve_key("R1", PosFormat::KicadPos, "0402", "10k", nullptr), "0402 10k");
	EXPECT_EQ(resolve_key("FID1", PosFormat::KicadPos, "", "", nullptr), "");
	EXPECT_EQ(resolve_key("TP1", PosFormat::KicadPos, "TestPoint", "", nullptr), "TestPoint");
	EXPECT_EQ(resolve_key("C9", PosFormat::KicadPos, "", "100n", nullptr), "100n");
}

TEST(ComponentKey, PositionsAndUnknownUseDesignator) {
	EXPECT_EQ(resolve_key("R1", PosFormat::Positions, "", "", nullptr), "R1");
	EXPECT_EQ(resolve_key("R1", PosFormat::Unknown, "0402", "10k", nullptr), "R1");
}

TEST(ComponentKey, BomWins) {
	const BomMap bom = { { "R1", "R_0402 10k" }, { "R2", "" } };

	EXPECT_EQ(resolve_key("R1", PosFormat::Positions, "", "", &bom), "R_0402 10k");
	EXPECT_EQ(resolve_key("R1", PosFormat::KicadPos, "0603", "1k", &bom), "R_0402 10k");
	// a listed designator keeps its (empty) BOM key
	EXPECT_EQ(resolve_key("R2", PosFormat::KicadPos, "0603", "1k", &bom), "");
	// not in the BOM
	EXPECT_EQ(resolve_key("R3", PosFormat::KicadPos, "0603", "1k", &bom), "0603 1k");
	EXPECT_EQ(resolve_key("R3", PosFormat::Positions, "", "", &bom), "R3");
}

TEST(ComponentKey, SameInputSameKey) {
	PlacementRecord rec;
	rec.ref_ = "U1";
	rec.val_ = "STM32";
	rec.package_ = "LQFP-48";
	rec.fmt_ = PosFormat::KicadPos;

	const std::string k = resolve_key(rec, nullptr);
	EXPECT_EQ(k, "LQFP-48 STM32");
	EXPECT_EQ(resolve_key(rec, nullptr), k);
}

TEST(ComponentKey, SanitizeExplanation) {
	EXPECT_EQ(sanitize_explanation("R(10k)\"A\""), "R10kA");
	EXPECT_EQ(sanitize_explanation("  0402 10k "), "0402 10k");
	EXPECT_EQ(sanitize_explanation("LQFP-48 STM32F103(C8T6)"), "LQFP-48 STM32F103C8T6");
	EXPECT_EQ(sanitize_explanation("\xEF\xBC\x88" "1uF" "\xEF\xBC\x89" " \xEF\xBC\x82X\xEF\xBC\x82"), "1uF X");
	EXPECT_EQ(sanitize_explanation("()\"\""), "");
}

} // namespace gtest
} // namespace pnpc
