#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <plm/layout/scale.hpp>

namespace
{
// Ten images of 100 pixels fit in a row of 1000 pixels at factor 1
uint32_t CountRow(float factor)
{
    return static_cast<uint32_t>(1000.0f / (100.0f * factor));
}
} // namespace

TEST_CASE("Scale search finds the largest fitting factor", "[scale_search]")
{
    const auto result{ SearchScale(4, 0.1f, 10.0f, 0.0001f, CountRow) };
    REQUIRE(result.m_Feasible);
    REQUIRE(result.m_Exact);
    REQUIRE(result.m_Achieved == 4);
    REQUIRE(result.m_Factor == Catch::Approx(2.5f).margin(0.001f));
    REQUIRE(CountRow(result.m_Factor) == 4);
}

TEST_CASE("Scale search returns the largest factor if everything fits", "[scale_search_max]")
{
    const auto result{ SearchScale(4, 0.1f, 1.0f, 0.0001f, CountRow) };
    REQUIRE(result.m_Feasible);
    REQUIRE_FALSE(result.m_Exact);
    REQUIRE(result.m_Factor == 1.0f);
    REQUIRE(result.m_Achieved == 10);
}

TEST_CASE("Scale search reports infeasible targets", "[scale_search_infeasible]")
{
    const auto result{ SearchScale(20, 1.0f, 10.0f, 0.0001f, CountRow) };
    REQUIRE_FALSE(result.m_Feasible);
    REQUIRE_FALSE(result.m_Exact);
    REQUIRE(result.m_Factor == 1.0f);
    REQUIRE(result.m_Achieved == 10);
}

TEST_CASE("Scale search is deterministic", "[scale_search_deterministic]")
{
    const auto first{ SearchScale(3, 0.1f, 10.0f, 0.001f, CountRow) };
    const auto second{ SearchScale(3, 0.1f, 10.0f, 0.001f, CountRow) };
    REQUIRE(first.m_Factor == second.m_Factor);
    REQUIRE(first.m_Achieved == second.m_Achieved);
}

TEST_CASE("Scaled sizes are rounded and never empty", "[scale_size]")
{
    REQUIRE(ScaledSize({ 1000, 500 }, 0.5f) == dla::ivec2{ 500, 250 });
    REQUIRE(ScaledSize({ 3, 3 }, 0.5f) == dla::ivec2{ 2, 2 });
    REQUIRE(ScaledSize({ 10, 1000 }, 0.01f) == dla::ivec2{ 1, 10 });
}

TEST_CASE("Scaled sizes beyond the pixel limit are empty", "[scale_size_limit]")
{
    REQUIRE_FALSE(ScaledSize({ 4000, 3000 }, 1e6f).has_value());
    REQUIRE_FALSE(ScaledSize({ 1, 4000 }, 1e6f).has_value());
    REQUIRE(ScaledSize({ 4000, 1 }, 1000.0f) == dla::ivec2{ 4000000, 1000 });
    REQUIRE(ScaledSize({ 1, 1 }, static_cast<float>(c_MaxScaledSide)) == dla::ivec2{ c_MaxScaledSide, c_MaxScaledSide });
}
