#include <catch2/catch.hpp>

#include <osuvol/beatmap_parser.hpp>
#include <osuvol/beatmap_writer.hpp>

#include <cmath>

#include <fstream>
#include <sstream>


static std::string read_fixture(const std::string& name)
{
    std::ifstream in(OSUVOL_TEST_DIR "/data/" + name, std::ios::binary);
    REQUIRE(in);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("parse sample difficulty", "[beatmap_parser]")
{
    osuvol::BeatmapParser parser(OSUVOL_TEST_DIR "/data/Lumin - Fade Study (Lumin) [Hard].osu");
    auto beatmap = parser.parse();

    CHECK(beatmap.version == 14);
    REQUIRE(beatmap.sections.size() == 7);
    CHECK(beatmap.sections[0].name == "General");
    CHECK(beatmap.sections[5].name == "TimingPoints");
    CHECK(beatmap.sections[6].name == "HitObjects");
    REQUIRE(beatmap.find_section("Events"));
    CHECK(beatmap.find_section("Events")->lines.size() == 4);
    CHECK(!beatmap.find_section("Colours"));

    auto points = beatmap.timing_points();
    REQUIRE(points.size() == 6);
    CHECK(points[0].time == 15);
    CHECK(points[0].beatLength == Approx(326.086956521739));
    CHECK(points[0].meter == 4);
    CHECK(points[0].sampleSet == 2);
    CHECK(points[0].sampleIndex == 0);
    CHECK(points[0].volume == 30);
    CHECK(points[0].uninherited);
    CHECK(points[0].effects == 0);

    CHECK(points[1].time == 1319);
    CHECK(points[1].beatLength == Approx(-100));
    CHECK(points[1].volume == 20);
    CHECK(!points[1].uninherited);

    CHECK(points[3].effects == osuvol::KiaiFlag);
    CHECK(points[5].effects == osuvol::OmitFirstBarLineFlag);
    CHECK(points[5].volume == 20);
}

TEST_CASE("unmodified beatmap serializes byte for byte", "[beatmap_parser]")
{
    auto content = read_fixture("Lumin - Fade Study (Lumin) [Hard].osu");
    CHECK(osuvol::serialize_beatmap(osuvol::parse_beatmap(content)) == content);

    std::string crlf =
        "\xEF\xBB\xBF" "osu file format v14\r\n"
        "\r\n"
        "[Events]\r\n"
        "//Background and Video events\r\n"
        "\r\n"
        "[TimingPoints]\r\n"
        "// a comment\r\n"
        "  95 ,517.241379310345,4,2,1,50,1,0\r\n"
        "\r\n"
        "120,-50,4,2,1,60,0,0,extra,fields\r\n"
        "\r\n"
        "[HitObjects]\r\n"
        "256,192,95,5,0,0:0:0:0:";
    auto beatmap = osuvol::parse_beatmap(crlf);
    CHECK(beatmap.version == 14);
    CHECK(beatmap.preamble.size() == 2);
    CHECK(osuvol::serialize_beatmap(beatmap) == crlf);

    auto points = beatmap.timing_points();
    REQUIRE(points.size() == 2);
    CHECK(points[0].time == 95);
    CHECK(points[1].extra_fields == std::vector<std::string>{"extra", "fields"});
}

TEST_CASE("short timing points use defaults", "[beatmap_parser]")
{
    auto beatmap = osuvol::parse_beatmap(
        "[TimingPoints]\n"
        "100,500\n"
        "200,-100,3\n"
        "300.75,-50,4,1,0,40\n");

    CHECK(beatmap.version == 0);
    auto points = beatmap.timing_points();
    REQUIRE(points.size() == 3);

    CHECK(points[0].meter == 4);
    CHECK(points[0].volume == 100);
    CHECK(points[0].uninherited);

    CHECK(points[1].meter == 3);
    CHECK(points[1].volume == 100);
    CHECK(!points[1].uninherited);

    CHECK(points[2].time == 300);
    CHECK(points[2].volume == 40);
    CHECK(!points[2].uninherited);
}

TEST_CASE("negative times", "[beatmap_parser]")
{
    auto points = osuvol::parse_beatmap("[TimingPoints]\n-30,400,4,2,0,55,1,0\n-0.5,-100,4,2,0,45,0,0\n").timing_points();
    REQUIRE(points.size() == 2);
    CHECK(points[0].time == -30);
    CHECK(points[1].time == -1);
}

TEST_CASE("malformed timing points", "[beatmap_parser]")
{
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n500\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\nabc,400,4,2,0,50,1,0\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n500,400,4,2,0,loud,1,0\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n500,fast,4,2,0,50,1,0\n"), osuvol::parse_error);

    // times that don't fit in whole milliseconds
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n1e30,400,4,2,0,50,1,0\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n-1e30,400,4,2,0,50,1,0\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\n9223372036854775808,400,4,2,0,50,1,0\n"), osuvol::parse_error);
    CHECK_THROWS_AS(osuvol::parse_beatmap("[TimingPoints]\ninf,400,4,2,0,50,1,0\n"), osuvol::parse_error);
    CHECK_NOTHROW(osuvol::parse_beatmap("[TimingPoints]\n-9223372036854775808,400,4,2,0,50,1,0\n"));

    // the same text outside [TimingPoints] is somebody else's business
    CHECK_NOTHROW(osuvol::parse_beatmap("[Events]\n500\n[Colours]\nabc,def\n"));
}

TEST_CASE("malformed timing point reports its line", "[beatmap_parser]")
{
    try
    {
        osuvol::parse_beatmap("osu file format v14\n\n[TimingPoints]\n0,400,4,2,0,50,1,0\n10,400,4,2,0,x,1,0\n", "broken.osu");
        FAIL("expected parse_error");
    }
    catch (const osuvol::parse_error& e)
    {
        CHECK(std::string(e.what()).find("broken.osu line 5") != std::string::npos);
    }
}

TEST_CASE("NaN beat length", "[beatmap_parser]")
{
    auto points = osuvol::parse_beatmap("[TimingPoints]\n0,NaN,4,2,0,50,0,0\n").timing_points();
    REQUIRE(points.size() == 1);
    CHECK(std::isnan(points[0].beatLength));
    CHECK(points[0].volume == 50);
    CHECK(points[0] == points[0]);
}

TEST_CASE("empty input", "[beatmap_parser]")
{
    auto beatmap = osuvol::parse_beatmap("");
    CHECK(beatmap.preamble.empty());
    CHECK(beatmap.sections.empty());
    CHECK(osuvol::serialize_beatmap(beatmap) == "");
}
