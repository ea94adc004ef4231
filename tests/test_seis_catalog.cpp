#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include "src/catalog/seis_catalog.hpp"
#include "test_helpers.hpp"

using namespace seiscat;
using seiscat::testing::make_time;

namespace {
    // routes the default logger into a string for the lifetime of the object
    class LogCapture {
    public:
        LogCapture() : previous_(spdlog::default_logger()) {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss_);
            auto logger = std::make_shared<spdlog::logger>("capture", sink);
            logger->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger);
        }
        ~LogCapture() { spdlog::set_default_logger(previous_); }

        std::string str() const { return oss_.str(); }

    private:
        std::ostringstream oss_;
        std::shared_ptr<spdlog::logger> previous_;
    };

    Criteria station_in(std::vector<FieldValue> stations) {
        return {{"station", CriterionSpec{CriterionMode::LIST, std::nullopt, std::move(stations)}}};
    }
} // namespace

class SeisCatalogTest : public seiscat::testing::TempDirTest {
protected:
    void make_scenario_files() {
        touch("2023/ABC_BHZ.sac");
        touch("2023/DEF_LHZ.sac");
        touch("2023/XYZ_BHZ.sac");
    }

    const std::string pattern_ = "{home}/{YYYY}/{station}_{component}.sac";
};

TEST_F(SeisCatalogTest, MatchFilterGroup) {
    make_scenario_files();
    SeisCatalog catalog(dir(), pattern_);
    EXPECT_EQ(catalog.state(), CatalogState::INITIALIZED);

    const auto& files = catalog.match();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(catalog.state(), CatalogState::MATCHED);
    EXPECT_EQ(catalog.get_stations(false), (std::vector<std::string>{"ABC", "DEF", "XYZ"}));

    ASSERT_TRUE(catalog.filter(station_in({std::string("ABC"), std::string("XYZ")})));
    EXPECT_EQ(catalog.state(), CatalogState::FILTERED);
    ASSERT_TRUE(catalog.filtered_files().has_value());
    EXPECT_EQ(catalog.filtered_files()->size(), 2u);

    ASSERT_TRUE(catalog.group({"station"}));
    EXPECT_EQ(catalog.state(), CatalogState::GROUPED);
    const auto& groups = *catalog.files_group();
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].files.size(), 1u);
    EXPECT_EQ(groups[1].files.size(), 1u);
}

TEST_F(SeisCatalogTest, TimeRangeKeepsOneDay) {
    touch("2023/01/01/ABC_BHZ.sac");
    touch("2023/01/02/ABC_BHZ.sac");
    SeisCatalog catalog(dir(), "{home}/{YYYY}/{MM}/{DD}/{station}_{component}.sac");
    catalog.match();

    Criteria criteria = {{"time", CriterionSpec{CriterionMode::RANGE, "datetime",
                                                {make_time(2023, 1, 2), make_time(2023, 1, 2, 23, 59, 59)}}}};
    ASSERT_TRUE(catalog.filter(criteria));
    ASSERT_EQ(catalog.filtered_files()->size(), 1u);
    EXPECT_EQ(catalog.filtered_files()->front().path, dir() + "/2023/01/02/ABC_BHZ.sac");
    EXPECT_EQ(catalog.get_times(), (std::vector<std::optional<Timestamp>>{make_time(2023, 1, 2)}));
}

TEST_F(SeisCatalogTest, MissingStationFailsConstruction) {
    EXPECT_THROW(SeisCatalog(dir(), "{home}/{YYYY}/some_{component}.sac"), ConfigurationError);
}

TEST_F(SeisCatalogTest, EmptyRoot) {
    SeisCatalog catalog(dir(), pattern_);
    EXPECT_TRUE(catalog.match().empty());
    EXPECT_EQ(catalog.state(), CatalogState::MATCHED);
}

TEST_F(SeisCatalogTest, StagesBeforeTheirSourceAreNoOps) {
    make_scenario_files();
    SeisCatalog catalog(dir(), pattern_);
    {
        LogCapture capture;
        EXPECT_FALSE(catalog.filter(station_in({std::string("ABC")})));
        EXPECT_NE(capture.str().find("Please match the files first."), std::string::npos);
    }
    EXPECT_FALSE(catalog.group({"station"}));
    EXPECT_FALSE(catalog.organize({"station"}));
    EXPECT_FALSE(catalog.annotate([](Record&) {}));
    EXPECT_EQ(catalog.state(), CatalogState::INITIALIZED);
    EXPECT_FALSE(catalog.files().has_value());
    EXPECT_FALSE(catalog.filtered_files().has_value());
    EXPECT_FALSE(catalog.files_group().has_value());
    EXPECT_FALSE(catalog.virtual_array().has_value());
    EXPECT_TRUE(catalog.get_stations().empty());

    catalog.match();
    {
        LogCapture capture;
        EXPECT_FALSE(catalog.group({"station"}));
        EXPECT_NE(capture.str().find("Please filter the files first."), std::string::npos);
    }
    EXPECT_EQ(catalog.state(), CatalogState::MATCHED);
    // the unfiltered set is a valid source
    EXPECT_TRUE(catalog.group({"station"}, {}, false));
    EXPECT_EQ(catalog.files_group()->size(), 3u);
}

TEST_F(SeisCatalogTest, RematchDropsDownstreamResults) {
    make_scenario_files();
    SeisCatalog catalog(dir(), pattern_);
    catalog.match();
    ASSERT_TRUE(catalog.filter(station_in({std::string("ABC")})));
    ASSERT_TRUE(catalog.group({"station"}));
    ASSERT_TRUE(catalog.organize({"station", "component"}, "path"));

    touch("2023/GHI_BHZ.sac");
    EXPECT_EQ(catalog.match().size(), 4u);
    EXPECT_EQ(catalog.state(), CatalogState::MATCHED);
    EXPECT_FALSE(catalog.filtered_files().has_value());
    EXPECT_FALSE(catalog.files_group().has_value());
    EXPECT_FALSE(catalog.virtual_array().has_value());
}

TEST_F(SeisCatalogTest, Organize) {
    touch("2023/001/ABC_BHZ.sac");
    touch("2023/001/ABC_BHN.sac");
    touch("2023/002/ABC_BHZ.sac");
    touch("2023/001/DEF_BHZ.sac");
    SeisCatalog catalog(dir(), "{home}/{YYYY}/{JJJ}/{station}_{component}.sac");
    catalog.match();
    ASSERT_TRUE(catalog.filter(station_in({std::string("ABC")})));
    ASSERT_TRUE(catalog.organize({"station", "component"}, "path"));
    EXPECT_EQ(catalog.state(), CatalogState::ORGANIZED);

    const auto& va = *catalog.virtual_array();
    EXPECT_EQ(va.output, OutputType::PATH);
    EXPECT_EQ(va.keys(), (std::vector<std::string>{"ABC"}));
    const VirtualArrayNode* leaf = va.find({"ABC", "BHZ"});
    ASSERT_NE(leaf, nullptr);
    EXPECT_EQ(leaf->paths, (std::vector<std::string>{dir() + "/2023/001/ABC_BHZ.sac", dir() + "/2023/002/ABC_BHZ.sac"}));
}

TEST_F(SeisCatalogTest, CustomField) {
    touch("2023/001/ABC_BHZ_17.sac");
    CatalogOptions options;
    options.custom_fields = {{"shot", R"(\d+)"}};
    SeisCatalog catalog(dir(), "{home}/{YYYY}/{JJJ}/{station}_{component}_{shot}.sac", options);
    EXPECT_TRUE(catalog.registry().contains("shot"));
    const auto& files = catalog.match();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(std::get<std::string>(files[0].fields.at("shot")), "17");
    EXPECT_EQ(*files[0].time, make_time(2023, 1, 1));
}

TEST_F(SeisCatalogTest, InvalidCustomFieldFailsConstruction) {
    CatalogOptions options;
    options.custom_fields = {{"shot", "(\\d+"}};
    EXPECT_THROW(SeisCatalog(dir(), pattern_, options), ConfigurationError);
}

TEST_F(SeisCatalogTest, ResponseProfile) {
    touch("ABC_BHZ.RESP");
    touch("ABC_BHZ.StationXML");
    touch("ABC_BHZ.txt");
    SeisCatalog catalog(dir(), "{home}/{station}_{component}.{resptype}", response_catalog_options());
    const auto& files = catalog.match();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(std::get<std::string>(files[0].fields.at("resptype")), "RESP");
    EXPECT_EQ(std::get<std::string>(files[1].fields.at("resptype")), "StationXML");
    EXPECT_FALSE(files[0].time.has_value());

    // the response profile still needs its type token
    EXPECT_THROW(SeisCatalog(dir(), "{home}/{station}_{component}.xml", response_catalog_options()),
                 ConfigurationError);
}

TEST_F(SeisCatalogTest, AnnotateThenFilterOnAttachedField) {
    touch("2023/ABC_BHZ.sac", std::string(10, 'x'));
    touch("2023/DEF_LHZ.sac", std::string(500, 'x'));
    SeisCatalog catalog(dir(), pattern_);
    catalog.match();
    ASSERT_TRUE(catalog.annotate([](Record& r) {
        r.set("size", static_cast<std::int64_t>(std::filesystem::file_size(r.path)));
    }));

    Criteria criteria = {{"size", CriterionSpec{CriterionMode::RANGE, "int",
                                                {std::int64_t{0}, std::int64_t{100}}}}};
    ASSERT_TRUE(catalog.filter(criteria));
    EXPECT_EQ(catalog.get_stations(), (std::vector<std::string>{"ABC"}));
    auto sizes = catalog.get_field("size");
    ASSERT_EQ(sizes.size(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(*sizes[0]), 10);
}

TEST_F(SeisCatalogTest, ThreadCountDoesNotChangeOutput) {
    for (int i = 0; i < 30; ++i) touch("2023/ST" + std::to_string(i) + "_BHZ.sac");
    SeisCatalog serial(dir(), pattern_);
    SeisCatalog pooled(dir(), pattern_);
    EXPECT_EQ(serial.match(1), pooled.match(6));

    auto criteria = station_in({std::string("ST3"), std::string("ST17"), std::string("ST29")});
    ASSERT_TRUE(serial.filter(criteria, 1));
    ASSERT_TRUE(pooled.filter(criteria, 6));
    EXPECT_EQ(*serial.filtered_files(), *pooled.filtered_files());
    EXPECT_EQ(serial.filtered_files()->size(), 3u);
}

TEST_F(SeisCatalogTest, AnnotateDropsEarlierResults) {
    make_scenario_files();
    SeisCatalog catalog(dir(), pattern_);
    catalog.match();
    ASSERT_TRUE(catalog.filter(station_in({std::string("ABC")})));
    ASSERT_TRUE(catalog.group({"station"}));
    ASSERT_TRUE(catalog.organize({"station"}));

    ASSERT_TRUE(catalog.annotate([](Record& r) { r.set("network", std::string("IU")); }));
    EXPECT_EQ(catalog.state(), CatalogState::MATCHED);
    EXPECT_FALSE(catalog.filtered_files().has_value());
    EXPECT_FALSE(catalog.files_group().has_value());
    EXPECT_FALSE(catalog.virtual_array().has_value());

    // a filter run afterwards sees the attached field
    Criteria criteria = {{"network", CriterionSpec{CriterionMode::LIST, std::nullopt, {std::string("IU")}}}};
    ASSERT_TRUE(catalog.filter(criteria));
    EXPECT_EQ(catalog.filtered_files()->size(), 3u);
}

TEST_F(SeisCatalogTest, GroupAndOrganizeWithoutLabelsAreNoOps) {
    make_scenario_files();
    SeisCatalog catalog(dir(), pattern_);
    catalog.match();
    ASSERT_TRUE(catalog.filter(station_in({std::string("ABC")})));

    EXPECT_FALSE(catalog.group({}));
    EXPECT_FALSE(catalog.organize({}));
    EXPECT_EQ(catalog.state(), CatalogState::FILTERED);
    EXPECT_FALSE(catalog.files_group().has_value());
    EXPECT_FALSE(catalog.virtual_array().has_value());
}

TEST(CatalogStateTest, Names) {
    EXPECT_EQ(state_name(CatalogState::INITIALIZED), "initialized");
    EXPECT_EQ(state_name(CatalogState::ORGANIZED), "organized");
}
