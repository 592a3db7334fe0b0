#include <catch2/catch_test_macros.hpp>

#include "exceptions.hpp"
#include "sample_data_generator.hpp"
#include "utils.hpp"

using data::SampleDataGenerator;
using data::SampleDataOptions;

TEST_CASE("Only business days are generated", "[sample_data]") {
    SampleDataOptions options;
    options.start_date = "2023-01-02"; // Monday
    options.end_date = "2023-01-08";   // Sunday
    auto table = SampleDataGenerator(options).generate();

    REQUIRE(table.size() == 5);
    REQUIRE(core::utils::timestampToDate(table.front().timestamp) == "2023-01-02");
    REQUIRE(core::utils::timestampToDate(table.back().timestamp) == "2023-01-06");
    REQUIRE(table.front().close == 100.0);
}

TEST_CASE("Same seed, same table", "[sample_data]") {
    SampleDataOptions options;
    options.start_date = "2023-01-01";
    options.end_date = "2023-03-31";
    auto first = SampleDataGenerator(options).generate();
    auto second = SampleDataGenerator(options).generate();
    REQUIRE(first.size() == second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].close == second[i].close);
        REQUIRE(first[i].volume == second[i].volume);
    }

    options.seed = 7;
    auto other = SampleDataGenerator(options).generate();
    bool differs = false;
    for (std::size_t i = 0; i < first.size(); ++i) {
        differs = differs || first[i].close != other[i].close;
    }
    REQUIRE(differs);
}

TEST_CASE("Candles are well formed", "[sample_data]") {
    auto table = SampleDataGenerator().generate();
    REQUIRE(table.size() > 250);
    REQUIRE_NOTHROW(core::utils::validatePriceTable(table));
    for (const auto& candle : table) {
        REQUIRE(candle.low <= candle.open);
        REQUIRE(candle.open <= candle.high);
        REQUIRE(candle.low <= candle.close);
        REQUIRE(candle.close <= candle.high);
        REQUIRE(candle.low > 0.0);
        REQUIRE(candle.volume > 0);
    }
}

TEST_CASE("Invalid options are rejected", "[sample_data]") {
    SampleDataOptions backwards;
    backwards.start_date = "2023-02-01";
    backwards.end_date = "2023-01-01";
    REQUIRE_THROWS_AS(SampleDataGenerator(backwards).generate(), core::DataLoadException);

    SampleDataOptions zero_price;
    zero_price.initial_price = 0.0;
    REQUIRE_THROWS_AS(SampleDataGenerator(zero_price).generate(), core::DataLoadException);

    SampleDataOptions garbled;
    garbled.start_date = "yesterday";
    REQUIRE_THROWS_AS(SampleDataGenerator(garbled).generate(), core::DataLoadException);
}
