#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>

#include "sample_map.hpp"
#include "test_util.hpp"

BOOST_AUTO_TEST_SUITE( test_sample_map )

BOOST_AUTO_TEST_CASE( test_load )
{
    TempDir tmp;
    std::string path = write_text_file(tmp.file("map.txt"), "REF1\tSTUDY1\nREF2\tSTUDY2\n");

    SampleMap sample_map;
    BOOST_REQUIRE(!sample_map.loaded());
    sample_map.load(path);

    BOOST_REQUIRE(sample_map.loaded());
    BOOST_REQUIRE_EQUAL(sample_map.size(), 2u);
    BOOST_REQUIRE(sample_map.contains("STUDY1"));
    BOOST_REQUIRE(!sample_map.contains("REF1"));
    BOOST_REQUIRE_EQUAL(sample_map.get_ref_sample("STUDY2"), "REF2");
    BOOST_CHECK_THROW(sample_map.get_ref_sample("STUDY3"), std::out_of_range);
}

BOOST_AUTO_TEST_CASE( test_wrong_column_count )
{
    TempDir tmp;
    std::string three = write_text_file(tmp.file("three.txt"), "REF1\tSTUDY1\nREF2\tSTUDY2\textra\n");
    std::string one = write_text_file(tmp.file("one.txt"), "REF1 STUDY1\n");

    SampleMap sample_map;
    BOOST_CHECK_THROW(sample_map.load(three), std::runtime_error);
    BOOST_REQUIRE(!sample_map.loaded());
    BOOST_CHECK_THROW(sample_map.load(one), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
