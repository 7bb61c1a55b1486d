#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "ase_exception.hpp"
#include "ase_variant.hpp"
#include "meta/ase_meta_analyzer.hpp"
#include "significance_ranker.hpp"

static
sample_observation_t
make_observation(const std::string& sample_id, int ref_count, int alt_count)
{
    return sample_observation_t {sample_id, ref_count, alt_count, BASE_QUALITY_NA, BASE_QUALITY_NA};
}

BOOST_AUTO_TEST_SUITE( test_ase_variant )

BOOST_AUTO_TEST_CASE( test_first_identifier_wins )
{
    AseVariant variant(VariantKey {"1", 100, "A", "G"});
    BOOST_REQUIRE_EQUAL(variant.get_id(), "");

    variant.add_observation(make_observation("S1", 3, 4), ".");
    BOOST_REQUIRE_EQUAL(variant.get_id(), "");
    variant.add_observation(make_observation("S2", 3, 4), "rs1");
    variant.add_observation(make_observation("S3", 3, 4), "rs2");
    BOOST_REQUIRE_EQUAL(variant.get_id(), "rs1");
    BOOST_REQUIRE_EQUAL(variant.get_sample_count(), 3);
}

BOOST_AUTO_TEST_CASE( test_statistics_lifecycle )
{
    AseMetaAnalyzer meta;
    AseVariant variant(VariantKey {"1", 100, "A", "G"});
    variant.add_observation(make_observation("S1", 8, 2));

    BOOST_REQUIRE(!variant.statistics_calculated());
    BOOST_CHECK_THROW(variant.get_meta_zscore(), AseException);
    BOOST_CHECK_THROW(variant.get_meta_pvalue(), AseException);
    BOOST_CHECK_THROW(variant.get_count_pearson_r(), AseException);

    variant.calculate_statistics(meta);
    BOOST_REQUIRE(variant.statistics_calculated());
    BOOST_REQUIRE(variant.get_meta_zscore() > 0);

    BOOST_CHECK_THROW(variant.calculate_statistics(meta), AseException);
    BOOST_CHECK_THROW(variant.add_observation(make_observation("S2", 1, 1)), AseException);
}

BOOST_AUTO_TEST_CASE( test_statistics_independent_of_append_order )
{
    AseMetaAnalyzer meta;
    std::vector<sample_observation_t> observations = {
        make_observation("S3", 12, 3),
        make_observation("S1", 2, 9),
        make_observation("S2", 7, 7),
        make_observation("S1", 5, 1),
        make_observation("S4", 30, 11)
    };

    AseVariant forward(VariantKey {"2", 500, "C", "T"});
    AseVariant backward(VariantKey {"2", 500, "C", "T"});
    for (size_t i = 0; i < observations.size(); ++i) {
        forward.add_observation(observations[i]);
        backward.add_observation(observations[observations.size() - 1 - i]);
    }
    forward.calculate_statistics(meta);
    backward.calculate_statistics(meta);

    BOOST_REQUIRE_EQUAL(forward.get_meta_zscore(), backward.get_meta_zscore());
    BOOST_REQUIRE_EQUAL(forward.get_meta_pvalue(), backward.get_meta_pvalue());
    BOOST_REQUIRE_EQUAL(forward.get_count_pearson_r(), backward.get_count_pearson_r());

    const std::vector<sample_observation_t>& sorted = forward.get_observations();
    BOOST_REQUIRE_EQUAL(sorted.size(), 5u);
    BOOST_REQUIRE_EQUAL(sorted[0].sample_id, "S1");
    BOOST_REQUIRE_EQUAL(sorted[0].ref_count, 2);
    BOOST_REQUIRE_EQUAL(sorted[1].sample_id, "S1");
    BOOST_REQUIRE_EQUAL(sorted[1].ref_count, 5);
    BOOST_REQUIRE_EQUAL(sorted[4].sample_id, "S4");
    for (size_t i = 0; i < sorted.size(); ++i) {
        BOOST_REQUIRE_EQUAL(sorted[i].sample_id, backward.get_observations()[i].sample_id);
    }
}

BOOST_AUTO_TEST_CASE( test_more_significant )
{
    AseMetaAnalyzer meta;
    AseVariant strong(VariantKey {"1", 300, "A", "G"});
    AseVariant weak(VariantKey {"1", 200, "A", "G"});
    AseVariant weak_tie(VariantKey {"1", 100, "A", "G"});
    strong.add_observation(make_observation("S1", 1, 30));
    weak.add_observation(make_observation("S1", 6, 4));
    weak_tie.add_observation(make_observation("S1", 6, 4));
    strong.calculate_statistics(meta);
    weak.calculate_statistics(meta);
    weak_tie.calculate_statistics(meta);

    // ranking uses |Z|
    BOOST_REQUIRE(more_significant(strong, weak));
    BOOST_REQUIRE(!more_significant(weak, strong));

    // equal |Z| falls back to variant order
    BOOST_REQUIRE(more_significant(weak_tie, weak));
    BOOST_REQUIRE(!more_significant(weak, weak_tie));
}

BOOST_AUTO_TEST_CASE( test_weighted_zero_depth_ranks_last )
{
    AseMetaAnalyzer meta(true);
    std::vector<std::shared_ptr<AseVariant> > variants = {
        std::make_shared<AseVariant>(VariantKey {"1", 100, "A", "G"}),
        std::make_shared<AseVariant>(VariantKey {"1", 200, "A", "G"}),
        std::make_shared<AseVariant>(VariantKey {"1", 300, "A", "G"})
    };
    variants[0]->add_observation(make_observation("S1", 0, 0));
    variants[1]->add_observation(make_observation("S1", 60, 0));
    variants[2]->add_observation(make_observation("S1", 12, 8));
    for (const std::shared_ptr<AseVariant>& variant : variants) {
        variant->calculate_statistics(meta);
    }

    BOOST_REQUIRE_EQUAL(variants[0]->get_meta_zscore(), 0);
    BOOST_REQUIRE_EQUAL(variants[0]->get_meta_pvalue(), 1);

    std::stable_sort(variants.begin(), variants.end(),
        [](const std::shared_ptr<AseVariant>& a, const std::shared_ptr<AseVariant>& b) {
            return more_significant(*a, *b);
        }
    );
    BOOST_REQUIRE_EQUAL(variants[0]->get_pos(), 200);
    BOOST_REQUIRE_EQUAL(variants[1]->get_pos(), 300);
    BOOST_REQUIRE_EQUAL(variants[2]->get_pos(), 100);

    SignificanceRanker ranker(BONFERRONI, variants.size());
    size_t retained = 0;
    for (const std::shared_ptr<AseVariant>& variant : variants) {
        if (!ranker.accept(variant->get_meta_zscore(), variant->get_meta_pvalue())) {
            break;
        }
        ++retained;
    }
    BOOST_REQUIRE_EQUAL(retained, 1u);
}

BOOST_AUTO_TEST_SUITE_END()
