#include <boost/test/unit_test.hpp>

#include <random>
#include <unordered_set>
#include <stdexcept>
#include <string>
#include <vector>

#include "gene_interval_index.hpp"
#include "io/gtf_reader.hpp"
#include "test_util.hpp"

static
gene_interval_t
make_gene(const std::string& gene_id, const std::string& chr, int start, int end)
{
    return gene_interval_t {gene_id, chr, start, end};
}

BOOST_AUTO_TEST_SUITE( test_gene_interval_index )

BOOST_AUTO_TEST_CASE( test_interval_tree_closed_intervals )
{
    IntervalTree tree;
    tree.insert(10, 20, 0);
    tree.insert(15, 15, 1);
    tree.insert(21, 30, 2);
    tree.build();

    BOOST_REQUIRE(tree.query(9).empty());
    BOOST_REQUIRE_EQUAL(tree.query(10).size(), 1u);
    BOOST_REQUIRE_EQUAL(tree.query(20).size(), 1u);
    BOOST_REQUIRE_EQUAL(tree.query(21).size(), 1u);
    BOOST_REQUIRE_EQUAL(tree.query(21)[0], 2u);

    std::vector<size_t> hits = tree.query(15);
    BOOST_REQUIRE_EQUAL(hits.size(), 2u);
    BOOST_REQUIRE_EQUAL(hits[0], 0u);
    BOOST_REQUIRE_EQUAL(hits[1], 1u);
}

BOOST_AUTO_TEST_CASE( test_interval_tree_matches_linear_scan )
{
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> start_dist(1, 10000);
    std::uniform_int_distribution<int> length_dist(0, 500);

    std::vector<std::pair<int, int> > intervals;
    IntervalTree tree;
    for (size_t i = 0; i < 2000; ++i) {
        int start = start_dist(rng);
        int end = start + length_dist(rng);
        intervals.push_back(std::make_pair(start, end));
        tree.insert(start, end, i);
    }
    tree.build();

    for (int pos = 0; pos <= 10600; pos += 7) {
        std::vector<size_t> expected;
        for (size_t i = 0; i < intervals.size(); ++i) {
            if (intervals[i].first <= pos && pos <= intervals[i].second) {
                expected.push_back(i);
            }
        }
        std::vector<size_t> hits = tree.query(pos);
        BOOST_REQUIRE_EQUAL_COLLECTIONS(hits.begin(), hits.end(), expected.begin(), expected.end());
    }
}

BOOST_AUTO_TEST_CASE( test_interval_tree_invalid )
{
    IntervalTree tree;
    BOOST_CHECK_THROW(tree.insert(20, 10, 0), std::invalid_argument);
    tree.insert(1, 2, 0);
    BOOST_CHECK_THROW(tree.query(1), std::runtime_error);
}

BOOST_AUTO_TEST_CASE( test_search_position_order )
{
    GeneIntervalIndex index;
    index.add(make_gene("GENE_B", "1", 150, 400));
    index.add(make_gene("GENE_A", "1", 100, 300));
    index.add(make_gene("GENE_C", "2", 100, 300));
    index.build();

    std::vector<gene_interval_t> genes = index.search_position("1", 200);
    BOOST_REQUIRE_EQUAL(genes.size(), 2u);
    BOOST_REQUIRE_EQUAL(genes[0].gene_id, "GENE_A");
    BOOST_REQUIRE_EQUAL(genes[1].gene_id, "GENE_B");

    BOOST_REQUIRE_EQUAL(index.get_genes_field("1", 200), "GENE_A,GENE_B");
    BOOST_REQUIRE_EQUAL(index.get_genes_field("1", 350), "GENE_B");
    BOOST_REQUIRE_EQUAL(index.get_genes_field("1", 50), "");
    BOOST_REQUIRE_EQUAL(index.get_genes_field("X", 200), "");
}

BOOST_AUTO_TEST_CASE( test_gene_ids_deduplicated )
{
    GeneIntervalIndex index;
    index.add(make_gene("ENSG01", "1", 100, 1000));
    index.add(make_gene("ENSG01", "1", 200, 300));
    index.add(make_gene("ENSG02", "1", 150, 250));
    index.add(make_gene("ENSG01", "1", 250, 260));
    index.build();

    std::vector<std::string> ids = index.get_gene_ids("1", 255);
    BOOST_REQUIRE_EQUAL(ids.size(), 2u);
    BOOST_REQUIRE_EQUAL(ids[0], "ENSG01");
    BOOST_REQUIRE_EQUAL(ids[1], "ENSG02");
    BOOST_REQUIRE_EQUAL(index.get_genes_field("1", 255), "ENSG01,ENSG02");
    BOOST_REQUIRE_EQUAL(index.size(), 4u);
}

BOOST_AUTO_TEST_CASE( test_query_before_build )
{
    GeneIntervalIndex index;
    index.add(make_gene("ENSG01", "1", 100, 1000));
    BOOST_CHECK_THROW(index.search_position("1", 150), std::runtime_error);
}

BOOST_AUTO_TEST_CASE( test_gtf_reader )
{
    TempDir tmp;
    std::string gtf = write_text_file(
        tmp.file("genes.gtf"),
        "##description: test annotation\n"
        "1\tHAVANA\tgene\t100\t500\t.\t+\t.\tgene_id \"ENSG01\"; gene_name \"A\";\n"
        "1\tHAVANA\texon\t120\t180\t.\t+\t.\tgene_id \"ENSG01\"; exon_number 1;\n"
        "1\tHAVANA\tgene\t400\t900\t.\t-\t.\tgene_id \"ENSG02\";\n"
        "1\tHAVANA\tgene\t600\t700\t.\t-\t.\tgene_name \"no_id\";\n"
    );

    GeneIntervalIndex all = GtfReader(gtf).read_index();
    BOOST_REQUIRE_EQUAL(all.size(), 3u);
    BOOST_REQUIRE_EQUAL(all.get_genes_field("1", 150), "ENSG01");
    BOOST_REQUIRE_EQUAL(all.get_genes_field("1", 450), "ENSG01,ENSG02");
    BOOST_REQUIRE_EQUAL(all.get_genes_field("1", 650), "ENSG02");

    GtfReader exons_only(gtf);
    exons_only.set_feature_types(std::unordered_set<std::string> {"exon"});
    GeneIntervalIndex exons = exons_only.read_index();
    BOOST_REQUIRE_EQUAL(exons.size(), 1u);
    BOOST_REQUIRE_EQUAL(exons.get_genes_field("1", 450), "");
}

BOOST_AUTO_TEST_CASE( test_gtf_attribute )
{
    std::string attributes = "gene_id \"ENSG01\"; transcript_id \"ENST01\"; level 2;";
    BOOST_REQUIRE_EQUAL(GtfReader::get_attribute(attributes, "gene_id"), "ENSG01");
    BOOST_REQUIRE_EQUAL(GtfReader::get_attribute(attributes, "level"), "2");
    BOOST_REQUIRE_EQUAL(GtfReader::get_attribute(attributes, "gene_name"), "");
}

BOOST_AUTO_TEST_CASE( test_gtf_wrong_column_count )
{
    TempDir tmp;
    std::string gtf = write_text_file(tmp.file("bad.gtf"), "1\tHAVANA\tgene\t100\t500\n");
    BOOST_CHECK_THROW(GtfReader(gtf).read_index(), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
