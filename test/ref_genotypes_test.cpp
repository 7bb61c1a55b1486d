#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "ase_results.hpp"
#include "io/ref_genotypes.hpp"
#include "read_counts_loader.hpp"
#include "sample_map.hpp"
#include "test_util.hpp"

static
std::string
write_reference_vcf(const TempDir& tmp)
{
    return write_text_file(
        tmp.file("ref.vcf"),
        "##fileformat=VCFv4.2\n"
        "##contig=<ID=1,length=100000>\n"
        "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
        "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tR1\tR2\tR3\n"
        "1\t100\trs1\tA\tG\t.\t.\t.\tGT\t0/1\t0/0\t1|0\n"
        "1\t200\trs2\tC\tT,G\t.\t.\t.\tGT\t0/1\t0/1\t0/1\n"
        "1\t300\t.\tG\tA\t.\t.\t.\tGT\t./.\t1/1\t0/1\n"
    );
}

BOOST_AUTO_TEST_SUITE( test_ref_genotypes )

BOOST_AUTO_TEST_CASE( test_load )
{
    TempDir tmp;
    RefGenotypes ref;
    ref.load(write_reference_vcf(tmp));

    BOOST_REQUIRE(ref.loaded());
    BOOST_REQUIRE_EQUAL(ref.n_samples(), 3u);
    // the multiallelic record is dropped
    BOOST_REQUIRE_EQUAL(ref.n_variants(), 2u);
    BOOST_REQUIRE(ref.has_sample("R2"));
    BOOST_REQUIRE(!ref.has_sample("R4"));
}

BOOST_AUTO_TEST_CASE( test_is_heterozygous )
{
    TempDir tmp;
    RefGenotypes ref;
    ref.load(write_reference_vcf(tmp));

    VariantKey rs1 {"1", 100, "A", "G"};
    BOOST_REQUIRE(ref.is_heterozygous(rs1, "R1"));
    BOOST_REQUIRE(!ref.is_heterozygous(rs1, "R2"));
    BOOST_REQUIRE(ref.is_heterozygous(rs1, "R3"));
    BOOST_REQUIRE(ref.is_heterozygous(VariantKey {"1", 100, "G", "A"}, "R1"));
    BOOST_REQUIRE(!ref.is_heterozygous(VariantKey {"1", 100, "A", "T"}, "R1"));
    BOOST_REQUIRE(!ref.is_heterozygous(rs1, "R4"));

    VariantKey missing_gt {"1", 300, "G", "A"};
    BOOST_REQUIRE(!ref.is_heterozygous(missing_gt, "R1"));
    BOOST_REQUIRE(!ref.is_heterozygous(missing_gt, "R2"));
    BOOST_REQUIRE(ref.is_heterozygous(missing_gt, "R3"));

    BOOST_REQUIRE(!ref.is_heterozygous(VariantKey {"1", 200, "C", "T"}, "R1"));
}

BOOST_AUTO_TEST_CASE( test_missing_file )
{
    RefGenotypes ref;
    BOOST_CHECK_THROW(ref.load("/nonexistent/ref.vcf"), std::runtime_error);
    BOOST_REQUIRE(!ref.loaded());
}

BOOST_AUTO_TEST_CASE( test_loader_keeps_heterozygous_samples )
{
    TempDir tmp;
    RefGenotypes ref;
    ref.load(write_reference_vcf(tmp));
    SampleMap sample_map;
    sample_map.load(write_text_file(tmp.file("map.txt"), "R1\tstudy1\nR2\tstudy2\nR3\tstudy3\n"));

    std::vector<std::string> files = {write_text_file(
        tmp.file("counts.txt"),
        "1\t100\trs1\tA\tG\tstudy1\t12\t3\n"
        "1\t100\trs1\tA\tG\tstudy2\t12\t3\n"
        "1\t100\trs1\tA\tG\tstudy3\t12\t3\n"
        "1\t300\t.\tG\tA\tstudy1\t12\t3\n"
        "1\t300\t.\tG\tA\tstudy3\t12\t3\n"
    )};

    AseResults results;
    ReadCountsLoader loader(files, results, 1, 0, 0);
    loader.set_ref_genotypes(&ref);
    loader.set_sample_map(&sample_map);
    loader.load();

    BOOST_REQUIRE_EQUAL(results.size(), 2u);
    for (const std::shared_ptr<AseVariant>& variant : results.variants()) {
        if (variant->get_pos() == 100) {
            BOOST_REQUIRE_EQUAL(variant->get_sample_count(), 2);
        } else {
            BOOST_REQUIRE_EQUAL(variant->get_sample_count(), 1);
            BOOST_REQUIRE_EQUAL(variant->get_observations()[0].sample_id, "R3");
        }
    }
    BOOST_REQUIRE_EQUAL(loader.get_n_filtered(), 2);
}

BOOST_AUTO_TEST_SUITE_END()
