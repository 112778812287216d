/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <algorithm>
#include <catch2/catch.hpp>
#include <filesystem>
#include <gvcf_overlay/gvcf_reader.hh>
#include <gvcf_overlay/gvcf_writer.hh>
#include <gvcf_overlay/overlay_engine.hh>
#include <gvcf_overlay/overlay_logger.hh>
#include <iterator>
#include <libbio/mmap_handle.hh>
#include <sstream>
#include <string>
#include <vector>

namespace fs	= std::filesystem;
namespace gv	= gvcf_overlay;
namespace lb	= libbio;


namespace {
	
	char const *base_path("test-files/mutate-assemblies/base.g.vcf");
	char const *compressed_base_path("test-files/mutate-assemblies/base.g.vcf.gz");
	char const *donor_path("test-files/mutate-assemblies/donor.g.vcf");
	char const *no_samples_path("test-files/mutate-assemblies/no-samples.g.vcf");
	char const *two_samples_path("test-files/mutate-assemblies/two-samples.g.vcf");
	
	
	inline std::string_view make_substring(std::string_view const &sv, std::string_view::const_iterator const &it)
	{
		auto const dist(std::distance(sv.begin(), it));
		return sv.substr(dist);
	}
	
	
	void compare_against_expected(std::string_view const &actual_sv, std::string_view const &expected_sv)
	{
		auto const res(std::mismatch(expected_sv.begin(), expected_sv.end(), actual_sv.begin(), actual_sv.end()));
		if (expected_sv.end() == res.first && actual_sv.end() == res.second)
			SUCCEED();
		else
		{
			INFO("First mismatch:");
			INFO("(expected): '" << make_substring(expected_sv, res.first)	<< '\'');
			INFO("(actual):   '" << make_substring(actual_sv, res.second)	<< '\'');
			FAIL();
		}
	}
	
	
	std::vector <gv::variant_record> read_records(gv::variant_source &source)
	{
		std::vector <gv::variant_record> retval;
		gv::variant_record rec;
		while (source.next_variant(rec))
			retval.emplace_back(rec);
		return retval;
	}
	
	
	std::vector <gv::variant_record> read_records(char const *path)
	{
		gv::gvcf_reader reader;
		reader.open_variants_file(path);
		reader.prepare();
		return read_records(reader);
	}
	
	
	std::vector <gv::variant_record> collect_records(gv::interval_map const &map)
	{
		std::vector <gv::variant_record> retval;
		for (auto const &entry : map.entries())
			retval.emplace_back(entry.record);
		return retval;
	}
	
	
	std::vector <gv::variant_record> expected_base_records()
	{
		return {
			gv::make_reference_block("chr1", 100, 149, "A"),
			gv::variant_record("chr1", 150, 150, "C", "G"),
			gv::make_reference_block("chr1", 151, 200, "T"),
			gv::variant_record("chr1", 201, 205, "GGGGG", "G"),
			gv::make_reference_block("chr1", 206, 300, "A"),
			gv::variant_record("chr1", 301, 301, "G", "C"),
			gv::make_reference_block("chr1", 302, 400, "T"),
			gv::make_reference_block("chr1", 401, 600, "G")
		};
	}
	
	
	// Removed when the scope is exited.
	struct temporary_directory
	{
		fs::path path;
		
		explicit temporary_directory(char const *name):
			path(fs::temp_directory_path() / name)
		{
			fs::remove_all(path);
		}
		
		~temporary_directory()
		{
			std::error_code ec;
			fs::remove_all(path, ec);
		}
	};
}


SCENARIO("GVCF reader can read reference blocks and variants")
{
	GIVEN("An uncompressed GVCF file")
	{
		INFO("Path: " << base_path);
		gv::gvcf_reader reader;
		reader.open_variants_file(base_path);
		reader.prepare();
		
		THEN("the sample name is read from the header")
		{
			CHECK(std::vector <std::string>({"founder"}) == reader.sample_names());
		}
		
		WHEN("the records are read")
		{
			auto const records(read_records(reader));
			
			THEN("the co-ordinates and alleles match the file")
			{
				CHECK(expected_base_records() == records);
			}
			
			THEN("the records are classified")
			{
				REQUIRE(8 == records.size());
				CHECK(records[0].is_reference_block());
				CHECK(gv::record_kind::SNV == records[1].kind());
				CHECK(records[3].is_indel());
			}
			
			THEN("the line numbers are recorded")
			{
				REQUIRE(8 == records.size());
				CHECK(11 == records[0].lineno());
				CHECK(18 == records[7].lineno());
			}
			
			THEN("the assembly co-ordinates are read")
			{
				REQUIRE(8 == records.size());
				auto const &assembly(records[0].assembly());
				REQUIRE(assembly.chr);
				CHECK("ctg1" == *assembly.chr);
				REQUIRE(assembly.start);
				CHECK(1000 == *assembly.start);
				REQUIRE(assembly.end);
				CHECK(1049 == *assembly.end);
				REQUIRE(assembly.strand);
				CHECK("+" == *assembly.strand);
				
				CHECK(records[2].assembly().empty());
			}
		}
	}
	
	GIVEN("A compressed GVCF file")
	{
		INFO("Path: " << compressed_base_path);
		
		THEN("the records match those of the uncompressed file")
		{
			CHECK(expected_base_records() == read_records(compressed_base_path));
		}
	}
}


SCENARIO("Base files must have exactly one sample")
{
	GIVEN("A GVCF file without samples")
	{
		gv::gvcf_reader base_reader;
		base_reader.open_variants_file(no_samples_path);
		base_reader.prepare();
		gv::overlay_engine engine;
		
		THEN("building the map fails")
		{
			CHECK(base_reader.sample_names().empty());
			CHECK_THROWS_AS(engine.build(base_reader), gv::configuration_error);
		}
	}
	
	GIVEN("A GVCF file with two samples")
	{
		gv::gvcf_reader base_reader;
		base_reader.open_variants_file(two_samples_path);
		base_reader.prepare();
		gv::overlay_engine engine;
		
		THEN("building the map fails")
		{
			CHECK(std::vector <std::string>({"first", "second"}) == base_reader.sample_names());
			CHECK_THROWS_AS(engine.build(base_reader), gv::configuration_error);
		}
	}
}


SCENARIO("GVCF writer outputs the records in position order")
{
	GIVEN("A map with records on two contigs")
	{
		gv::interval_map map;
		gv::assembly_annotation assembly;
		assembly.chr = "ctg1";
		assembly.start = 1000;
		assembly.end = 1009;
		assembly.strand = "-";
		
		std::vector <gv::variant_record> const records({
			gv::variant_record("chr10", 5, 5, "A", "AT", true),
			gv::make_reference_block("chr2", 1, 10, "C").with_assembly(assembly),
			gv::variant_record("chr2", 11, 13, "CGT", "C"),
			gv::variant_record("chr2", 14, 14, "G", "", true)
		});
		
		for (auto const &rec : records)
			map.put(rec.range(), rec);
		
		WHEN("the map is written")
		{
			std::stringstream os;
			gv::gvcf_writer writer(os, "sample1");
			writer.output_map(map);
			
			THEN("the output matches the expected")
			{
				std::string const expected(
					"##fileformat=VCFv4.2\n"
					"##FORMAT=<ID=AD,Number=3,Type=Integer,Description=\"Allelic depths for the ref and alt alleles in the order listed\">\n"
					"##FORMAT=<ID=DP,Number=1,Type=Integer,Description=\"Read Depth (only filtered reads used for calling)\">\n"
					"##FORMAT=<ID=GQ,Number=1,Type=Integer,Description=\"Genotype Quality\">\n"
					"##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
					"##FORMAT=<ID=PL,Number=G,Type=Integer,Description=\"Normalized, Phred-scaled likelihoods for genotypes as defined in the VCF specification\">\n"
					"##INFO=<ID=AF,Number=3,Type=Integer,Description=\"Allele Frequency\">\n"
					"##INFO=<ID=ASM_Chr,Number=1,Type=String,Description=\"Assembly chromosome\">\n"
					"##INFO=<ID=ASM_End,Number=1,Type=Integer,Description=\"Assembly end position\">\n"
					"##INFO=<ID=ASM_Start,Number=1,Type=Integer,Description=\"Assembly start position\">\n"
					"##INFO=<ID=ASM_Strand,Number=1,Type=String,Description=\"Assembly strand\">\n"
					"##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Total Depth\">\n"
					"##INFO=<ID=END,Number=1,Type=Integer,Description=\"Stop position of the interval\">\n"
					"##INFO=<ID=NS,Number=1,Type=Integer,Description=\"Number of Samples With Data\">\n"
					"#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tsample1\n"
					"chr2\t1\t.\tC\t<NON_REF>\t.\t.\tEND=10;ASM_Chr=ctg1;ASM_Start=1000;ASM_End=1009;ASM_Strand=-\tGT\t0/0\n"
					"chr2\t11\t.\tCGT\tC\t.\t.\tEND=13\tGT\t1/1\n"
					"chr2\t14\t.\tG\t.\t.\t.\tEND=14\tGT\t1/1\n"
					"chr10\t5\t.\tA\tAT\t.\t.\tEND=5\tGT\t1/1\n"
				);
				compare_against_expected(os.str(), expected);
			}
		}
	}
}


SCENARIO("Donor variants can be overlaid onto a base GVCF file")
{
	GIVEN("A base file and a donor file")
	{
		INFO("Base path:  " << base_path);
		INFO("Donor path: " << donor_path);
		
		gv::gvcf_reader base_reader;
		base_reader.open_variants_file(base_path);
		base_reader.prepare();
		
		gv::gvcf_reader donor_reader;
		donor_reader.open_variants_file(donor_path);
		donor_reader.prepare();
		
		std::stringstream log_os;
		gv::overlay_logger logger(log_os);
		
		WHEN("the donor variants are overlaid")
		{
			auto const res(gv::overlay(base_reader, donor_reader, &logger));
			
			THEN("the resulting map contains the expected records")
			{
				std::vector <gv::variant_record> const expected({
					gv::make_reference_block("chr1", 100, 124, "A"),
					gv::variant_record("chr1", 125, 125, "T", "A"),
					gv::make_reference_block("chr1", 126, 149, "A"),
					gv::variant_record("chr1", 150, 150, "C", "A"),
					gv::make_reference_block("chr1", 151, 174, "T"),
					gv::variant_record("chr1", 175, 175, "C", "TTTT"),
					gv::make_reference_block("chr1", 176, 200, "T"),
					gv::variant_record("chr1", 201, 205, "GGGGG", "G"),
					gv::make_reference_block("chr1", 206, 300, "A"),
					gv::variant_record("chr1", 301, 301, "G", "C"),
					gv::make_reference_block("chr1", 302, 400, "T"),
					gv::make_reference_block("chr1", 401, 499, "G"),
					gv::variant_record("chr1", 500, 500, "A", "T"),
					gv::make_reference_block("chr1", 501, 600, "G"),
					gv::variant_record("chr2", 10, 10, "A", "G")
				});
				
				CHECK("founder" == res.sample_name);
				CHECK(expected == collect_records(res.map));
			}
			
			THEN("the outcomes are counted")
			{
				auto const &stats(res.statistics);
				CHECK(8 == stats.base_records);
				CHECK(10 == stats.donor_records);
				CHECK(1 == stats.inserted_variants);
				CHECK(1 == stats.identical_variants);
				CHECK(1 == stats.replaced_variants);
				CHECK(3 == stats.split_reference_blocks);
				CHECK(2 == stats.reference_blocks_skipped);
				CHECK(0 == stats.missing_alt_skipped);
				CHECK(1 == stats.indel_overlaps_skipped);
				CHECK(1 == stats.unhandled_overlaps);
			}
			
			THEN("the skipped records are logged")
			{
				std::string const expected(
					"LINENO\tCHROM\tPOS\tREASON\tEXTRA\n"
					"15\tchr1\t201\tINDEL_OVERLAP_SKIPPED\tchr1:201-205\n"
					"16\tchr1\t203\tUNHANDLED_OVERLAP\tchr1:201-205\n"
				);
				compare_against_expected(log_os.str(), expected);
			}
			
			AND_WHEN("the result is written and read again")
			{
				temporary_directory const output_dir("gvcf-overlay-test-output");
				auto const output_path(gv::write_mutated_gvcf(output_dir.path / "nested", res.sample_name, res.map, false));
				
				THEN("the same records are read")
				{
					CHECK((output_dir.path / "nested" / "founder_mutated.g.vcf").string() == output_path.string());
					
					gv::gvcf_reader reader;
					reader.open_variants_file(output_path.c_str());
					reader.prepare();
					CHECK(std::vector <std::string>({"founder"}) == reader.sample_names());
					CHECK(collect_records(res.map) == read_records(reader));
				}
			}
		}
	}
}


SCENARIO("Assembly co-ordinates are preserved when writing")
{
	GIVEN("A base file overlaid with an empty donor")
	{
		gv::gvcf_reader base_reader;
		base_reader.open_variants_file(base_path);
		base_reader.prepare();
		
		gv::vector_variant_source donor({"donor"}, {});
		auto const res(gv::overlay(base_reader, donor));
		
		WHEN("the map is written and read again")
		{
			temporary_directory const output_dir("gvcf-overlay-test-assembly");
			auto const output_path(gv::write_mutated_gvcf(output_dir.path, res.sample_name, res.map, true));
			auto const records(read_records(output_path.c_str()));
			
			THEN("the records have their assembly co-ordinates")
			{
				REQUIRE(8 == records.size());
				CHECK(expected_base_records() == records);
				
				auto const &assembly(records[1].assembly());
				REQUIRE(assembly.chr);
				CHECK("ctg1" == *assembly.chr);
				REQUIRE(assembly.start);
				CHECK(1050 == *assembly.start);
				REQUIRE(assembly.end);
				CHECK(1050 == *assembly.end);
				REQUIRE(assembly.strand);
				CHECK("+" == *assembly.strand);
			}
		}
	}
}
