/*
 * Copyright (c) 2026 Tuukka Norri
 * This code is licensed under MIT license (see LICENSE for details).
 */

#include <gvcf_overlay/gvcf_writer.hh>
#include <libbio/assert.hh>
#include <libbio/file_handling.hh>

namespace fs	= std::filesystem;
namespace lb	= libbio;


namespace gvcf_overlay {
	
	void gvcf_writer::output_vcf_header() const
	{
		auto &os(*m_os);
		os << "##fileformat=VCFv4.2\n";
		os << "##FORMAT=<ID=AD,Number=3,Type=Integer,Description=\"Allelic depths for the ref and alt alleles in the order listed\">\n";
		os << "##FORMAT=<ID=DP,Number=1,Type=Integer,Description=\"Read Depth (only filtered reads used for calling)\">\n";
		os << "##FORMAT=<ID=GQ,Number=1,Type=Integer,Description=\"Genotype Quality\">\n";
		os << "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n";
		os << "##FORMAT=<ID=PL,Number=G,Type=Integer,Description=\"Normalized, Phred-scaled likelihoods for genotypes as defined in the VCF specification\">\n";
		os << "##INFO=<ID=AF,Number=3,Type=Integer,Description=\"Allele Frequency\">\n";
		os << "##INFO=<ID=ASM_Chr,Number=1,Type=String,Description=\"Assembly chromosome\">\n";
		os << "##INFO=<ID=ASM_End,Number=1,Type=Integer,Description=\"Assembly end position\">\n";
		os << "##INFO=<ID=ASM_Start,Number=1,Type=Integer,Description=\"Assembly start position\">\n";
		os << "##INFO=<ID=ASM_Strand,Number=1,Type=String,Description=\"Assembly strand\">\n";
		os << "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Total Depth\">\n";
		os << "##INFO=<ID=END,Number=1,Type=Integer,Description=\"Stop position of the interval\">\n";
		os << "##INFO=<ID=NS,Number=1,Type=Integer,Description=\"Number of Samples With Data\">\n";
		os << "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\t" << m_sample_name << '\n';
	}
	
	
	void gvcf_writer::output_record(variant_record const &rec) const
	{
		auto &os(*m_os);
		
		// CHROM, POS, ID, REF
		libbio_assert_lt(0, rec.ref().size());
		os << rec.contig() << '\t' << rec.start() << "\t.\t" << rec.ref() << '\t';
		
		// ALT
		if (rec.alt().empty())
			os << '.';
		else
			os << rec.alt();
		
		// QUAL, FILTER
		os << "\t.\t.\t";
		
		// INFO
		os << "END=" << rec.end();
		{
			auto const &assembly(rec.assembly());
			if (assembly.chr)
				os << ";ASM_Chr=" << *assembly.chr;
			if (assembly.start)
				os << ";ASM_Start=" << *assembly.start;
			if (assembly.end)
				os << ";ASM_End=" << *assembly.end;
			if (assembly.strand)
				os << ";ASM_Strand=" << *assembly.strand;
		}
		
		// FORMAT, sample. Records with the <NON_REF> ALT are homozygous for REF, everything else for ALT.
		os << "\tGT\t" << (NON_REF_ALT == rec.alt() ? "0/0" : "1/1") << '\n';
	}
	
	
	void gvcf_writer::output_map(interval_map const &map) const
	{
		output_vcf_header();
		for (auto const &entry : map.entries())
			output_record(entry.record);
	}
	
	
	std::string mutated_gvcf_file_name(std::string const &sample_name)
	{
		return sample_name + "_mutated.g.vcf";
	}
	
	
	fs::path write_mutated_gvcf(
		fs::path const &output_dir,
		std::string const &sample_name,
		interval_map const &map,
		bool const should_overwrite_files
	)
	{
		fs::create_directories(output_dir);
		auto const output_path(output_dir / mutated_gvcf_file_name(sample_name));
		
		// The stream is closed when it goes out of scope, also if writing fails.
		lb::file_ostream os;
		auto const mode(lb::make_writing_open_mode({
			lb::writing_open_mode::CREATE,
			(should_overwrite_files ? lb::writing_open_mode::OVERWRITE : lb::writing_open_mode::NONE)
		}));
		lb::open_file_for_writing(output_path.c_str(), os, mode);
		os.exceptions(std::ostream::badbit | std::ostream::failbit);
		
		gvcf_writer writer(os, sample_name);
		writer.output_map(map);
		os.flush();
		
		return output_path;
	}
}
